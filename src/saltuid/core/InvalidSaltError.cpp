#include "saltuid/core/InvalidSaltError.h"

#include <spdlog/fmt/fmt.h>

namespace saltuid::core
{

InvalidSaltError::InvalidSaltError(Salt salt, Salt maxSalts) :
	std::invalid_argument(fmt::format("Invalid salt {}, expected a value in [0, {}]", salt, maxSalts - 1)),
	m_salt(salt),
	m_maxSalts(maxSalts)
{
}

} // namespace saltuid::core
