#pragma once

#include <stdexcept>

#include "saltuid/core/UIDLayout.h"

namespace saltuid::core
{

/**
 * @brief Raised when salt validation is enabled and a salt lies outside [0, maxSalts - 1].
 */
class InvalidSaltError : public std::invalid_argument
{
  public:
	InvalidSaltError(Salt salt, Salt maxSalts);

	Salt getSalt() const { return m_salt; }
	Salt getMaxSalts() const { return m_maxSalts; }

  private:
	Salt m_salt;
	Salt m_maxSalts;
};

} // namespace saltuid::core
