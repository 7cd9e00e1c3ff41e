#include "saltuid/core/UIDGenerator.h"

#include "saltuid/core/InvalidSaltError.h"

namespace saltuid::core
{

UIDGenerator::UIDGenerator(Salt salt, const UIDOptions &options) :
	debug::Loggable(options.logWraparound ? debug::Loggable::namedLogger("saltuid") : nullptr),
	m_layout(options.layout()),
	m_salt(salt)
{
	if (options.validateSalts && !m_layout.isValidSalt(salt))
		throw InvalidSaltError(salt, m_layout.maxSalts);
}

UID UIDGenerator::next()
{
	const UID uid = m_layout.compose(m_salt, m_counter);

	if (++m_counter >= m_layout.maxEntityPerGenerator)
	{
		m_counter = 0;
		logWarn("Generator with salt {} wrapped after {} identifiers", m_salt, m_layout.maxEntityPerGenerator);
	}

	return uid;
}

} // namespace saltuid::core
