#include "saltuid/core/SaltRegistry.h"

namespace saltuid::core
{

namespace
{

struct GlobalState
{
	SaltRegistry registry;
	UIDGenerator defaultGenerator{registry.nextSalt()};
};

GlobalState &globalState()
{
	static GlobalState state;
	return state;
}

// Build the registry and the default generator during static initialization.
[[maybe_unused]] const GlobalState &s_eagerGlobalState = globalState();

} // namespace

SaltRegistry::SaltRegistry(const UIDOptions &options) :
	debug::Loggable(options.logSaltReuse ? debug::Loggable::namedLogger("saltuid") : nullptr),
	m_options(options),
	m_layout(options.layout())
{
}

Salt SaltRegistry::nextSalt()
{
	Salt salt = m_cursor.load(std::memory_order_relaxed);
	Salt advanced;
	do
	{
		advanced = salt + 1 > m_layout.maxSalts - 1 ? 1 : salt + 1;
	} while (!m_cursor.compare_exchange_weak(salt, advanced, std::memory_order_relaxed));

	if (advanced == 1 && salt != 0)
		logWarn("All {} salts handed out, reusing salts from 1", m_layout.maxSalts);

	return salt;
}

UIDGenerator SaltRegistry::nextGenerator()
{
	return UIDGenerator(nextSalt(), m_options);
}

SaltRegistry &SaltRegistry::global()
{
	return globalState().registry;
}

UIDGenerator &defaultGenerator()
{
	return globalState().defaultGenerator;
}

} // namespace saltuid::core
