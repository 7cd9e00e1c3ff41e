#include "saltuid/debug/Loggable.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace saltuid::debug
{

std::shared_ptr<spdlog::logger> Loggable::namedLogger(const std::string &name)
{
	if (auto existing = spdlog::get(name))
		return existing;

	try
	{
		return spdlog::stdout_color_mt(name);
	}
	catch (const spdlog::spdlog_ex &)
	{
		// Another thread registered the same name in between.
		auto registered = spdlog::get(name);
		if (!registered)
			throw;
		return registered;
	}
}

} // namespace saltuid::debug
