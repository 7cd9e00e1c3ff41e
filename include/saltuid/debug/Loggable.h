#pragma once

#include <memory>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace saltuid::debug
{

/**
 * @brief Base class for components that may report events through spdlog.
 *
 * A Loggable without an attached logger is silent: every log call is a no-op.
 * Components attach a logger only when the caller asked for it.
 */
class Loggable
{
	template <typename... Args>
	using format_string_t = fmt::format_string<Args...>;

  public:
	explicit Loggable(std::shared_ptr<spdlog::logger> logger = nullptr) : m_logger(std::move(logger)) {}

	virtual ~Loggable() = default;

	Loggable(const Loggable &) = default;
	Loggable &operator=(const Loggable &) = default;
	Loggable(Loggable &&) noexcept = default;
	Loggable &operator=(Loggable &&) noexcept = default;

	/**
	 * @brief Returns the spdlog logger registered under name, creating a colored stdout logger if none exists.
	 */
	static std::shared_ptr<spdlog::logger> namedLogger(const std::string &name);

	bool hasLogger() const { return m_logger != nullptr; }

  protected:
	template <typename... Args>
	void logTrace(format_string_t<Args...> fmt, Args &&...args) const
	{
		if (m_logger)
			m_logger->trace(fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	void logDebug(format_string_t<Args...> fmt, Args &&...args) const
	{
		if (m_logger)
			m_logger->debug(fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	void logInfo(format_string_t<Args...> fmt, Args &&...args) const
	{
		if (m_logger)
			m_logger->info(fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	void logWarn(format_string_t<Args...> fmt, Args &&...args) const
	{
		if (m_logger)
			m_logger->warn(fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	void logError(format_string_t<Args...> fmt, Args &&...args) const
	{
		if (m_logger)
			m_logger->error(fmt, std::forward<Args>(args)...);
	}

	template <typename... Args>
	void logCritical(format_string_t<Args...> fmt, Args &&...args) const
	{
		if (m_logger)
			m_logger->critical(fmt, std::forward<Args>(args)...);
	}

  private:
	std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace saltuid::debug
