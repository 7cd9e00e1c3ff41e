#pragma once

#include <atomic>

#include "saltuid/UIDOptions.h"
#include "saltuid/core/UIDGenerator.h"
#include "saltuid/core/UIDLayout.h"
#include "saltuid/debug/Loggable.h"

namespace saltuid::core
{

/**
 * @class SaltRegistry
 * @brief Hands out distinct salts to the generators of one process.
 *
 * The cursor starts at 0 and advances by one per request. Once it would pass
 * `maxSalts - 1` it restarts at 1, never at 0: salt 0 is reserved for the
 * default generator. After `maxSalts` requests salts are therefore reused and
 * two live generators may share a salt. This capacity limit is accepted and
 * not reported unless UIDOptions::logSaltReuse is set.
 *
 * nextSalt() is safe to call from several threads; the cursor is advanced
 * with a single compare-exchange.
 *
 * The process-wide registry is reached through global(). Tests and embedders
 * needing isolation construct their own instances.
 */
class SaltRegistry : public debug::Loggable
{
  public:
	explicit SaltRegistry(const UIDOptions &options = {});

	// Not copyable, not movable
	SaltRegistry(const SaltRegistry &) = delete;
	SaltRegistry &operator=(const SaltRegistry &) = delete;
	SaltRegistry(SaltRegistry &&) = delete;
	SaltRegistry &operator=(SaltRegistry &&) = delete;

	/**
	 * @brief Returns the current cursor value and advances the cursor.
	 */
	Salt nextSalt();

	/**
	 * @brief Creates a generator bound to a freshly drawn salt.
	 */
	UIDGenerator nextGenerator();

	/**
	 * @brief Returns the salt the next call to nextSalt() will hand out.
	 */
	[[nodiscard]] Salt currentSalt() const { return m_cursor.load(std::memory_order_relaxed); }

	const UIDOptions &getOptions() const { return m_options; }
	const UIDLayout &getLayout() const { return m_layout; }

	/**
	 * @brief The process-wide registry.
	 *
	 * Created together with defaultGenerator(), which always receives its first salt (0).
	 */
	static SaltRegistry &global();

  private:
	UIDOptions m_options;
	UIDLayout m_layout;
	std::atomic<Salt> m_cursor{0};
};

/**
 * @brief The generator used when an entity is created without an id or a generator.
 *
 * Created on first use of either defaultGenerator() or SaltRegistry::global()
 * and alive until process exit. Its salt is always 0. It is shared by every
 * caller that does not own a generator, so the single-writer rule of
 * UIDGenerator applies to it as well.
 */
UIDGenerator &defaultGenerator();

} // namespace saltuid::core
