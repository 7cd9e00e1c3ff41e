#pragma once

#include <cstdint>

#include "saltuid/UIDOptions.h"
#include "saltuid/core/UIDLayout.h"
#include "saltuid/debug/Loggable.h"

namespace saltuid::core
{

/**
 * UIDGenerator mints a sequence of identifiers inside the partition of its salt.
 *
 * Successive identifiers grow by `maxSalts` until the counter reaches
 * `maxEntityPerGenerator`, at which point it silently restarts at 0 and
 * earlier identifiers become producible again.
 *
 * NOTE: a generator is single-writer. Concurrent calls to next() on the same
 * instance need external synchronization. Generators with different salts
 * never need to coordinate.
 */
class UIDGenerator : public debug::Loggable
{
  public:
	/**
	 * @param salt The partition this generator mints in.
	 * @param options Layout and opt-in validation/logging.
	 * @throws InvalidSaltError if options.validateSalts is set and salt is out of range.
	 * @throws std::invalid_argument if options describe an unusable layout.
	 */
	explicit UIDGenerator(Salt salt = 0, const UIDOptions &options = {});

	/**
	 * @brief Returns the next identifier and advances the counter.
	 */
	UID next();

	/**
	 * @brief Returns the identifier the next call to next() will produce.
	 */
	[[nodiscard]] UID peek() const { return m_layout.compose(m_salt, m_counter); }

	/**
	 * @brief Tells whether uid lies in this generator's partition.
	 */
	[[nodiscard]] bool owns(UID uid) const { return isSaltedBy(uid, m_salt, m_layout); }

	Salt getSalt() const { return m_salt; }
	std::uint64_t getCounter() const { return m_counter; }
	const UIDLayout &getLayout() const { return m_layout; }

  private:
	UIDLayout m_layout;
	Salt m_salt;
	std::uint64_t m_counter = 0;
};

} // namespace saltuid::core
