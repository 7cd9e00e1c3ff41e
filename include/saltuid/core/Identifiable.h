#pragma once

#include "saltuid/core/Handle.h"
#include "saltuid/core/UIDGenerator.h"
#include "saltuid/core/UIDLayout.h"

namespace saltuid::core
{

/**
 * Identifiable is a base class giving an entity its unique identifier.
 *
 * The identifier comes from, in order of preference, an explicit value
 * (e.g. one received from a remote instance), a generator owned by the
 * caller, or defaultGenerator().
 *
 * NOTE: identifiers are predictable counters. They are not secrets and
 * must not be used as capability tokens.
 */
template <typename T>
class Identifiable
{
  public:
	using HandleType = Handle<T>;

	Identifiable();
	explicit Identifiable(UIDGenerator &generator);
	explicit Identifiable(UID id);

	// Disable copy
	Identifiable(const Identifiable &) = delete;
	Identifiable &operator=(const Identifiable &) = delete;

	// Allow move, mark noexcept
	Identifiable(Identifiable &&) noexcept = default;
	Identifiable &operator=(Identifiable &&) noexcept = default;

	HandleType getHandle() const;

	UID getId() const { return m_id; }

  private:
	UID m_id;
};

} // namespace saltuid::core

#include "saltuid/core/Identifiable.inl"
