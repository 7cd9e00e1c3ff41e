#pragma once

#include <cstdint>
#include <functional>
#include <limits>

#include "saltuid/core/UIDLayout.h"

namespace saltuid::core
{

/// @brief Identifier value no default-layout generator can produce from a salt in [0, maxSalts - 1].
/// Out-of-range salts are accepted unless UIDOptions::validateSalts is set, and such a
/// generator can mint this value (e.g. salt UINT64_MAX yields it on its first next()).
/// A handle built from it reports valid() == false.
inline constexpr UID kInvalidUID = std::numeric_limits<UID>::max();

/**
 * @brief Typed reference to an entity by its identifier.
 */
template <typename T>
class Handle
{
  public:
	using id_type = UID;

	constexpr Handle() = default;
	explicit constexpr Handle(id_type id) : m_id(id) {}

	constexpr id_type id() const { return m_id; }
	constexpr bool valid() const { return m_id != kInvalidUID; }

	/// @brief Salt of the partition that produced this handle's identifier.
	constexpr Salt salt(const UIDLayout &layout = UIDLayout{}) const { return layout.saltOf(m_id); }

	constexpr bool isSaltedBy(Salt salt, const UIDLayout &layout = UIDLayout{}) const
	{
		return valid() && core::isSaltedBy(m_id, salt, layout);
	}

	constexpr bool operator==(const Handle<T> &other) const { return m_id == other.m_id; }
	constexpr bool operator!=(const Handle<T> &other) const { return m_id != other.m_id; }
	constexpr bool operator<(const Handle<T> &other) const { return m_id < other.m_id; }

  private:
	id_type m_id = kInvalidUID;
};

} // namespace saltuid::core

// Hash support for unordered_map
namespace std
{
template <typename T>
struct hash<saltuid::core::Handle<T>>
{
	std::size_t operator()(const saltuid::core::Handle<T> &handle) const noexcept
	{
		return std::hash<typename saltuid::core::Handle<T>::id_type>()(handle.id());
	}
};
} // namespace std
