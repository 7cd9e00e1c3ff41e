#pragma once

#include <cstdint>
#include <limits>

namespace saltuid::core
{

using Salt = std::uint64_t;
using UID = std::uint64_t;

/// @brief Maximum number of partitions (salts) that can be in use concurrently.
inline constexpr Salt kMaxSalts = 10000;

/// @brief Largest value an identifier may take. Identifiers are 64-bit unsigned integers.
inline constexpr UID kMaxSafeValue = std::numeric_limits<UID>::max();

/// @brief Largest integer an IEEE double represents exactly (2^53 - 1).
/// Use as a ceiling when identifiers travel to peers that store them as doubles.
inline constexpr UID kMaxSafeDoubleInteger = (UID{1} << 53) - 1;

/// @brief Number of identifiers a single generator mints before its counter wraps.
inline constexpr std::uint64_t kMaxEntityPerGenerator = kMaxSafeValue / kMaxSalts - 1;

/**
 * @brief Arithmetic of one salted identifier space.
 *
 * An identifier is composed as `salt + counter * maxSalts`, hence
 * `uid % maxSalts == salt` for every identifier a generator produces.
 * Two different salts can never produce the same identifier.
 */
struct UIDLayout
{
	Salt maxSalts = kMaxSalts;
	std::uint64_t maxEntityPerGenerator = kMaxEntityPerGenerator;

	/**
	 * @brief Derives a layout from a salt count and a numeric ceiling.
	 * @param maxSalts Number of partitions, at least 2.
	 * @param ceiling Largest identifier value that must stay representable.
	 * @throws std::invalid_argument if maxSalts < 2 or the derived capacity is below 1.
	 */
	static UIDLayout fromCeiling(Salt maxSalts, UID ceiling);

	constexpr UID compose(Salt salt, std::uint64_t counter) const { return salt + counter * maxSalts; }

	constexpr Salt saltOf(UID uid) const { return uid % maxSalts; }

	constexpr std::uint64_t sequenceOf(UID uid) const { return uid / maxSalts; }

	constexpr bool isValidSalt(Salt salt) const { return salt < maxSalts; }
};

/**
 * @brief Tells whether an identifier belongs to the partition of the given salt.
 */
constexpr bool isSaltedBy(UID uid, Salt salt, const UIDLayout &layout = UIDLayout{})
{
	return layout.saltOf(uid) == salt;
}

} // namespace saltuid::core
