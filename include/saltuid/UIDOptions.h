#pragma once

#include <cstdint>

#include "saltuid/core/UIDLayout.h"

namespace saltuid
{

/**
 * @struct UIDOptions
 * @brief Configuration options for salt registries and generators.
 *
 * The defaults reproduce the plain behavior: no salt validation and silent
 * wraparound of both the generator counter and the registry cursor.
 */
struct UIDOptions
{
	// Layout
	core::Salt maxSalts = core::kMaxSalts;
	core::UID safeValueCeiling = core::kMaxSafeValue;

	// Validation
	bool validateSalts = false;

	// Logging
	bool logWraparound = false;
	bool logSaltReuse = false;

	/// @brief Builds the identifier layout selected by maxSalts and safeValueCeiling.
	core::UIDLayout layout() const { return core::UIDLayout::fromCeiling(maxSalts, safeValueCeiling); }

	bool wantsLogger() const { return logWraparound || logSaltReuse; }
};

} // namespace saltuid
