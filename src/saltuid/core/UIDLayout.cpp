#include "saltuid/core/UIDLayout.h"

#include <stdexcept>
#include <string>

namespace saltuid::core
{

UIDLayout UIDLayout::fromCeiling(Salt maxSalts, UID ceiling)
{
	// Salt 0 belongs to the default generator, the registry cycles over [1, maxSalts - 1].
	if (maxSalts < 2)
		throw std::invalid_argument("UIDLayout: maxSalts must be at least 2, got " + std::to_string(maxSalts));

	const std::uint64_t perSalt = ceiling / maxSalts;
	if (perSalt < 2)
		throw std::invalid_argument(
			"UIDLayout: ceiling " + std::to_string(ceiling) + " leaves no capacity for " + std::to_string(maxSalts) + " salts"
		);

	UIDLayout layout;
	layout.maxSalts = maxSalts;
	layout.maxEntityPerGenerator = perSalt - 1;
	return layout;
}

} // namespace saltuid::core
