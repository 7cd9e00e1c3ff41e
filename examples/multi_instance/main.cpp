/**
 * @file main.cpp
 * @brief Example of several simulation instances minting entity ids without coordination
 *
 * This example shows how to:
 * 1. Draw one generator per instance from the salt registry
 * 2. Spawn entities that take their id from the instance's generator
 * 3. Route an incoming id back to the instance whose salt it carries
 */

#include "saltuid/saltuid.h"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

using namespace saltuid;
using namespace saltuid::core;

struct Entity : public Identifiable<Entity>
{
	Entity(UIDGenerator &generator, std::string kind) :
		Identifiable<Entity>(generator),
		kind(std::move(kind))
	{
	}

	std::string kind;
};

struct SimulationInstance
{
	explicit SimulationInstance(std::string name) :
		name(std::move(name)),
		generator(SaltRegistry::global().nextGenerator())
	{
	}

	Entity &spawn(const std::string &kind)
	{
		entities.emplace_back(generator, kind);
		return entities.back();
	}

	std::string name;
	UIDGenerator generator;
	std::vector<Entity> entities;
};

int main()
{
	spdlog::set_pattern("%l: %v");
	spdlog::info("saltuid - multi instance example");

	spdlog::info("Default generator salt: {}", defaultGenerator().getSalt());

	// 1. Each instance owns one partition of the identifier space
	std::vector<SimulationInstance> instances;
	instances.reserve(2);
	instances.emplace_back("server");
	instances.emplace_back("client");

	// 2. Spawn entities concurrently in both instances
	for (int i = 0; i < 3; ++i)
	{
		for (auto &instance : instances)
		{
			auto &entity = instance.spawn(i % 2 == 0 ? "player" : "projectile");
			spdlog::info("{} spawned {} with id {}", instance.name, entity.kind, entity.getId());
		}
	}

	// 3. Route ids received over the wire back to their producer
	for (const auto &instance : instances)
	{
		for (const auto &entity : instance.entities)
		{
			const auto handle = entity.getHandle();
			const auto owner = std::find_if(instances.begin(), instances.end(), [&handle](const SimulationInstance &candidate) {
				return handle.isSaltedBy(candidate.generator.getSalt());
			});
			if (owner == instances.end())
			{
				spdlog::error("No instance owns id {}", handle.id());
				return 1;
			}
			spdlog::info("id {} belongs to {}", handle.id(), owner->name);
		}
	}

	// Anonymous entities fall back to the default generator (salt 0)
	struct Marker : public Identifiable<Marker>
	{
	};
	Marker marker;
	spdlog::info("marker id {} salted by 0: {}", marker.getId(), isSaltedBy(marker.getId(), 0));

	return 0;
}
