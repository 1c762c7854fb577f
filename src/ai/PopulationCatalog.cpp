/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "ai/PopulationCatalog.hpp"
#include "core/Logger.hpp"
#include "core/PopulationErrors.hpp"
#include <boost/container/flat_set.hpp>
#include <format>

namespace HordeEngine
{

PopulationCatalog::PopulationCatalog() : m_rng(std::random_device{}())
{
    resetToDefaults();
}

PopulationCatalog::PopulationCatalog(uint32_t seed) : m_rng(seed)
{
    resetToDefaults();
}

void PopulationCatalog::validate(const std::vector<AgentArchetype>& archetypes)
{
    if (archetypes.empty()) {
        throw ConfigError("Archetype list is empty");
    }

    boost::container::flat_set<std::string> seen;
    for (const auto& archetype : archetypes) {
        if (!seen.insert(archetype.id).second) {
            throw ConfigError(std::format("Duplicate archetype id '{}'", archetype.id));
        }

        if (archetype.weight <= 0.0f) {
            throw ConfigError(std::format("Archetype '{}' has non-positive weight {}",
                                          archetype.id, archetype.weight));
        }
        if (archetype.health <= 0.0f) {
            throw ConfigError(std::format("Archetype '{}' has non-positive health {}",
                                          archetype.id, archetype.health));
        }
        if (archetype.speed <= 0.0f) {
            throw ConfigError(std::format("Archetype '{}' has non-positive speed {}",
                                          archetype.id, archetype.speed));
        }
        if (archetype.damage < 0.0f) {
            throw ConfigError(std::format("Archetype '{}' has negative damage {}",
                                          archetype.id, archetype.damage));
        }
        if (archetype.detectionRange < 0.0f) {
            throw ConfigError(std::format("Archetype '{}' has negative detection range {}",
                                          archetype.id, archetype.detectionRange));
        }
    }
}

void PopulationCatalog::registerArchetypes(const std::vector<AgentArchetype>& archetypes)
{
    try {
        validate(archetypes);
    } catch (const ConfigError& e) {
        CATALOG_ERROR(std::format("Rejected archetype list: {}", e.what()));
        throw;
    }

    m_archetypes = archetypes;
    rebuildIndex();
    CATALOG_INFO(std::format("Registered {} archetypes (total weight {:.2f})",
                             m_archetypes.size(), m_totalWeight));
}

void PopulationCatalog::resetToDefaults()
{
    m_archetypes.assign(1, defaultArchetype());
    rebuildIndex();
}

void PopulationCatalog::rebuildIndex()
{
    m_index.clear();
    m_totalWeight = 0.0f;
    for (size_t i = 0; i < m_archetypes.size(); ++i) {
        m_index[m_archetypes[i].id] = i;
        m_totalWeight += m_archetypes[i].weight;
    }
}

const AgentArchetype& PopulationCatalog::drawRandom()
{
    std::uniform_real_distribution<float> dist(0.0f, m_totalWeight);
    const float roll = dist(m_rng);

    float cumulative = 0.0f;
    for (const auto& archetype : m_archetypes) {
        cumulative += archetype.weight;
        if (cumulative >= roll) {
            return archetype;
        }
    }
    return m_archetypes.front();
}

const AgentArchetype* PopulationCatalog::findArchetype(const std::string& id) const
{
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_archetypes[it->second];
}

const AgentArchetype& PopulationCatalog::resolveArchetype(const std::optional<std::string>& id) const
{
    if (id) {
        if (const AgentArchetype* found = findArchetype(*id)) {
            return *found;
        }
        CATALOG_WARN(std::format("Unknown archetype '{}'; using default", *id));
    }
    if (const AgentArchetype* standard = findArchetype(defaultArchetype().id)) {
        return *standard;
    }
    return m_archetypes.front();
}

} // namespace HordeEngine
