/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef POPULATION_CATALOG_HPP
#define POPULATION_CATALOG_HPP

#include "ai/AgentArchetype.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace HordeEngine
{

/**
 * @brief The archetypes agents are drawn from
 *
 * Starts with the single built-in "standard" archetype. Registering a list
 * replaces the whole set; lists are never merged.
 */
class PopulationCatalog
{
public:
    PopulationCatalog();
    explicit PopulationCatalog(uint32_t seed);

    /**
     * @brief Replace the active archetypes
     * @throws ConfigError on an empty list, duplicate ids, weight <= 0,
     *         health <= 0, speed <= 0, damage < 0 or detectionRange < 0.
     *         The previous set is kept on failure.
     */
    void registerArchetypes(const std::vector<AgentArchetype>& archetypes);

    // Back to the single "standard" archetype
    void resetToDefaults();

    /**
     * @brief Weighted-random archetype in registration order
     *
     * Falls back to the first-registered archetype on floating-point drift.
     */
    const AgentArchetype& drawRandom();

    const AgentArchetype* findArchetype(const std::string& id) const;

    /**
     * @brief Archetype for an optional id
     *
     * Unknown or absent ids resolve to "standard" when registered, otherwise
     * to the first-registered archetype.
     */
    const AgentArchetype& resolveArchetype(const std::optional<std::string>& id) const;

    const std::vector<AgentArchetype>& getArchetypes() const { return m_archetypes; }
    size_t size() const { return m_archetypes.size(); }
    float getTotalWeight() const { return m_totalWeight; }

    static AgentArchetype defaultArchetype() { return AgentArchetype{}; }

private:
    static void validate(const std::vector<AgentArchetype>& archetypes);
    void rebuildIndex();

    std::vector<AgentArchetype> m_archetypes;
    boost::container::flat_map<std::string, size_t> m_index;
    float m_totalWeight{0.0f};

    std::mt19937 m_rng;
};

} // namespace HordeEngine

#endif // POPULATION_CATALOG_HPP
