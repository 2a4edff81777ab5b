#ifndef PERSISTENCE_HPP
#define PERSISTENCE_HPP

#include <entt/entt.hpp>
#include <string>

// --- File I/O Systems ---

/**
 * @brief Writes the rail and journey state of every named entity.
 * Rail geometry is not saved; it comes back from the world file.
 */
bool saveState(const entt::registry& registry, const std::string& filename);

/**
 * @brief Restores state written by saveState() onto entities with the
 * same names. World poses are recomputed from the rails. Entities in
 * the file that do not exist are skipped with a warning.
 */
bool loadState(entt::registry& registry, const std::string& filename);

/**
 * @brief Writes the recorded trajectories to an output file.
 */
void writeOutput(entt::registry& registry, const std::string& filename);


#endif // PERSISTENCE_HPP
