#ifndef SYSTEMS_HPP
#define SYSTEMS_HPP

#include <entt/entt.hpp>
#include <string>

// --- System Declarations ---
// Systems are free functions that operate on entities.
// They expect the context objects set up by InitializeWorld().

// --- Journey Control ---

/**
 * @brief Starts an idle train along a rail towards a station.
 * The end of the rail nearer the train's current world position is
 * the origin; travel heads for the far end.
 * Returns false without touching any state if the train is moving,
 * the rail is unknown or closed, or the train lacks its movement state.
 */
bool StartJourney(entt::registry& registry, entt::entity train, const std::string& rail_id,
                  const std::string& target_station_id);

/**
 * @brief Flips the travel direction of an idle train.
 */
bool ReverseTrain(entt::registry& registry, entt::entity train);


// --- Movement Systems ---

/**
 * @brief Advances every moving train by one tick.
 * Lead progress moves by (speed * real_dt * multiplier) / rail length,
 * then the lead pose and every car's pose are rewritten. Trains that
 * reach the end of their rail go idle and a JourneyCompleted event is
 * enqueued.
 */
void TrainMovementSystem(entt::registry& registry, double real_dt);


// --- Other Systems ---

/**
 * @brief Logs the current position to the entity's Trajectory component.
 */
void UpdateTrajectorySystem(entt::registry& registry);


#endif // SYSTEMS_HPP
