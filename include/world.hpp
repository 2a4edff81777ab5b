#ifndef WORLD_HPP
#define WORLD_HPP

#include "components.hpp"

#include <entt/entt.hpp>
#include <string>
#include <vector>

// --- World Setup ---

/**
 * @brief Emplaces the shared context objects: SimState, TimeSource,
 * RailNetwork, TrainMetrics and the journey event dispatcher.
 * Safe to call more than once; existing objects are kept.
 */
void InitializeWorld(entt::registry& registry, const SimState& state = SimState{});


// --- Train Roster ---

struct TrainSpec {
    std::string name;
    std::string owner;
    double speed = 1.0;
    double lead_length = 0.0;
    double car_spacing = DEFAULT_CAR_SPACING;
};

entt::entity CreateTrain(entt::registry& registry, const TrainSpec& spec);

/**
 * @brief Appends a car to the back of a train.
 * @return entt::null if the train is invalid or moving.
 */
entt::entity AddCar(entt::registry& registry, entt::entity train, const std::string& name,
                    double length = DEFAULT_CAR_LENGTH);

/**
 * @brief Detaches a car and destroys it. Only while the train is idle.
 */
bool RemoveCar(entt::registry& registry, entt::entity train, entt::entity car);

/**
 * @brief Puts an idle train and all of its cars at a station.
 */
bool PlaceTrainAtStation(entt::registry& registry, entt::entity train, const std::string& station_id);

// Destroys a train together with its cars.
void RemoveTrain(entt::registry& registry, entt::entity train);

// Name for log lines; falls back to the entity id.
std::string EntityLabel(const entt::registry& registry, entt::entity entity);

entt::entity FindEntityByName(const entt::registry& registry, const std::string& name);
std::vector<entt::entity> GetPlayerTrains(const entt::registry& registry, const std::string& player_id);


// --- File I/O ---

/**
 * @brief Loads stations, rails, trains, cars and initial journeys from
 * a text world file.
 */
bool loadWorldFromFile(entt::registry& registry, const std::string& filename);


#endif // WORLD_HPP
