#include "systems.hpp"
#include "components.hpp"
#include "events.hpp"
#include "formation.hpp"
#include "pose.hpp"
#include "rail.hpp"
#include "rail_position.hpp"
#include "time_source.hpp"
#include "world.hpp"

#include <iostream>

namespace {

bool Verbose(const entt::registry& registry) {
    const auto* state = registry.ctx().find<SimState>();
    return state && state->verbose;
}

void RejectJourney(entt::registry& registry) {
    registry.ctx().get<TrainMetrics>().journeys_rejected++;
}

/**
 * Moving -> Idle. Clears the rail state of the train and its cars;
 * world positions stay where the last tick left them.
 */
void CompleteJourney(entt::registry& registry, entt::entity train, RailMovement& movement, RailPosition& rail_pos) {
    const std::string station_id = movement.target_station_id;
    const std::string rail_id = rail_pos.rail_id;

    movement.moving = false;
    movement.target_station_id.clear();
    ClearRailPosition(rail_pos);

    if (const auto* formation = registry.try_get<Formation>(train)) {
        for (auto car : formation->cars) {
            if (!registry.valid(car)) continue;
            if (auto* car_pos = registry.try_get<RailPosition>(car)) {
                ClearRailPosition(*car_pos);
            }
        }
    }

    registry.ctx().get<TrainMetrics>().journeys_completed++;
    registry.ctx().get<entt::dispatcher>().enqueue(JourneyCompleted{train, station_id, rail_id});

    if (Verbose(registry)) {
        std::cout << "Train " << EntityLabel(registry, train) << " arrived at " << station_id
                  << " via rail " << rail_id << std::endl;
    }
}

} // namespace


// --- Journey Control ---

bool StartJourney(entt::registry& registry, entt::entity train, const std::string& rail_id,
                  const std::string& target_station_id) {
    if (!registry.valid(train) || !registry.all_of<Train>(train)) {
        std::cerr << "Error: Journey requested for an unknown train." << std::endl;
        RejectJourney(registry);
        return false;
    }

    if (!registry.all_of<Position, Orientation, RailPosition, RailMovement>(train)) {
        std::cerr << "Error: Train " << EntityLabel(registry, train)
                  << " is missing its position or movement state." << std::endl;
        RejectJourney(registry);
        return false;
    }

    const auto& network = registry.ctx().get<RailNetwork>();
    const Rail* rail = network.FindRail(rail_id);
    if (!rail) {
        std::cerr << "Error: Rail '" << rail_id << "' not found for train "
                  << EntityLabel(registry, train) << "." << std::endl;
        RejectJourney(registry);
        return false;
    }

    if (!rail->IsOperational()) {
        std::cerr << "Error: Rail '" << rail_id << "' is not operational." << std::endl;
        RejectJourney(registry);
        return false;
    }

    auto [pos, rot, rail_pos, movement] = registry.get<Position, Orientation, RailPosition, RailMovement>(train);

    if (movement.moving) {
        std::cerr << "Warning: Journey request denied - train " << EntityLabel(registry, train)
                  << " already moving towards " << movement.target_station_id << std::endl;
        RejectJourney(registry);
        return false;
    }

    if (!rail->Connects(target_station_id)) {
        std::cerr << "Warning: Station '" << target_station_id << "' is not an end of rail '"
                  << rail_id << "'." << std::endl;
    }

    // The nearer end of the rail is where we are leaving from
    const double dist_a = Distance(pos.p, rail->PositionAt(0.0));
    const double dist_b = Distance(pos.p, rail->PositionAt(1.0));
    const TravelDirection direction = dist_a < dist_b ? TravelDirection::Forward : TravelDirection::Reverse;
    const double start_progress = direction == TravelDirection::Forward ? 0.0 : 1.0;

    SetRailPosition(rail_pos, rail_id, start_progress, direction);
    movement.moving = true;
    movement.target_station_id = target_station_id;

    ComputeRailPose(*rail, rail_pos, pos, rot);
    UpdateFormation(registry, train, *rail, rail_pos);

    registry.ctx().get<TrainMetrics>().journeys_started++;
    registry.ctx().get<entt::dispatcher>().enqueue(JourneyStarted{train, rail_id, target_station_id});

    if (Verbose(registry)) {
        std::cout << "Train " << EntityLabel(registry, train) << " departing on " << rail_id
                  << " towards " << target_station_id << " (" << ToString(direction) << ")" << std::endl;
    }
    return true;
}

bool ReverseTrain(entt::registry& registry, entt::entity train) {
    if (!registry.valid(train) || !registry.all_of<RailPosition, RailMovement>(train)) {
        std::cerr << "Error: Cannot reverse an entity without rail state." << std::endl;
        return false;
    }

    if (registry.get<RailMovement>(train).moving) {
        std::cerr << "Error: Train " << EntityLabel(registry, train) << " must be idle to reverse." << std::endl;
        return false;
    }

    ReverseDirection(registry.get<RailPosition>(train));
    if (const auto* formation = registry.try_get<Formation>(train)) {
        for (auto car : formation->cars) {
            if (!registry.valid(car)) continue;
            if (auto* car_pos = registry.try_get<RailPosition>(car)) {
                ReverseDirection(*car_pos);
            }
        }
    }
    return true;
}


// --- Movement Systems ---

void TrainMovementSystem(entt::registry& registry, double real_dt) {
    const auto& network = registry.ctx().get<RailNetwork>();
    const double multiplier = registry.ctx().get<TimeSource>().CurrentSpeedMultiplier();
    const double scaled_dt = real_dt * multiplier;

    auto view = registry.view<Train, RailMovement, RailPosition, Position, Orientation>();
    for (auto entity : view) {
        auto& movement = view.get<RailMovement>(entity);
        if (!movement.moving) continue;

        auto& rail_pos = view.get<RailPosition>(entity);
        const Rail* rail = network.FindRail(rail_pos.rail_id);
        if (!rail) {
            std::cerr << "Error: Train " << EntityLabel(registry, entity) << " is moving on unknown rail '"
                      << rail_pos.rail_id << "'." << std::endl;
            continue;
        }

        // Lead first, so cars never read last tick's front
        const double progress_delta = rail->DistanceToProgress(movement.speed * scaled_dt);
        UpdateProgress(rail_pos, progress_delta);

        ComputeRailPose(*rail, rail_pos, view.get<Position>(entity), view.get<Orientation>(entity));
        UpdateFormation(registry, entity, *rail, rail_pos);

        if (HasReachedEnd(rail_pos)) {
            CompleteJourney(registry, entity, movement, rail_pos);
        }
    }
}


// --- Other Systems ---

void UpdateTrajectorySystem(entt::registry& registry) {
    auto view = registry.view<Position, Trajectory>();
    for (auto entity : view) {
        const auto& pos = view.get<Position>(entity);
        auto& traj = view.get<Trajectory>(entity);
        traj.path.push_back(pos.p);
    }
}
