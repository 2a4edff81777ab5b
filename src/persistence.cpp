#include "persistence.hpp"
#include "components.hpp"
#include "pose.hpp"
#include "rail.hpp"
#include "rail_position.hpp"
#include "world.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>

namespace {

const std::string EMPTY_FIELD = "-";

std::string Field(const std::string& value) {
    return value.empty() ? EMPTY_FIELD : value;
}

std::string Unfield(const std::string& value) {
    return value == EMPTY_FIELD ? std::string() : value;
}

// Applies a parsed rail position, dropping it if the rail is gone.
void RestoreRailPosition(entt::registry& registry, entt::entity entity, const RailPosition& saved) {
    auto& rail_pos = registry.get_or_emplace<RailPosition>(entity);
    const auto& network = registry.ctx().get<RailNetwork>();

    SetFormationOffset(rail_pos, saved.longitudinal_offset, saved.side_offset);
    rail_pos.direction = saved.direction;

    const Rail* rail = saved.on_rail ? network.FindRail(saved.rail_id) : nullptr;
    if (!rail) {
        if (saved.on_rail) {
            std::cerr << "Warning: " << EntityLabel(registry, entity) << " was on unknown rail '"
                      << saved.rail_id << "', restored off rail." << std::endl;
        }
        ClearRailPosition(rail_pos);
        return;
    }

    SetRailPosition(rail_pos, saved.rail_id, saved.progress, saved.direction);
    ComputeRailPose(*rail, rail_pos, registry.get_or_emplace<Position>(entity),
                    registry.get_or_emplace<Orientation>(entity));
}

} // namespace

bool saveState(const entt::registry& registry, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open state file: " << filename << std::endl;
        return false;
    }

    file << std::setprecision(17);
    file << "# rail state\n";

    int count = 0;
    auto view = registry.view<const Name>();
    for (auto entity : view) {
        const auto* rail_pos = registry.try_get<RailPosition>(entity);
        const auto* movement = registry.try_get<RailMovement>(entity);
        if (!rail_pos && !movement) continue;

        file << "Entity " << view.get<const Name>(entity).name << "\n";
        if (rail_pos) {
            file << "RailPosition " << (rail_pos->on_rail ? 1 : 0) << " " << Field(rail_pos->rail_id) << " "
                 << rail_pos->progress << " " << ToString(rail_pos->direction) << " "
                 << rail_pos->side_offset << " " << rail_pos->longitudinal_offset << "\n";
        }
        if (movement) {
            file << "RailMovement " << (movement->moving ? 1 : 0) << " " << Field(movement->target_station_id)
                 << " " << movement->speed << "\n";
        }
        file << "EndEntity\n";
        count++;
    }

    std::cout << "Saved state of " << count << " entities to " << filename << std::endl;
    return true;
}

bool loadState(entt::registry& registry, const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open state file: " << filename << std::endl;
        return false;
    }

    entt::entity current = entt::null;
    bool in_block = false;
    int restored = 0;

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::stringstream ss(line);
        std::string tag;
        ss >> tag;

        if (tag == "Entity") {
            std::string name;
            ss >> name;
            current = FindEntityByName(registry, name);
            in_block = true;
            if (current == entt::null) {
                std::cerr << "Warning: Saved entity '" << name << "' not in world, skipped." << std::endl;
            }
        } else if (tag == "EndEntity") {
            if (current != entt::null) restored++;
            current = entt::null;
            in_block = false;
        } else if (tag == "RailPosition" && in_block) {
            int on_rail = 0;
            std::string rail_id, direction;
            RailPosition saved;
            if (!(ss >> on_rail >> rail_id >> saved.progress >> direction >> saved.side_offset
                     >> saved.longitudinal_offset) ||
                !ParseDirection(direction, saved.direction)) {
                std::cerr << "Error: Malformed state line: " << line << std::endl;
                return false;
            }
            saved.on_rail = on_rail != 0;
            saved.rail_id = Unfield(rail_id);
            if (current != entt::null) RestoreRailPosition(registry, current, saved);
        } else if (tag == "RailMovement" && in_block) {
            int moving = 0;
            std::string target;
            double speed = 0.0;
            if (!(ss >> moving >> target >> speed)) {
                std::cerr << "Error: Malformed state line: " << line << std::endl;
                return false;
            }
            if (current != entt::null) {
                auto& movement = registry.get_or_emplace<RailMovement>(current);
                movement.moving = moving != 0;
                movement.target_station_id = Unfield(target);
                movement.speed = speed;
            }
        } else {
            std::cerr << "Warning: Skipping unknown state line: " << line << std::endl;
        }
    }

    // A moving train whose rail did not come back cannot finish its journey
    auto view = registry.view<RailMovement, RailPosition>();
    for (auto entity : view) {
        auto& movement = view.get<RailMovement>(entity);
        if (movement.moving && !view.get<RailPosition>(entity).on_rail) {
            std::cerr << "Warning: " << EntityLabel(registry, entity) << " restored idle, rail missing." << std::endl;
            movement.moving = false;
            movement.target_station_id.clear();
        }
    }

    std::cout << "Restored state of " << restored << " entities from " << filename << std::endl;
    return true;
}

void writeOutput(entt::registry& registry, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open output file: " << filename << std::endl;
        return;
    }

    std::cout << "Writing simulation output to " << filename << "..." << std::endl;
    // Use high precision for output data
    file << std::fixed << std::setprecision(8);

    auto view = registry.view<Name, Trajectory>();
    for (auto entity : view) {
        const auto& name = view.get<Name>(entity);
        const auto& traj = view.get<Trajectory>(entity);

        file << "ObjectName: " << name.name << "\n";
        if (const auto* car = registry.try_get<TrainCar>(entity)) {
            file << "Train: " << EntityLabel(registry, car->train) << " Index: " << car->index << "\n";
        }
        file << "Heading: " << GetHeading(registry, entity) << "\n";
        file << "Path:\n";

        for (const auto& pos : traj.path) {
            file << pos.x << ", " << pos.y << ", " << pos.z << "\n";
        }

        file << "EndObject\n\n";
    }
    std::cout << "Output file written." << std::endl;
}
