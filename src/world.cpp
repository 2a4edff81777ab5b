#include "world.hpp"
#include "formation.hpp"
#include "rail.hpp"
#include "rail_position.hpp"
#include "systems.hpp"
#include "time_source.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

// --- World Setup ---

void InitializeWorld(entt::registry& registry, const SimState& state) {
    auto& ctx = registry.ctx();
    if (!ctx.contains<SimState>()) ctx.emplace<SimState>(state);
    if (!ctx.contains<TimeSource>()) ctx.emplace<TimeSource>();
    if (!ctx.contains<RailNetwork>()) ctx.emplace<RailNetwork>();
    if (!ctx.contains<TrainMetrics>()) ctx.emplace<TrainMetrics>();
    if (!ctx.contains<entt::dispatcher>()) ctx.emplace<entt::dispatcher>();
}


// --- Train Roster ---

namespace {

void UpdateActiveTrainCount(entt::registry& registry) {
    if (auto* metrics = registry.ctx().find<TrainMetrics>()) {
        auto view = registry.view<Train>();
        metrics->active_trains = static_cast<int>(view.size());
    }
}

bool IsIdleTrain(const entt::registry& registry, entt::entity train) {
    if (!registry.valid(train) || !registry.all_of<Train, Formation, RailMovement>(train)) return false;
    return !registry.get<RailMovement>(train).moving;
}

} // namespace

entt::entity CreateTrain(entt::registry& registry, const TrainSpec& spec) {
    auto train = registry.create();
    registry.emplace<Train>(train);
    registry.emplace<Name>(train, spec.name);
    registry.emplace<Owner>(train, spec.owner);
    registry.emplace<Position>(train);
    registry.emplace<Orientation>(train);
    registry.emplace<RailPosition>(train);
    registry.emplace<RailMovement>(train, RailMovement{false, "", spec.speed});
    registry.emplace<Formation>(train, Formation{{}, spec.lead_length, spec.car_spacing});
    registry.emplace<Trajectory>(train);

    UpdateActiveTrainCount(registry);
    return train;
}

entt::entity AddCar(entt::registry& registry, entt::entity train, const std::string& name, double length) {
    if (!IsIdleTrain(registry, train)) {
        std::cerr << "Error: Car '" << name << "' can only join an idle train." << std::endl;
        return entt::null;
    }
    if (length < 0.0) {
        std::cerr << "Error: Car '" << name << "' has negative length " << length << "." << std::endl;
        return entt::null;
    }

    const Position train_pos = registry.get<Position>(train);
    const Orientation train_rot = registry.get<Orientation>(train);
    const TravelDirection facing = registry.get<RailPosition>(train).direction;

    auto car = registry.create();
    registry.emplace<Name>(car, name);
    registry.emplace<TrainCar>(car, TrainCar{train, 0, length});
    registry.emplace<Position>(car, train_pos);
    registry.emplace<Orientation>(car, train_rot);
    registry.emplace<RailPosition>(car).direction = facing;
    registry.emplace<Trajectory>(car);

    registry.get<Formation>(train).cars.push_back(car);
    RefreshFormationOffsets(registry, train);
    return car;
}

bool RemoveCar(entt::registry& registry, entt::entity train, entt::entity car) {
    if (!IsIdleTrain(registry, train)) {
        std::cerr << "Error: Cars can only be detached from an idle train." << std::endl;
        return false;
    }

    auto& cars = registry.get<Formation>(train).cars;
    auto it = std::find(cars.begin(), cars.end(), car);
    if (it == cars.end()) {
        std::cerr << "Error: Car " << EntityLabel(registry, car) << " is not part of train "
                  << EntityLabel(registry, train) << "." << std::endl;
        return false;
    }

    cars.erase(it);
    if (registry.valid(car)) registry.destroy(car);
    RefreshFormationOffsets(registry, train);
    return true;
}

bool PlaceTrainAtStation(entt::registry& registry, entt::entity train, const std::string& station_id) {
    if (!IsIdleTrain(registry, train)) {
        std::cerr << "Error: Only an idle train can be placed at a station." << std::endl;
        return false;
    }

    Vec3 station_pos;
    if (!registry.ctx().get<RailNetwork>().StationPosition(station_id, station_pos)) {
        std::cerr << "Error: Station '" << station_id << "' not found on any rail." << std::endl;
        return false;
    }

    auto place = [&registry, &station_pos](entt::entity entity) {
        registry.get_or_emplace<Position>(entity).p = station_pos;
        registry.get_or_emplace<Orientation>(entity).heading = 0.0;
        if (auto* rail_pos = registry.try_get<RailPosition>(entity)) {
            ClearRailPosition(*rail_pos);
        }
    };

    place(train);
    for (auto car : registry.get<Formation>(train).cars) {
        if (registry.valid(car)) place(car);
    }
    return true;
}

void RemoveTrain(entt::registry& registry, entt::entity train) {
    if (!registry.valid(train)) return;

    if (const auto* formation = registry.try_get<Formation>(train)) {
        const auto cars = formation->cars;
        for (auto car : cars) {
            if (registry.valid(car)) registry.destroy(car);
        }
    }
    registry.destroy(train);
    UpdateActiveTrainCount(registry);
}

std::string EntityLabel(const entt::registry& registry, entt::entity entity) {
    if (registry.valid(entity)) {
        if (const auto* name = registry.try_get<Name>(entity)) return name->name;
    }
    return "#" + std::to_string(static_cast<std::uint32_t>(entt::to_integral(entity)));
}

entt::entity FindEntityByName(const entt::registry& registry, const std::string& name) {
    auto view = registry.view<const Name>();
    for (auto entity : view) {
        if (view.get<const Name>(entity).name == name) return entity;
    }
    return entt::null;
}

std::vector<entt::entity> GetPlayerTrains(const entt::registry& registry, const std::string& player_id) {
    std::vector<entt::entity> trains;
    auto view = registry.view<const Train, const Owner>();
    for (auto entity : view) {
        if (view.get<const Owner>(entity).player_id == player_id) trains.push_back(entity);
    }
    return trains;
}


// --- File I/O ---

bool loadWorldFromFile(entt::registry& registry, const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open world file: " << filename << std::endl;
        return false;
    }

    InitializeWorld(registry);
    auto& network = registry.ctx().get<RailNetwork>();

    std::cout << "Loading world from " << filename << "..." << std::endl;

    // Placement and journeys wait until every train has its cars
    std::vector<std::pair<entt::entity, std::string>> placements;
    struct PendingJourney { std::string train, rail, station; };
    std::vector<PendingJourney> journeys;

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::stringstream ss(line);
        std::string kind;
        if (!(ss >> kind)) continue;

        if (kind == "station") {
            std::string id;
            double x, y, z;
            if (ss >> id >> x >> y >> z) {
                network.AddStation(id, Vec3{x, y, z});
                continue;
            }
        } else if (kind == "rail") {
            RailConfig config;
            int operational = 1;
            if (ss >> config.id >> config.station_a >> config.station_b >> operational) {
                config.name = config.id;
                config.is_operational = operational != 0;
                std::vector<double> coords;
                double value;
                while (ss >> value) coords.push_back(value);
                if (ss.eof() && coords.size() % 3 == 0) {
                    for (std::size_t i = 0; i < coords.size(); i += 3) {
                        config.track_points.push_back(Vec3{coords[i], coords[i + 1], coords[i + 2]});
                    }
                    try {
                        network.AddRail(Rail(std::move(config)));
                    } catch (const std::invalid_argument& e) {
                        std::cerr << "Error: " << filename << ":" << line_no << ": " << e.what() << std::endl;
                        return false;
                    }
                    continue;
                }
            }
        } else if (kind == "train") {
            TrainSpec spec;
            std::string station;
            if (ss >> spec.name >> spec.owner >> station >> spec.speed >> spec.lead_length >> spec.car_spacing) {
                auto train = CreateTrain(registry, spec);
                placements.emplace_back(train, station);
                std::cout << "  Loaded train: " << spec.name << " (Speed: " << spec.speed << ")" << std::endl;
                continue;
            }
        } else if (kind == "car") {
            std::string train_name, car_name;
            double length = DEFAULT_CAR_LENGTH;
            if (ss >> train_name >> car_name >> length) {
                auto train = FindEntityByName(registry, train_name);
                if (train == entt::null || AddCar(registry, train, car_name, length) == entt::null) {
                    std::cerr << "Warning: Car '" << car_name << "' skipped, no idle train '"
                              << train_name << "'." << std::endl;
                }
                continue;
            }
        } else if (kind == "journey") {
            PendingJourney journey;
            if (ss >> journey.train >> journey.rail >> journey.station) {
                journeys.push_back(journey);
                continue;
            }
        }

        std::cerr << "Warning: Skipping malformed line " << line_no << ": " << line << std::endl;
    }

    for (const auto& [train, station] : placements) {
        PlaceTrainAtStation(registry, train, station);
    }

    for (const auto& journey : journeys) {
        auto train = FindEntityByName(registry, journey.train);
        if (!StartJourney(registry, train, journey.rail, journey.station)) {
            std::cerr << "Warning: Initial journey for '" << journey.train << "' not started." << std::endl;
        }
    }

    std::cout << "Loaded " << network.RailCount() << " rails and "
              << registry.ctx().get<TrainMetrics>().active_trains << " trains." << std::endl;
    return true;
}
