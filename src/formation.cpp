#include "formation.hpp"
#include "pose.hpp"
#include "rail_position.hpp"

#include <algorithm>
#include <iostream>

double CarOffsetDistance(const std::vector<double>& car_lengths, std::size_t index,
                         double lead_length, double car_spacing) {
    double offset = lead_length;
    for (std::size_t i = 0; i < index && i < car_lengths.size(); ++i) {
        offset += car_lengths[i];
    }
    offset += static_cast<double>(index) * car_spacing;
    return offset;
}

double CarProgress(double lead_progress, TravelDirection direction, double offset_distance, const Rail& rail) {
    const double progress_offset = rail.DistanceToProgress(offset_distance);
    if (direction == TravelDirection::Forward) {
        return std::max(0.0, lead_progress - progress_offset);
    }
    return std::min(1.0, lead_progress + progress_offset);
}

namespace {

// Car lengths in formation order; cars missing a TrainCar count as zero length.
std::vector<double> CollectCarLengths(const entt::registry& registry, const Formation& formation) {
    std::vector<double> lengths;
    lengths.reserve(formation.cars.size());
    for (auto car : formation.cars) {
        const auto* info = registry.valid(car) ? registry.try_get<TrainCar>(car) : nullptr;
        lengths.push_back(info ? info->length : 0.0);
    }
    return lengths;
}

} // namespace

void RefreshFormationOffsets(entt::registry& registry, entt::entity train) {
    auto* formation = registry.try_get<Formation>(train);
    if (!formation) return;

    const auto lengths = CollectCarLengths(registry, *formation);
    for (std::size_t i = 0; i < formation->cars.size(); ++i) {
        auto car = formation->cars[i];
        if (!registry.valid(car)) continue;

        if (auto* info = registry.try_get<TrainCar>(car)) {
            info->train = train;
            info->index = i;
        }
        auto* rail_pos = registry.try_get<RailPosition>(car);
        if (!rail_pos) continue;
        SetFormationOffset(*rail_pos,
                           CarOffsetDistance(lengths, i, formation->lead_length, formation->car_spacing),
                           rail_pos->side_offset);
    }
}

void UpdateFormation(entt::registry& registry, entt::entity train, const Rail& rail, const RailPosition& lead) {
    const auto* formation = registry.try_get<Formation>(train);
    if (!formation || formation->cars.empty()) return;

    const auto lengths = CollectCarLengths(registry, *formation);

    for (std::size_t i = 0; i < formation->cars.size(); ++i) {
        auto car = formation->cars[i];
        if (!registry.valid(car) || !registry.all_of<RailPosition, Position, Orientation>(car)) {
            std::cerr << "Warning: Car at index " << i << " has no rail state, skipped." << std::endl;
            continue;
        }

        const double offset = CarOffsetDistance(lengths, i, formation->lead_length, formation->car_spacing);
        const double progress = CarProgress(lead.progress, lead.direction, offset, rail);

        auto [car_pos, world, rot] = registry.get<RailPosition, Position, Orientation>(car);
        const double side = car_pos.side_offset;
        SetRailPosition(car_pos, lead.rail_id, progress, lead.direction);
        SetFormationOffset(car_pos, offset, side);
        ComputeRailPose(rail, car_pos, world, rot);
    }
}
