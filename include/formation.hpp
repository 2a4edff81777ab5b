#ifndef FORMATION_HPP
#define FORMATION_HPP

#include "components.hpp"
#include "rail.hpp"

#include <entt/entt.hpp>
#include <vector>

// --- Formation / Offset Calculator ---
// Every car's rail position is derived from the lead (train front) each
// tick. Car i trails the front by
//   lead_length + sum(length of cars 0..i-1) + i * car_spacing.

/**
 * @brief Distance (world units) that car `index` trails the train front.
 */
double CarOffsetDistance(const std::vector<double>& car_lengths, std::size_t index,
                         double lead_length, double car_spacing);

/**
 * @brief Converts the lead progress into a car's progress on the same rail.
 * Forward: max(0, lead - offset), Reverse: min(1, lead + offset).
 */
double CarProgress(double lead_progress, TravelDirection direction, double offset_distance, const Rail& rail);

/**
 * @brief Re-indexes the train's cars front to back and stores each car's
 * offset distance as its longitudinal formation offset.
 * Call after the car list changes.
 */
void RefreshFormationOffsets(entt::registry& registry, entt::entity train);

/**
 * @brief Overwrites every car's RailPosition, Position and Orientation
 * from the lead rail position. The lead must already be advanced for
 * this tick.
 */
void UpdateFormation(entt::registry& registry, entt::entity train, const Rail& rail, const RailPosition& lead);


#endif // FORMATION_HPP
