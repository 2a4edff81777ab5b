#ifndef RAIL_POSITION_HPP
#define RAIL_POSITION_HPP

#include "components.hpp"

#include <string>

// --- RailPosition Operations ---
// Free functions over the data-only RailPosition component.

/**
 * @brief Places an entity on a rail. Progress is clamped to [0, 1].
 */
void SetRailPosition(RailPosition& pos, const std::string& rail_id, double progress,
                     TravelDirection direction = TravelDirection::Forward);

/**
 * @brief Advances progress in the direction of travel.
 * Forward adds, Reverse subtracts; the result never passes the bound.
 * No-op when off rail.
 */
void UpdateProgress(RailPosition& pos, double delta_progress);

/**
 * @brief True iff on rail and progress sits on the bound the
 * direction of travel is heading for.
 */
bool HasReachedEnd(const RailPosition& pos);

void ReverseDirection(RailPosition& pos);

// Off rail, progress 0, Forward. Formation offsets are kept.
void ClearRailPosition(RailPosition& pos);

void SetFormationOffset(RailPosition& pos, double longitudinal_offset, double side_offset = 0.0);

const char* ToString(TravelDirection direction);
bool ParseDirection(const std::string& text, TravelDirection& out);


#endif // RAIL_POSITION_HPP
