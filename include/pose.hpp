#ifndef POSE_HPP
#define POSE_HPP

#include "components.hpp"
#include "rail.hpp"

#include <entt/entt.hpp>

// --- World Position / Orientation Output ---
// Derived from RailPosition + Rail; never integrated on its own.

/**
 * @brief Heading (radians about +Y) for a direction vector.
 */
double HeadingFromDirection(const Vec3& dir);

/**
 * @brief Writes world position and heading for a rail position.
 * The heading follows the rail direction at the progress, whichever way
 * the entity travels; side_offset moves the point along the rail's
 * horizontal right vector.
 */
void ComputeRailPose(const Rail& rail, const RailPosition& rail_pos, Position& out_pos, Orientation& out_rot);

// Queries used by the rendering bridge. Entities without output
// components report the origin / zero heading.
Vec3 GetWorldPosition(const entt::registry& registry, entt::entity entity);
double GetHeading(const entt::registry& registry, entt::entity entity);


#endif // POSE_HPP
