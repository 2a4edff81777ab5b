#include "pose.hpp"

#include <cmath>

double HeadingFromDirection(const Vec3& dir) {
    return std::atan2(dir.x, dir.z);
}

void ComputeRailPose(const Rail& rail, const RailPosition& rail_pos, Position& out_pos, Orientation& out_rot) {
    const Vec3 dir = rail.DirectionAt(rail_pos.progress);
    Vec3 point = rail.PositionAt(rail_pos.progress);

    if (rail_pos.side_offset != 0.0) {
        // Right-hand side of the rail's own direction, in the XZ plane
        Vec3 right{dir.z, 0.0, -dir.x};
        double len = Length(right);
        if (len > 0.0) {
            point += (right / len) * rail_pos.side_offset;
        }
    }

    out_pos.p = point;
    out_rot.heading = HeadingFromDirection(dir);
}

Vec3 GetWorldPosition(const entt::registry& registry, entt::entity entity) {
    if (!registry.valid(entity)) return {};
    const auto* pos = registry.try_get<Position>(entity);
    return pos ? pos->p : Vec3{};
}

double GetHeading(const entt::registry& registry, entt::entity entity) {
    if (!registry.valid(entity)) return 0.0;
    const auto* rot = registry.try_get<Orientation>(entity);
    return rot ? rot->heading : 0.0;
}
