#include "rail_position.hpp"

#include <algorithm>

void SetRailPosition(RailPosition& pos, const std::string& rail_id, double progress,
                     TravelDirection direction) {
    pos.rail_id = rail_id;
    pos.progress = std::clamp(progress, 0.0, 1.0);
    pos.direction = direction;
    pos.on_rail = true;
}

void UpdateProgress(RailPosition& pos, double delta_progress) {
    if (!pos.on_rail || pos.rail_id.empty()) return;

    if (pos.direction == TravelDirection::Forward) {
        pos.progress = std::min(1.0, pos.progress + delta_progress);
        if (1.0 - pos.progress < PROGRESS_EPSILON) pos.progress = 1.0;
    } else {
        pos.progress = std::max(0.0, pos.progress - delta_progress);
        if (pos.progress < PROGRESS_EPSILON) pos.progress = 0.0;
    }
}

bool HasReachedEnd(const RailPosition& pos) {
    if (!pos.on_rail) return false;
    return pos.direction == TravelDirection::Forward ? pos.progress >= 1.0 : pos.progress <= 0.0;
}

void ReverseDirection(RailPosition& pos) {
    pos.direction = pos.direction == TravelDirection::Forward ? TravelDirection::Reverse
                                                              : TravelDirection::Forward;
}

void ClearRailPosition(RailPosition& pos) {
    pos.rail_id.clear();
    pos.progress = 0.0;
    pos.direction = TravelDirection::Forward;
    pos.on_rail = false;
}

void SetFormationOffset(RailPosition& pos, double longitudinal_offset, double side_offset) {
    pos.longitudinal_offset = longitudinal_offset;
    pos.side_offset = side_offset;
}

const char* ToString(TravelDirection direction) {
    return direction == TravelDirection::Forward ? "forward" : "reverse";
}

bool ParseDirection(const std::string& text, TravelDirection& out) {
    if (text == "forward") {
        out = TravelDirection::Forward;
        return true;
    }
    if (text == "reverse") {
        out = TravelDirection::Reverse;
        return true;
    }
    return false;
}
