#include "rail.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

Rail::Rail(RailConfig config) : m_config(std::move(config)) {
    if (m_config.track_points.size() < 2) {
        throw std::invalid_argument("Rail '" + m_config.id + "' needs at least 2 track points, got " +
                                    std::to_string(m_config.track_points.size()));
    }

    m_cumulative.reserve(m_config.track_points.size());
    m_cumulative.push_back(0.0);
    for (std::size_t i = 1; i < m_config.track_points.size(); ++i) {
        m_total_length += Distance(m_config.track_points[i - 1], m_config.track_points[i]);
        m_cumulative.push_back(m_total_length);
    }
}

SegmentInfo Rail::SegmentAt(double progress) const {
    const std::size_t segments = SegmentCount();
    progress = std::clamp(progress, 0.0, 1.0);

    if (progress >= 1.0 || m_total_length <= 0.0) {
        return {segments - 1, progress >= 1.0 ? 1.0 : 0.0};
    }

    const double distance = progress * m_total_length;

    // First point whose cumulative distance exceeds the target
    auto it = std::upper_bound(m_cumulative.begin(), m_cumulative.end(), distance);
    std::size_t index = static_cast<std::size_t>(std::distance(m_cumulative.begin(), it));
    index = index == 0 ? 0 : index - 1;
    if (index >= segments) index = segments - 1;

    const double seg_len = m_cumulative[index + 1] - m_cumulative[index];
    const double fraction = seg_len > 0.0 ? (distance - m_cumulative[index]) / seg_len : 0.0;
    return {index, std::clamp(fraction, 0.0, 1.0)};
}

Vec3 Rail::PositionAt(double progress) const {
    const auto& points = m_config.track_points;
    if (progress <= 0.0) return points.front();
    if (progress >= 1.0) return points.back();

    const SegmentInfo seg = SegmentAt(progress);
    return Lerp(points[seg.index], points[seg.index + 1], seg.fraction);
}

Vec3 Rail::DirectionAt(double progress) const {
    const auto& points = m_config.track_points;
    const SegmentInfo seg = SegmentAt(progress);

    // Walk forward from the containing segment, then backward, skipping
    // zero-length segments.
    for (std::size_t i = seg.index; i < SegmentCount(); ++i) {
        Vec3 d = points[i + 1] - points[i];
        double len = Length(d);
        if (len > 0.0) return d / len;
    }
    for (std::size_t i = seg.index; i-- > 0;) {
        Vec3 d = points[i + 1] - points[i];
        double len = Length(d);
        if (len > 0.0) return d / len;
    }
    return DEFAULT_FORWARD;
}

double Rail::DistanceToProgress(double distance) const {
    if (m_total_length <= 0.0) {
        return distance > 0.0 ? 1.0 : 0.0;
    }
    return distance / m_total_length;
}

bool Rail::Connects(const std::string& station_id) const {
    return m_config.station_a == station_id || m_config.station_b == station_id;
}

double Rail::EndpointFor(const std::string& station_id) const {
    if (m_config.station_a == station_id) return 0.0;
    if (m_config.station_b == station_id) return 1.0;
    return -1.0;
}


// --- RailNetwork ---

bool RailNetwork::AddRail(Rail rail) {
    std::string id = rail.Id();
    auto [it, inserted] = m_rails.emplace(id, std::move(rail));
    if (!inserted) {
        std::cerr << "Warning: Duplicate rail id '" << id << "' ignored." << std::endl;
    }
    return inserted;
}

const Rail* RailNetwork::FindRail(const std::string& rail_id) const {
    auto it = m_rails.find(rail_id);
    return it == m_rails.end() ? nullptr : &it->second;
}

Rail* RailNetwork::FindRail(const std::string& rail_id) {
    auto it = m_rails.find(rail_id);
    return it == m_rails.end() ? nullptr : &it->second;
}

void RailNetwork::AddStation(const std::string& station_id, const Vec3& position) {
    m_stations[station_id] = position;
}

bool RailNetwork::HasStation(const std::string& station_id) const {
    Vec3 unused;
    return StationPosition(station_id, unused);
}

bool RailNetwork::StationPosition(const std::string& station_id, Vec3& out) const {
    auto it = m_stations.find(station_id);
    if (it != m_stations.end()) {
        out = it->second;
        return true;
    }

    for (const auto& [id, rail] : m_rails) {
        double endpoint = rail.EndpointFor(station_id);
        if (endpoint >= 0.0) {
            out = rail.PositionAt(endpoint);
            return true;
        }
    }
    return false;
}
