#ifndef RAIL_HPP
#define RAIL_HPP

#include "components.hpp"

#include <map>
#include <string>
#include <vector>

// Direction returned by a rail with no usable segment
constexpr Vec3 DEFAULT_FORWARD{0.0, 0.0, 1.0};

struct RailConfig {
    std::string id;
    std::string name;
    std::string station_a; // sits at progress 0
    std::string station_b; // sits at progress 1
    std::vector<Vec3> track_points;
    bool is_operational = true;
};

struct SegmentInfo {
    std::size_t index = 0;
    double fraction = 0.0; // position within the segment, 0..1
};

/**
 * @brief A piecewise-linear path between two stations.
 * Geometry is fixed at construction. Progress is arc-length parameterised:
 * progress p lies at distance p * TotalLength() from the first point.
 */
class Rail {
public:
    /**
     * @throws std::invalid_argument if fewer than two track points are given.
     */
    explicit Rail(RailConfig config);

    const std::string& Id() const { return m_config.id; }
    const std::string& DisplayName() const { return m_config.name; }
    const std::string& StationA() const { return m_config.station_a; }
    const std::string& StationB() const { return m_config.station_b; }
    const std::vector<Vec3>& TrackPoints() const { return m_config.track_points; }

    double TotalLength() const { return m_total_length; }
    std::size_t SegmentCount() const { return m_config.track_points.size() - 1; }

    bool IsOperational() const { return m_config.is_operational; }
    void SetOperational(bool operational) { m_config.is_operational = operational; }

    Vec3 PositionAt(double progress) const;
    Vec3 DirectionAt(double progress) const;
    SegmentInfo SegmentAt(double progress) const;

    // Convert a distance along the rail into a progress fraction.
    double DistanceToProgress(double distance) const;

    bool Connects(const std::string& station_id) const;

    // Progress of the endpoint at the given station, or -1 if not connected.
    double EndpointFor(const std::string& station_id) const;

private:
    RailConfig m_config;
    std::vector<double> m_cumulative; // distance at the start of each point
    double m_total_length = 0.0;
};


/**
 * @brief World-layer registry of rails and station positions.
 * Lives in the registry context; rails are looked up by id.
 */
class RailNetwork {
public:
    // Returns false if a rail with the same id exists.
    bool AddRail(Rail rail);
    const Rail* FindRail(const std::string& rail_id) const;
    Rail* FindRail(const std::string& rail_id);
    std::size_t RailCount() const { return m_rails.size(); }
    const std::map<std::string, Rail>& Rails() const { return m_rails; }

    void AddStation(const std::string& station_id, const Vec3& position);
    bool HasStation(const std::string& station_id) const;

    // Station position, falling back to the endpoint of a connecting rail.
    bool StationPosition(const std::string& station_id, Vec3& out) const;

private:
    std::map<std::string, Rail> m_rails;
    std::map<std::string, Vec3> m_stations;
};


#endif // RAIL_HPP
