#ifndef COMPONENTS_HPP
#define COMPONENTS_HPP

#include <entt/entt.hpp>
#include <vector>
#include <string>
#include <cmath>

// --- Constants ---
// Progress values closer than this to a rail end snap onto it.
constexpr double PROGRESS_EPSILON = 1e-9;

// Default gap between consecutive cars (world units)
constexpr double DEFAULT_CAR_SPACING = 2.5;

// Default length of a car when the world file does not give one
constexpr double DEFAULT_CAR_LENGTH = 1.0;


// --- Helper: 3D Vector ---
struct Vec3 {
    double x = 0.0, y = 0.0, z = 0.0;

    Vec3& operator+=(const Vec3& rhs) {
        x += rhs.x; y += rhs.y; z += rhs.z;
        return *this;
    }
    Vec3& operator-=(const Vec3& rhs) {
        x -= rhs.x; y -= rhs.y; z -= rhs.z;
        return *this;
    }
    Vec3& operator*=(double scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }
    Vec3& operator/=(double scalar) {
        x /= scalar; y /= scalar; z /= scalar;
        return *this;
    }
};

// Non-member operators
inline Vec3 operator+(Vec3 lhs, const Vec3& rhs) { return lhs += rhs; }
inline Vec3 operator-(Vec3 lhs, const Vec3& rhs) { return lhs -= rhs; }
inline Vec3 operator*(Vec3 lhs, double scalar) { return lhs *= scalar; }
inline Vec3 operator*(double scalar, Vec3 rhs) { return rhs *= scalar; }
inline Vec3 operator/(Vec3 lhs, double scalar) { return lhs /= scalar; }
inline Vec3 operator-(Vec3 v) { return v *= -1.0; }

inline double Length(const Vec3& v) {
    return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
}

inline double Distance(const Vec3& a, const Vec3& b) {
    return Length(b - a);
}

inline Vec3 Lerp(const Vec3& a, const Vec3& b, double t) {
    return a + (b - a) * t;
}


// --- Components ---
// Components are simple data-only structs.

struct Name { std::string name; };
struct Owner { std::string player_id; };

// World-space output read by the rendering bridge.
struct Position { Vec3 p; };
struct Orientation { double heading = 0.0; }; // radians about +Y, atan2(dir.x, dir.z)

enum class TravelDirection {
    Forward, // towards progress 1
    Reverse  // towards progress 0
};

/**
 * Where an entity sits on a rail. Trains integrate this every tick; cars
 * have it overwritten from their train's lead position.
 */
struct RailPosition {
    std::string rail_id;          // empty when off rail
    double progress = 0.0;        // always within [0, 1]
    TravelDirection direction = TravelDirection::Forward;
    double side_offset = 0.0;     // lateral, world units
    double longitudinal_offset = 0.0; // distance behind the train front
    bool on_rail = false;
};

// Journey state of a train. Idle <-> Moving only.
struct RailMovement {
    bool moving = false;
    std::string target_station_id;
    double speed = 1.0; // world units per second
};

// Ordered cars of a train, front to back.
struct Formation {
    std::vector<entt::entity> cars;
    double lead_length = 0.0;  // logical front to the first car
    double car_spacing = DEFAULT_CAR_SPACING;
};

struct TrainCar {
    entt::entity train = entt::null;
    std::size_t index = 0;
    double length = DEFAULT_CAR_LENGTH;
};

// Tag for entities that are trains
struct Train {};

// This component will store the object's path for output.
struct Trajectory {
    std::vector<Vec3> path;
};


// --- Global Simulation State ---
// Stored in the registry's "context" via registry.ctx().
// This allows any system to access global state without
// passing it around.
struct SimState {
    double current_time = 0.0; // real seconds simulated
    double tick_dt = 1.0 / 60.0;
    bool verbose = false;
};

// Counters reported by the train systems.
struct TrainMetrics {
    int active_trains = 0;
    int journeys_started = 0;
    int journeys_completed = 0;
    int journeys_rejected = 0;
};


#endif // COMPONENTS_HPP
