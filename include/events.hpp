#ifndef EVENTS_HPP
#define EVENTS_HPP

#include <entt/entt.hpp>
#include <string>

// --- Journey Events ---
// Published on the entt::dispatcher stored in the registry context.
// Systems enqueue; the simulation driver delivers once per tick after
// every train has moved.

struct JourneyStarted {
    entt::entity train = entt::null;
    std::string rail_id;
    std::string target_station_id;
};

struct JourneyCompleted {
    entt::entity train = entt::null;
    std::string station_id;
    std::string rail_id;
};


#endif // EVENTS_HPP
