/**
 * Rail Formation Simulator
 *
 * Drives trains made of rigid cars along piecewise-linear rails. Each
 * tick the lead progress of every moving train is advanced, then every
 * car is placed behind it on the same rail.
 *
 * Runs "headless" (fixed ticks as fast as possible) or "real-time"
 * (ticks paced by the wall clock). The game speed multiplier and pause
 * come from the TimeSource in the registry context.
 *
 * Usage:
 *   railsim [world-file] [output-file] [state-file]
 */

#include <entt/entt.hpp>
#include <iostream>
#include <string>
#include <chrono>
#include <thread>
#include <iomanip>

#include "components.hpp"
#include "events.hpp"
#include "persistence.hpp"
#include "rail.hpp"
#include "systems.hpp"
#include "time_source.hpp"
#include "world.hpp"


// --- Simulation Configuration ---

enum class SimMode {
    HEADLESS, // Run as fast as possible
    REALTIME  // Run based on wall-clock
};

struct SimConfig {
    std::string world_file = "world.txt";
    std::string output_file = "trajectories.dat";
    std::string state_file; // saved on shutdown when set

    double t_max = 120.0;        // real seconds to simulate
    double tick_dt = 1.0 / 60.0; // fixed tick interval (real seconds)

    // How many ticks pass before we log to the Trajectory component?
    int steps_per_log = 30;

    // Game speed: 1, 4, 8, 16 or 32
    int time_speed = 1;

    // Send trains back along the same rail when they arrive
    bool auto_return = true;
    bool verbose = true;

    // --- Realtime-Mode-Only Settings ---
    SimMode mode = SimMode::HEADLESS;

    // Target *render* FPS for the main loop (only in REALTIME mode)
    double render_fps = 60.0;
};


// --- Simulation Class ---

/**
 * @brief Manages the entire simulation state and main loop.
 */
class Simulation {
public:
    Simulation(const SimConfig& config) : m_config(config) {
        SimState state;
        state.tick_dt = m_config.tick_dt;
        state.verbose = m_config.verbose;
        InitializeWorld(m_registry, state);
    }

    /**
     * @brief Set up the time source and journey listeners.
     */
    void Initialize() {
        std::cout << "Initializing simulation..." << std::endl;

        auto& time = m_registry.ctx().get<TimeSource>();
        if (!time.SetTimeSpeed(m_config.time_speed)) {
            std::cerr << "Warning: Time speed " << m_config.time_speed
                      << "x not supported. Defaulting to 1x." << std::endl;
            time.SetTimeSpeed(1);
        }
        std::cout << "Time speed: " << time.RawSpeed() << "x" << std::endl;

        auto& dispatcher = m_registry.ctx().get<entt::dispatcher>();
        dispatcher.sink<JourneyCompleted>().connect<&Simulation::OnJourneyCompleted>(*this);
    }

    /**
     * @brief Load the world from file.
     */
    bool LoadWorld() {
        return loadWorldFromFile(m_registry, m_config.world_file);
    }

    /**
     * @brief Run the simulation using the configured mode.
     */
    void Run() {
        if (!LoadWorld()) {
            std::cerr << "Failed to load world. Exiting." << std::endl;
            return;
        }
        // Deliver the events of the initial journeys
        m_registry.ctx().get<entt::dispatcher>().update();

        m_running = true;
        if (m_config.mode == SimMode::HEADLESS) {
            RunHeadless();
        } else {
            RunRealtime();
        }
    }

    /**
     * @brief Write final simulation output.
     */
    void Shutdown() {
        std::cout << "\nSimulation finished." << std::endl;

        const auto& metrics = m_registry.ctx().get<TrainMetrics>();
        std::cout << "Trains: " << metrics.active_trains
                  << "  journeys started: " << metrics.journeys_started
                  << "  completed: " << metrics.journeys_completed
                  << "  rejected: " << metrics.journeys_rejected << std::endl;

        writeOutput(m_registry, m_config.output_file);
        if (!m_config.state_file.empty() && !saveState(m_registry, m_config.state_file)) {
            std::cerr << "Warning: State was not saved." << std::endl;
        }
    }

private:
    /**
     * @brief Performs a single, complete tick.
     * @param dt The *real* delta-time of the tick
     */
    void StepSimulation(double dt) {
        auto& time = m_registry.ctx().get<TimeSource>();

        TrainMovementSystem(m_registry, dt);
        time.Advance(dt);

        m_registry.ctx().get<SimState>().current_time += dt;

        // Log trajectory if it's time
        if (m_step_count % m_config.steps_per_log == 0) {
            UpdateTrajectorySystem(m_registry);
        }
        m_step_count++;

        // Listeners see the fully committed tick
        m_registry.ctx().get<entt::dispatcher>().update();
    }

    void OnJourneyCompleted(const JourneyCompleted& event) {
        std::cout << "Journey completed: " << EntityLabel(m_registry, event.train)
                  << " at " << event.station_id << std::endl;

        if (!m_config.auto_return) return;

        const Rail* rail = m_registry.ctx().get<RailNetwork>().FindRail(event.rail_id);
        if (!rail) return;

        const std::string& next = rail->StationA() == event.station_id ? rail->StationB() : rail->StationA();
        if (!StartJourney(m_registry, event.train, event.rail_id, next)) {
            std::cerr << "Warning: Return journey for " << EntityLabel(m_registry, event.train)
                      << " not started." << std::endl;
        }
    }

    /**
     * @brief Headless mode: Run as fast as possible, fixed loop.
     */
    void RunHeadless() {
        std::cout << "Running in HEADLESS mode (max speed)..." << std::endl;
        std::cout << "Simulating " << m_config.t_max << "s with tick="
                  << m_config.tick_dt << "s" << std::endl;

        auto sim_start_time = std::chrono::high_resolution_clock::now();

        const double& t = m_registry.ctx().get<SimState>().current_time;
        while (t < m_config.t_max) {
            StepSimulation(m_config.tick_dt);
        }

        auto sim_end_time = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> sim_duration = sim_end_time - sim_start_time;
        std::cout << "Total real time elapsed: "
                  << sim_duration.count() << " seconds." << std::endl;
    }

    /**
     * @brief Real-time mode: Run based on wall clock.
     * Implements a fixed-dt game loop.
     */
    void RunRealtime() {
        std::cout << "Running in REALTIME mode..." << std::endl;

        using clock = std::chrono::high_resolution_clock;

        const std::chrono::duration<double> render_frame_time(1.0 / m_config.render_fps);
        double accumulator = 0.0;

        auto last_wall_time = clock::now();

        while (m_running) {
            // --- 1. Calculate Wall-Clock Delta Time ---
            auto current_wall_time = clock::now();
            std::chrono::duration<double> real_dt_chrono = current_wall_time - last_wall_time;
            last_wall_time = current_wall_time;

            // --- 2. Update (Fixed-Step Loop) ---
            // Game speed is applied per tick by the movement system
            accumulator += real_dt_chrono.count();

            const double tick_dt = m_config.tick_dt;
            while (accumulator >= tick_dt) {
                StepSimulation(tick_dt);
                accumulator -= tick_dt;

                // Safety break for "spiral of death"
                // if sim can't keep up with wall time
                if (accumulator > tick_dt * 100) {
                    std::cout << "Warning: Simulation can't keep up! Resetting time accumulator." << std::endl;
                    accumulator = 0.0;
                }
            }

            // --- 3. Render / Output ---
            Render();

            // --- 4. Cap Render FPS ---
            auto work_time = clock::now() - current_wall_time;
            if (work_time < render_frame_time) {
                std::this_thread::sleep_for(render_frame_time - work_time);
            }

            // --- 5. Check Exit Conditions ---
            if (m_registry.ctx().get<SimState>().current_time >= m_config.t_max) {
                m_running = false;
            }
        }
    }

    /**
     * @brief Console status line; the rendering bridge reads
     * Position / Orientation directly.
     */
    void Render() {
        if (m_step_count % static_cast<int>(m_config.render_fps) == 0) { // Update console ~1/sec
            const auto& time = m_registry.ctx().get<TimeSource>();
            std::cout << "Time: " << std::fixed << std::setprecision(2)
                      << m_registry.ctx().get<SimState>().current_time << "s real, "
                      << time.GameTime() << "s game ("
                      << (time.IsPaused() ? "paused" : std::to_string(time.RawSpeed()) + "x")
                      << ")\r" << std::flush;
        }
    }

private:
    entt::registry m_registry;
    SimConfig m_config;
    bool m_running = false;
    int m_step_count = 0;
};


// --- Main ---
int main(int argc, char** argv) {

    // --- Simulation Parameters ---
    SimConfig config;
    if (argc > 1) config.world_file = argv[1];
    if (argc > 2) config.output_file = argv[2];
    if (argc > 3) config.state_file = argv[3];

    // == Run in Headless (computation) mode ==
    config.mode = SimMode::HEADLESS;
    config.t_max = 120.0;
    config.tick_dt = 1.0 / 60.0;
    config.steps_per_log = 30;
    config.time_speed = 4;

    // == Run in Realtime (visualization) mode ==
    // config.mode = SimMode::REALTIME;
    // config.time_speed = 1;
    // config.render_fps = 60.0;

    // --- End Parameters ---

    Simulation sim(config);

    sim.Initialize();
    sim.Run();
    sim.Shutdown();

    return 0;
}
