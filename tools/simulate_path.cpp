/**
 * @file simulate_path.cpp
 * @brief Standalone tool that drives the square circuit in closed loop and plots the run.
 *
 * Usage: arctrack_simulate [config.yaml] [output.svg]
 *
 * Without a config file the s-curve strategy runs with built-in gains. With one,
 * the file is re-polled every RELOAD_PERIOD ticks so gains can be edited while
 * the simulation runs.
 */

#include <arctrack.hpp>

#include <utils/circuits.hpp>
#include <utils/unicycle.hpp>
#include <utils/visualizer.hpp>

#include <cmath>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

using namespace arctrack::core;
using namespace arctrack::tracking;
using arctrack::config::ConfigWatcher;
using arctrack::config::TrackerConfig;

// Configuration
constexpr std::uint32_t MAX_TICKS = 20000;
constexpr std::uint32_t RELOAD_PERIOD = 500;
constexpr std::uint32_t REPORT_PERIOD = 1000;

/// Gains used when no config file is given.
TrackerConfig defaultConfig ()
{
    TrackerConfig cfg{};
    cfg.path.velocity = 0.5f;
    cfg.path.correction = SCurveCorrection{0.05f};
    cfg.mixer.angularGain = 40.0f;
    return cfg;
}

int main (int argc, char **argv)
{
    try
    {
        std::optional<ConfigWatcher> watcher;
        TrackerConfig cfg = defaultConfig ();
        if (argc > 1)
        {
            watcher.emplace (argv[1], cfg);
            watcher->poll ();
            cfg = watcher->current ();
        }
        if (!arctrack::config::apply (cfg.logging))
            ARCTRACK_LOG_WARN ("continuing without log file");

        const std::string svgPath = (argc > 2) ? argv[2] : "square_circuit.svg";

        const auto circuit = arctrack::utils::squareCircuit ();
        const Pose start = arctrack::utils::squareCircuitStart ();

        std::uint32_t time = 0;
        PathController controller{time};
        if (auto added = controller.addSegments (circuit); !added)
        {
            ARCTRACK_LOG_ERROR ("circuit does not fit the path buffer");
            return 1;
        }

        ARCTRACK_LOG_INFO ("simulating %zu segments at %.2f mm/tick", circuit.size (), static_cast<double> (cfg.path.velocity));

        arctrack::utils::Unicycle vehicle{start};
        std::vector<Pose> trail{start};
        float maxDistance = 0.0f;
        bool done = false;

        for (std::uint32_t tick = 1; tick <= MAX_TICKS && !done; ++tick)
        {
            if (watcher && tick % RELOAD_PERIOD == 0 && watcher->poll ())
            {
                cfg = watcher->current ();
                if (!arctrack::config::apply (cfg.logging))
                    ARCTRACK_LOG_WARN ("continuing without log file");
            }

            ++time;
            arctrack::core::log::setTick (time);
            const TrackingCommand cmd = controller.update (cfg.path, time, vehicle.pose ());
            const auto powers = arctrack::vehicle::mix (cfg.mixer, cmd);
            done = cmd.done;

            if (cmd.debug.distanceFrom)
                maxDistance = std::fmax (maxDistance, std::fabs (*cmd.debug.distanceFrom));

            ARCTRACK_LOG_TRACE ("d=%.3f k=%.5f L=%.3f R=%.3f", static_cast<double> (cmd.debug.distanceFrom.value_or (0.0f)),
                                static_cast<double> (cmd.curvature), static_cast<double> (powers.left), static_cast<double> (powers.right));
            if (tick % REPORT_PERIOD == 0)
                ARCTRACK_LOG_INFO ("tick %u: %zu segments left, max |d| %.2f mm", tick, controller.buffer ().size (), static_cast<double> (maxDistance));

            vehicle.step (cmd.curvature, cmd.velocity, 1);
            trail.push_back (vehicle.pose ());
        }

        arctrack::core::log::clearTick ();
        const Pose &end = vehicle.pose ();
        if (done)
            ARCTRACK_LOG_INFO ("finished after %u ticks at (%.1f, %.1f), max |d| %.2f mm", time, static_cast<double> (end.position.x),
                               static_cast<double> (end.position.y), static_cast<double> (maxDistance));
        else
            ARCTRACK_LOG_WARN ("not finished after %u ticks, %zu segments left", MAX_TICKS, controller.buffer ().size ());

        {
            arctrack::utils::Visualizer viz (svgPath);
            if (!viz.good ())
                return 1;
            viz.drawSegments (circuit);
            viz.drawTrail (trail);
            viz.drawStartPose (start);
            viz.drawGoalPose (end);
        }
        ARCTRACK_LOG_INFO ("wrote %s", svgPath.c_str ());

        return done ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        ARCTRACK_LOG_ERROR ("uncaught exception: %s", e.what ());
        return 2;
    }
}
