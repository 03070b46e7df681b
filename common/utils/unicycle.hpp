#pragma once
/**
 * @file   unicycle.hpp
 * @brief  Kinematic vehicle model and a closed-loop driver for the path controller.
 *
 * The model follows the commanded curvature exactly (no slip, no actuator lag),
 * integrating each tick as a circular arc of length velocity·Δt.
 */

#include <arctrack.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace arctrack::utils
{
    /**
     * @class Unicycle
     * @brief Ideal curvature-driven vehicle.
     */
    class Unicycle
    {
      public:
        explicit Unicycle (core::Pose pose) noexcept : pose_ (pose) {}

        /**
         * @brief Drive one arc.
         * @param curvature  Commanded curvature [rad/mm].
         * @param velocity   Commanded velocity [mm/tick].
         * @param dt         Ticks to integrate.
         */
        void step (float curvature, float velocity, std::uint32_t dt) noexcept
        {
            const float length = velocity * static_cast<float> (dt);
            const auto [x, y, theta] = core::computeArcEndpoint (pose_.position.x, pose_.position.y, pose_.direction.radians (), curvature, length);
            pose_ = core::Pose{{x, y}, core::Direction::fromRadians (theta)};
        }

        [[nodiscard]] const core::Pose &pose () const noexcept { return pose_; }

      private:
        core::Pose pose_;
    };

    /**
     * @struct SimulationResult
     * @brief  Outcome of @ref simulate.
     */
    struct SimulationResult
    {
        bool done{false};                ///< Controller reported completion
        std::uint32_t ticks{0};          ///< Updates performed
        std::size_t completedSegments{}; ///< Segments popped over the run
        float maxDistance{0.0f};         ///< Largest |cross-track distance| seen
        core::Pose finalPose{};          ///< Pose after the last update
        std::vector<core::Pose> trail;   ///< Pose before every update (if recorded)
    };

    /**
     * @brief Run controller and vehicle in closed loop, one update per tick.
     * @param controller  Controller with its path already loaded.
     * @param config      Tuning used for every tick.
     * @param start       Initial vehicle pose.
     * @param startTime   Tick of the first update.
     * @param maxTicks    Upper bound on updates.
     * @param recordTrail Keep every pose in @ref SimulationResult::trail.
     */
    inline SimulationResult simulate (tracking::PathController &controller, const tracking::PathConfig &config, core::Pose start, std::uint32_t startTime,
                                      std::uint32_t maxTicks, bool recordTrail = false)
    {
        SimulationResult result{};
        Unicycle vehicle{start};
        std::uint32_t time = startTime;

        for (std::uint32_t i = 0; i < maxTicks; ++i)
        {
            if (recordTrail)
                result.trail.push_back (vehicle.pose ());

            const tracking::TrackingCommand cmd = controller.update (config, time, vehicle.pose ());
            ++result.ticks;
            result.completedSegments += cmd.debug.completedSegments;
            if (cmd.debug.distanceFrom)
                result.maxDistance = std::max (result.maxDistance, std::fabs (*cmd.debug.distanceFrom));

            if (cmd.done)
            {
                result.done = true;
                break;
            }

            vehicle.step (cmd.curvature, cmd.velocity, 1);
            ++time;
        }

        result.finalPose = vehicle.pose ();
        if (recordTrail)
            result.trail.push_back (vehicle.pose ());
        return result;
    }

} // namespace arctrack::utils
