#pragma once
/**
 * @file    path_controller.hpp
 * @brief   Path-following controller: turns the current pose and the remaining
 *          segments into a target curvature and velocity every tick.
 *
 * Per tick:
 *   1. pop every segment whose closest-point parameter reached 1,
 *   2. measure the signed cross-track distance on the active one,
 *   3. command offset curvature + correction curvature at cruise velocity.
 *
 * The controller never blocks or allocates; one update costs at most
 * PATH_BUFFER_CAPACITY projections. It is owned by a single control loop.
 */

#include <arctrack/core/log.hpp>
#include <arctrack/core/numeric.hpp>
#include <arctrack/core/pose.hpp>
#include <arctrack/tracking/correction.hpp>
#include <arctrack/tracking/path_buffer.hpp>
#include <arctrack/tracking/path_config.hpp>
#include <arctrack/tracking/path_debug.hpp>
#include <arctrack/tracking/segment.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <type_traits>
#include <variant>

namespace arctrack::tracking
{
    using arctrack::core::Pose;

    /**
     * @struct TrackingCommand
     * @brief  Output of one controller tick.
     */
    struct TrackingCommand
    {
        float curvature{}; ///< Target curvature [rad/mm], positive = left
        float velocity{};  ///< Target velocity [mm/tick]
        bool done{};       ///< No segment left to track
        PathDebug debug{}; ///< Intermediate values of this tick
    };

    /**
     * @class PathController
     * @brief Tracks a stack of segments with a configurable correction strategy.
     */
    class PathController
    {
      public:
        /**
         * @brief Create a controller with an empty path.
         * @param time  Current tick; the first update measures Δt from here.
         */
        explicit PathController (std::uint32_t time) noexcept : time_ (time) {}

        /**
         * @brief Append segments; the last one given is tracked first.
         * @return Free slots left, or the index of the first rejected segment
         *         (earlier segments stay accepted).
         */
        [[nodiscard]] std::expected<std::size_t, std::size_t> addSegments (std::span<const Segment> segments) noexcept
        {
            auto result = buffer_.addSegments (segments);
            if (!result)
                ARCTRACK_LOG_WARN ("path buffer full: rejected segment %zu of %zu", result.error (), segments.size ());
            return result;
        }

        /**
         * @brief Run the control law for one tick.
         * @param config  Tuning for this tick (live-reloadable).
         * @param time    Current tick (monotonic; wraps modulo 2³²).
         * @param pose    Pose estimate valid at @p time.
         * @return Target curvature, velocity, done flag and diagnostics.
         */
        [[nodiscard]] TrackingCommand update (const PathConfig &config, std::uint32_t time, const Pose &pose) noexcept
        {
            TrackingCommand cmd{};
            PathDebug &debug = cmd.debug;

            const std::uint32_t elapsed = time - time_;

            const Segment *segment = nullptr;
            ClosestPoint closest{};
            for (std::size_t i = 0; i <= PathBuffer::capacity; ++i)
            {
                segment = buffer_.active ();
                if (segment == nullptr)
                    break;

                closest = segment->closestPoint (pose.position);
                debug.closestPoint = closest;
                if (closest.t < core::SEGMENT_COMPLETE_T)
                    break;

                buffer_.popActive ();
                ++debug.completedSegments;
                ARCTRACK_LOG_DEBUG ("segment complete at t=%.3f, %zu remaining", static_cast<double> (closest.t), buffer_.size ());
                segment = nullptr;
            }

            if (segment == nullptr)
            {
                if (!done_)
                    ARCTRACK_LOG_DEBUG ("path complete");
                done_ = true;
                pid_.skip ();
                cmd.curvature = 0.0f;
                cmd.velocity = 0.0f;
                cmd.done = true;
            }
            else
            {
                done_ = false;

                const Vector tangent = segment->derivativeAt (closest.t);
                const Vector offset = pose.position - closest.point;
                const float distance = (tangent.cross (offset) > 0.0f) ? offset.magnitude () : -offset.magnitude ();
                const float pathCurvature = segment->curvatureAt (closest.t);
                const float offsetCurv = offsetCurvature (pathCurvature, distance);

                const CrossTrack ct{distance, Direction::fromVector (tangent), pose.direction, elapsed, config.velocity};
                const float adjustCurv = std::visit (
                    [&] (const auto &gains) -> float {
                        using Gains = std::decay_t<decltype (gains)>;
                        if constexpr (std::is_same_v<Gains, SCurveCorrection>)
                        {
                            pid_.skip ();
                            return sCurveCorrection (gains, ct, debug);
                        }
                        else
                            return pidCorrection (gains, ct, pid_, debug);
                    },
                    config.correction);

                cmd.curvature = offsetCurv + adjustCurv;
                cmd.velocity = config.velocity;
                cmd.done = false;

                debug.distanceFrom = distance;
                debug.tangentDirection = ct.tangent;
                debug.pathCurvature = pathCurvature;
                debug.offsetCurvature = offsetCurv;
                debug.adjustCurvature = adjustCurv;
                debug.targetCurvature = cmd.curvature;
            }

            debug.path = buffer_;
            time_ = time;
            return cmd;
        }

        /// @brief Cancel the remaining path; the next update reports done.
        void clear () noexcept { buffer_.clear (); }

        /// @brief Forget the PID integral and previous error (mission restart).
        void resetFeedback () noexcept { pid_.reset (); }

        [[nodiscard]] const PathBuffer &buffer () const noexcept { return buffer_; }
        [[nodiscard]] const PidState &feedbackState () const noexcept { return pid_; }
        [[nodiscard]] std::uint32_t time () const noexcept { return time_; }

      private:
        PathBuffer buffer_{};  ///< Remaining path, active segment on top
        std::uint32_t time_{}; ///< Tick of the previous update
        PidState pid_{};       ///< Feedback-strategy state
        bool done_{true};      ///< Last reported completion (for logging transitions)
    };

} // namespace arctrack::tracking
