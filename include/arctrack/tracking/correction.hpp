#pragma once
/**
 * @file   correction.hpp
 * @brief  Cross-track correction laws: offset-curvature inversion, geometric
 *         s-curve and PID feedback.
 *
 * Both correction strategies consume the same @ref CrossTrack input and
 * produce an adjustment curvature that is added to the offset curvature.
 */

#include <arctrack/core/direction.hpp>
#include <arctrack/core/numeric.hpp>
#include <arctrack/tracking/path_config.hpp>
#include <arctrack/tracking/path_debug.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace arctrack::tracking
{
    using arctrack::core::Direction;

    /**
     * @brief Curvature of the arc concentric with the path through the vehicle.
     *
     * The path is modelled locally as a circle of radius r = 1/κ. The arc
     * through the vehicle has radius r − d for κ > 0 and r + d for κ ≤ 0.
     *
     * @param curvature  Path curvature κ at the closest point [rad/mm].
     * @param distance   Signed cross-track distance d [mm] (positive = left).
     * @return Offset curvature; 0 on a straight path or when the vehicle sits on the turn centre.
     */
    [[nodiscard]] inline float offsetCurvature (float curvature, float distance) noexcept
    {
        if (curvature == 0.0f)
            return 0.0f;

        const float r = 1.0f / curvature;
        const float r2 = (curvature > 0.0f) ? r - distance : r + distance;
        if (r2 == 0.0f)
            return 0.0f;
        return 1.0f / r2;
    }

    /**
     * @brief S-curve heading offset π / (1 + exp(k·d)) − π/2.
     *
     * Crosses zero at d = 0 and tends to −π/2 for d → +∞ and to +π/2 for
     * d → −∞: aim straight at the path far away, along it close up.
     *
     * @param offsetP   Strength k [1/mm].
     * @param distance  Signed cross-track distance d [mm].
     * @return Heading offset [rad] to add to the path tangent.
     */
    [[nodiscard]] inline float sCurveAngleOffset (float offsetP, float distance) noexcept
    {
        return core::PI / (1.0f + std::exp (offsetP * distance)) - core::PI_OVER_TWO;
    }

    /**
     * @struct CrossTrack
     * @brief  Geometry of the vehicle relative to the active segment for one tick.
     */
    struct CrossTrack
    {
        float distance{};        ///< Signed cross-track distance d [mm]
        Direction tangent{};     ///< Path tangent heading at the closest point
        Direction heading{};     ///< Current vehicle heading
        std::uint32_t elapsed{}; ///< Ticks since the previous update
        float velocity{};        ///< Cruise velocity [mm/tick]
    };

    /**
     * @brief Geometric s-curve correction.
     *
     * Picks a target heading from the s-curve, then the curvature that would
     * reach it over the distance expected before the next tick
     * (curvature = heading change / arc length).
     *
     * @param gains  S-curve strength.
     * @param ct     Cross-track geometry.
     * @param debug  Receives adjust/centered/offset directions and the projected distance.
     * @return Adjustment curvature [rad/mm]; 0 when disabled or the projected distance is 0.
     */
    [[nodiscard]] inline float sCurveCorrection (const SCurveCorrection &gains, const CrossTrack &ct, PathDebug &debug) noexcept
    {
        if (!gains.enabled ())
            return 0.0f;

        const Direction adjust = ct.tangent + sCurveAngleOffset (gains.offsetP, ct.distance);
        const float projected = static_cast<float> (ct.elapsed) * ct.velocity;
        const float centered = ct.heading.centeredAt (adjust);
        const float angleError = adjust.radians () - centered;

        debug.adjustDirection = adjust;
        debug.centeredDirection = centered;
        debug.offsetDirection = angleError;
        debug.projectedDistance = projected;

        if (projected == 0.0f)
            return 0.0f;
        return angleError / projected;
    }

    /**
     * @class PidState
     * @brief Persistent state of the feedback strategy.
     *
     * The integral is stored already weighted (Σ ki·e·Δt), so re-tuning ki
     * only affects error accumulated from then on. A tick without a PID step
     * un-primes the derivative; the integral is kept.
     */
    class PidState
    {
      public:
        /**
         * @brief Advance one tick.
         * @param gains  Gains for this tick.
         * @param error  e = −d [mm].
         * @param dt     Ticks since the previous step.
         * @return kp·e + Σ ki·e·Δt + kd·de/dt.
         */
        [[nodiscard]] PidTerms step (const PidCorrection &gains, float error, std::uint32_t dt) noexcept
        {
            const float fdt = static_cast<float> (dt);

            integral_ += gains.ki * error * fdt;
            if (gains.integralLimit > 0.0f)
                integral_ = std::clamp (integral_, -gains.integralLimit, gains.integralLimit);

            float rate = 0.0f;
            if (primed_ && dt > 0)
                rate = (error - previousError_) / fdt;

            previousError_ = error;
            primed_ = true;

            return {error, gains.kp * error, integral_, gains.kd * rate};
        }

        /// @brief Mark a tick on which no PID step ran; the next step restarts the derivative.
        void skip () noexcept { primed_ = false; }

        /// @brief Forget the integral and the previous error.
        void reset () noexcept { *this = PidState{}; }

        [[nodiscard]] float integral () const noexcept { return integral_; }
        [[nodiscard]] float previousError () const noexcept { return previousError_; }
        [[nodiscard]] bool primed () const noexcept { return primed_; }

      private:
        float integral_{0.0f};      ///< Σ ki·e·Δt [rad/mm]
        float previousError_{0.0f}; ///< e at the previous step [mm]
        bool primed_{false};        ///< False until the first step
    };

    /**
     * @brief Feedback correction: PID on the cross-track distance.
     * @param gains  Gains, re-read every tick.
     * @param ct     Cross-track geometry.
     * @param state  Controller-owned PID state (only un-primed when disabled).
     * @param debug  Receives the PID terms.
     * @return Adjustment curvature [rad/mm]; positive (left) when the vehicle is right of the path.
     */
    [[nodiscard]] inline float pidCorrection (const PidCorrection &gains, const CrossTrack &ct, PidState &state, PathDebug &debug) noexcept
    {
        if (!gains.enabled ())
        {
            state.skip ();
            return 0.0f;
        }

        const PidTerms terms = state.step (gains, -ct.distance, ct.elapsed);
        debug.pid = terms;
        return terms.proportional + terms.integral + terms.derivative;
    }

} // namespace arctrack::tracking
