#pragma once
/**
 * @file   path_config.hpp
 * @brief  Live-reloadable tuning for the path controller.
 *
 * The controller reads the config on every tick, so a new value takes effect
 * immediately without touching controller state.
 */

#include <type_traits>
#include <variant>

namespace arctrack::tracking
{
    /**
     * @struct SCurveCorrection
     * @brief  Geometric s-curve correction.
     *
     * Steers toward a heading that points at the path far away and along it
     * close up. Disabled when @ref offsetP is not positive.
     */
    struct SCurveCorrection
    {
        float offsetP{0.0f}; ///< Strength k of the s-curve [1/mm]

        [[nodiscard]] constexpr bool enabled () const noexcept { return offsetP > 0.0f; }
        [[nodiscard]] constexpr bool operator== (const SCurveCorrection &) const noexcept = default;
    };

    /**
     * @struct PidCorrection
     * @brief  Closed-loop PID on the cross-track distance.
     *
     * Output is the adjustment curvature [rad/mm]. Disabled when all gains are zero.
     */
    struct PidCorrection
    {
        float kp{0.0f};            ///< Proportional gain [rad/mm²]
        float ki{0.0f};            ///< Integral gain [rad/(mm²·tick)]
        float kd{0.0f};            ///< Derivative gain [rad·tick/mm²]
        float integralLimit{0.0f}; ///< Clamp on the integral term [rad/mm]; 0 = unlimited

        [[nodiscard]] constexpr bool enabled () const noexcept { return kp != 0.0f || ki != 0.0f || kd != 0.0f; }
        [[nodiscard]] constexpr bool operator== (const PidCorrection &) const noexcept = default;
    };

    /// Correction strategy, selected by the alternative held.
    using CorrectionConfig = std::variant<SCurveCorrection, PidCorrection>;

    /**
     * @struct PathConfig
     * @brief  Per-tick inputs of @ref PathController::update besides time and pose.
     */
    struct PathConfig
    {
        float velocity{0.0f};                             ///< Cruise velocity [mm/tick]
        CorrectionConfig correction{SCurveCorrection{}}; ///< Cross-track correction strategy

        [[nodiscard]] bool operator== (const PathConfig &) const noexcept = default;
    };

    static_assert (std::is_trivially_copyable_v<SCurveCorrection>);
    static_assert (std::is_trivially_copyable_v<PidCorrection>);

} // namespace arctrack::tracking
