#pragma once
/**
 * @file   differential_drive.hpp
 * @brief  Curvature + velocity → left/right wheel power for a differential drive.
 */

#include <arctrack/tracking/path_controller.hpp>

#include <type_traits>

namespace arctrack::vehicle
{
    /**
     * @struct MixerConfig
     * @brief  Fixed differential model.
     */
    struct MixerConfig
    {
        float angularGain{0.0f}; ///< Power difference per unit curvature (unit conversion folded in)

        [[nodiscard]] constexpr bool operator== (const MixerConfig &) const noexcept = default;
    };

    /**
     * @struct WheelPowers
     * @brief  Power for each side; positive drives forward.
     */
    struct WheelPowers
    {
        float left{};
        float right{};

        [[nodiscard]] constexpr bool operator== (const WheelPowers &) const noexcept = default;
    };

    /**
     * @brief Mix a curvature and a velocity into wheel powers.
     * @param config     Mixer gain.
     * @param curvature  Target curvature, positive = left.
     * @param velocity   Target velocity.
     * @return left = v − g·κ, right = v + g·κ.
     */
    [[nodiscard]] constexpr WheelPowers mix (const MixerConfig &config, float curvature, float velocity) noexcept
    {
        const float angular = config.angularGain * curvature;
        return {velocity - angular, velocity + angular};
    }

    /**
     * @brief Mix a controller command; a finished path stops both wheels.
     */
    [[nodiscard]] inline WheelPowers mix (const MixerConfig &config, const tracking::TrackingCommand &cmd) noexcept
    {
        if (cmd.done)
            return {0.0f, 0.0f};
        return mix (config, cmd.curvature, cmd.velocity);
    }

    static_assert (std::is_trivially_copyable_v<WheelPowers>, "WheelPowers must remain trivially copyable");

} // namespace arctrack::vehicle
