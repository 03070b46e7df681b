#pragma once
/**
 * @file   math.hpp
 * @brief  Tiny, constexpr math helpers.
 */

#include <arctrack/core/numeric.hpp>

#include <cmath>
#include <concepts>
#include <numbers>
#include <tuple>
#include <utility>

namespace arctrack::core
{
    /**
     * @brief Wrap an angle to the interval [0, 2π).
     * @tparam T     Floating-point type.
     * @param angle  Angle in radians.
     * @return Angle in [0, 2π).
     */
    template <std::floating_point T> [[nodiscard]] constexpr T normalizeAngle2Pi (T angle) noexcept
    {
        constexpr T pi2 = T{2} * std::numbers::pi_v<T>;
        if (angle >= T{0} && angle < pi2)
            return angle;
        if (angle >= -pi2 && angle < T{0})
        {
            const T wrapped = angle + pi2;
            return (wrapped < pi2) ? wrapped : T{0};
        }
        const T mod = std::fmod (angle, pi2);
        return (mod < T{0}) ? mod + pi2 : mod;
    }

    /**
     * @brief Wrap an angle to the interval [−π, π].
     * @tparam T     Floating-point type.
     * @param angle  Angle in radians.
     * @return Angle in [−π, π] (IEEE remainder, ties may land on either end).
     */
    template <std::floating_point T> [[nodiscard]] constexpr T normalizeAngleSigned (T angle) noexcept
    {
        constexpr T pi2 = T{2} * std::numbers::pi_v<T>;
        return std::remainder (angle, pi2);
    }

    /**
     * @brief Express @p angle on the 2π branch nearest to @p reference.
     * @tparam T         Floating-point type.
     * @param angle      Angle in radians (any branch).
     * @param reference  Reference angle in radians (any branch).
     * @return Angle congruent to @p angle (mod 2π) within [reference − π, reference + π].
     *
     * Subtracting @p reference from the result never jumps by ~2π near the ±π seam.
     */
    template <std::floating_point T> [[nodiscard]] constexpr T unwrapAngleNear (T angle, T reference) noexcept
    {
        return reference + normalizeAngleSigned (angle - reference);
    }

    /**
     * @brief Endpoint of a straight-line segment.
     * @tparam T         Floating-point type.
     * @param x0         Start X.
     * @param y0         Start Y.
     * @param theta      Heading (rad).
     * @param length     Line length.
     * @return ⟨x₁, y₁⟩ of the endpoint.
     */
    template <std::floating_point T> [[nodiscard]] constexpr std::pair<T, T> computeLineEndpoint (T x0, T y0, T theta, T length) noexcept
    {
        return {x0 + length * std::cos (theta), y0 + length * std::sin (theta)};
    }

    /**
     * @brief Endpoint pose of a circular arc.
     * @tparam T         Floating-point type.
     * @param x0         Start X.
     * @param y0         Start Y.
     * @param theta0     Start heading (rad).
     * @param curvature  κ = 1 / radius. If |κ| ≤ CURVATURE_TOL a straight step is used.
     * @param length     Arc length.
     * @return ⟨x₁, y₁, θ₁⟩ of the endpoint. θ₁ is *not* wrapped so headings stay continuous.
     */
    template <std::floating_point T> [[nodiscard]] constexpr std::tuple<T, T, T> computeArcEndpoint (T x0, T y0, T theta0, T curvature, T length) noexcept
    {
        if (std::fabs (curvature) <= static_cast<T> (CURVATURE_TOL))
        {
            const auto [x1, y1] = computeLineEndpoint (x0, y0, theta0, length);
            return {x1, y1, theta0};
        }

        const T theta1 = theta0 + curvature * length;
        const T radius = T{1} / curvature;

        const T x1 = x0 + radius * (-std::sin (theta0) + std::sin (theta1));
        const T y1 = y0 + radius * (std::cos (theta0) - std::cos (theta1));

        return {x1, y1, theta1};
    }

} // namespace arctrack::core
