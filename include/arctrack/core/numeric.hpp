#pragma once
/**
 * @file   numeric.hpp
 * @brief  Project-wide numerical constants and tolerances.
 *
 * Keep *all* floating-point comparisons and common constants in one place.
 * The control path runs in single precision, so the ALL_CAPS constants are
 * `float` unless stated otherwise.
 */

#include <cstddef>
#include <limits>
#include <numbers>

namespace arctrack::core
{
    /**
     * @brief Machine epsilon for a given floating-point type.
     * @tparam T Floating-point type.
     */
    template <typename T> inline constexpr T EPSILON_V = std::numeric_limits<T>::epsilon ();

    /**
     * @brief π specialized for a given floating-point type.
     * @tparam T Floating-point type.
     */
    template <typename T> inline constexpr T PI_V = std::numbers::pi_v<T>;

    /*────────────────── Common single-precision constants ──────────────────*/

    /// Machine epsilon (single precision).
    inline constexpr float EPSILON = EPSILON_V<float>;

    /// π in single precision.
    inline constexpr float PI = PI_V<float>;

    /// 2π in single precision.
    inline constexpr float PI2 = 2.0f * PI;

    /// π/2 in single precision.
    inline constexpr float PI_OVER_TWO = PI / 2.0f;

    /*────────────────── Geometry tolerances ────────────────────────────────*/

    /// Curvatures at or below this magnitude [rad/mm] are snapped to exactly zero.
    inline constexpr float CURVATURE_TOL = 1e-6f;

    /// Number of coarse intervals sampled on [0, 1] before Newton refinement.
    inline constexpr std::size_t CLOSEST_POINT_SAMPLES = 16;

    /// Upper bound on Newton iterations for the closest-point search.
    inline constexpr std::size_t CLOSEST_POINT_ITERATIONS = 8;

    /// Newton stops once the parameter moves less than this.
    inline constexpr float CLOSEST_POINT_TOL = 1e-6f;

    /// Largest curve parameter the closest-point search may report (t ≥ 1 ⇒ past the end).
    inline constexpr float CLOSEST_POINT_MAX_T = 2.0f;

    /*────────────────── Path tracking ──────────────────────────────────────*/

    /// Curve parameter at which a segment counts as complete.
    inline constexpr float SEGMENT_COMPLETE_T = 1.0f;

    /// Fixed capacity of the path buffer.
    inline constexpr std::size_t PATH_BUFFER_CAPACITY = 16;

} // namespace arctrack::core
