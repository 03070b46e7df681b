#pragma once
/**
 * @file    bezier.hpp
 * @brief   Cubic Bézier curve with closest-point projection, derivatives and signed curvature.
 *
 * Conventions:
 * - Parameter t = 0 is the start, t = 1 the end. Projection may report t > 1
 *   (evaluated on the polynomial extension) to signal "past the end".
 * - Curvature is signed: positive turns left (counter-clockwise).
 */

#include <arctrack/core/numeric.hpp>
#include <arctrack/core/vector.hpp>

#include <boost/geometry.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <type_traits>

namespace arctrack::geometry
{
    namespace bg = boost::geometry;
    using arctrack::core::Vector;

    /**
     * @struct ClosestPoint
     * @brief  Result of projecting a point onto a curve.
     */
    struct ClosestPoint
    {
        float t{};      ///< Curve parameter (may exceed 1)
        Vector point{}; ///< Point on the curve at @ref t

        [[nodiscard]] constexpr bool operator== (const ClosestPoint &) const noexcept = default;
    };

    /**
     * @struct Bezier3
     * @brief  Cubic Bézier curve given by four control points.
     */
    struct Bezier3
    {
        Vector start{}; ///< P0, curve point at t = 0
        Vector ctrl0{}; ///< P1
        Vector ctrl1{}; ///< P2
        Vector end{};   ///< P3, curve point at t = 1

        [[nodiscard]] constexpr bool operator== (const Bezier3 &) const noexcept = default;

        /**
         * @brief Evaluate the curve.
         * @param t  Parameter (any real; values outside [0, 1] extrapolate).
         * @return B(t). Exactly @ref start at t = 0 and @ref end at t = 1.
         */
        [[nodiscard]] constexpr Vector at (float t) const noexcept
        {
            const float u = 1.0f - t;
            const float b0 = u * u * u;
            const float b1 = 3.0f * u * u * t;
            const float b2 = 3.0f * u * t * t;
            const float b3 = t * t * t;
            return start * b0 + ctrl0 * b1 + ctrl1 * b2 + end * b3;
        }

        /// @brief First derivative B′(t) (tangent, not normalized).
        [[nodiscard]] constexpr Vector derivativeAt (float t) const noexcept
        {
            const float u = 1.0f - t;
            return ((ctrl0 - start) * (u * u) + (ctrl1 - ctrl0) * (2.0f * u * t) + (end - ctrl1) * (t * t)) * 3.0f;
        }

        /// @brief Second derivative B″(t).
        [[nodiscard]] constexpr Vector secondDerivativeAt (float t) const noexcept
        {
            const float u = 1.0f - t;
            const Vector a = ctrl1 - ctrl0 * 2.0f + start;
            const Vector b = end - ctrl1 * 2.0f + ctrl0;
            return (a * u + b * t) * 6.0f;
        }

        /**
         * @brief Signed curvature κ(t) = (B′ × B″) / |B′|³.
         * @return Curvature [rad/mm]. Exactly 0 where B′ vanishes or |κ| ≤ CURVATURE_TOL.
         */
        [[nodiscard]] float curvatureAt (float t) const noexcept
        {
            const Vector d1 = derivativeAt (t);
            const Vector d2 = secondDerivativeAt (t);
            const float speed = d1.magnitude ();
            if (speed <= 0.0f)
                return 0.0f;

            const float kappa = d1.cross (d2) / (speed * speed * speed);
            if (!std::isfinite (kappa) || std::fabs (kappa) <= core::CURVATURE_TOL)
                return 0.0f;
            return kappa;
        }

        /**
         * @brief Parameter and point on the curve closest to @p p.
         *
         * Coarse search over evenly spaced parameters in [0, 1] (both ends
         * sampled exactly), then Newton refinement of (B(t) − p)·B′(t) = 0
         * on [0, CLOSEST_POINT_MAX_T]. The result is not clamped to 1.
         */
        [[nodiscard]] ClosestPoint closestPoint (Vector p) const noexcept
        {
            constexpr std::size_t n = core::CLOSEST_POINT_SAMPLES;

            float bestT = 0.0f;
            auto bestDist = bg::comparable_distance (at (0.0f), p);
            for (std::size_t i = 1; i <= n; ++i)
            {
                const float t = static_cast<float> (i) / static_cast<float> (n);
                const auto dist = bg::comparable_distance (at (t), p);
                if (dist < bestDist)
                {
                    bestDist = dist;
                    bestT = t;
                }
            }

            float t = bestT;
            for (std::size_t it = 0; it < core::CLOSEST_POINT_ITERATIONS; ++it)
            {
                const Vector diff = at (t) - p;
                const Vector d1 = derivativeAt (t);
                const Vector d2 = secondDerivativeAt (t);

                const float g = diff.dot (d1);
                const float gPrime = d1.dot (d1) + diff.dot (d2);
                if (g == 0.0f || !(gPrime > 0.0f))
                    break;

                const float next = std::clamp (t - g / gPrime, 0.0f, core::CLOSEST_POINT_MAX_T);
                if (!std::isfinite (next))
                    break;
                const bool converged = std::fabs (next - t) < core::CLOSEST_POINT_TOL;
                t = next;
                if (converged)
                    break;
            }

            // Refinement must never be worse than the best coarse sample.
            if (bg::comparable_distance (at (t), p) > bestDist)
                t = bestT;

            return {t, at (t)};
        }
    };

    static_assert (std::is_trivially_copyable_v<Bezier3>, "Bezier3 must remain trivially copyable");

} // namespace arctrack::geometry
