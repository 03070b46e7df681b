#pragma once
/**
 * @file   segment.hpp
 * @brief  One piece of planned path geometry: a corner or a straight line.
 *
 * Consecutive segments usually share endpoints and tangents so the motion is
 * smooth, but nothing requires it (e.g. turning in place).
 */

#include <arctrack/core/direction.hpp>
#include <arctrack/core/vector.hpp>
#include <arctrack/geometry/bezier.hpp>

#include <type_traits>

namespace arctrack::tracking
{
    using arctrack::core::Direction;
    using arctrack::core::Vector;
    using arctrack::geometry::Bezier3;
    using arctrack::geometry::ClosestPoint;

    /**
     * @class Segment
     * @brief Path segment backed by a cubic Bézier (entry at t = 0, exit at t ≥ 1).
     */
    class Segment
    {
      public:
        /// @brief Degenerate segment at the origin (storage filler).
        constexpr Segment () noexcept = default;

        /**
         * @brief Tangent-continuous blend approximating a constant-radius turn.
         * @param center  Intersection of the entry and exit lines.
         * @param entry   Absolute direction of the entry line.
         * @param exit    Absolute direction of the exit line.
         * @param radius  Distance from @p center to the entry and exit points [mm].
         */
        [[nodiscard]] static Segment corner (Vector center, Direction entry, Direction exit, float radius) noexcept
        {
            return Segment{Bezier3{center - entry.unitVector () * radius, center, center, center + exit.unitVector () * radius}};
        }

        /**
         * @brief Straight line from @p start to @p end (curvature 0 everywhere).
         */
        [[nodiscard]] static constexpr Segment line (Vector start, Vector end) noexcept
        {
            const Vector mid = (end - start) * 0.5f + start;
            return Segment{Bezier3{start, mid, mid, end}};
        }

        /**
         * @brief Closest point on the segment to @p position.
         * @return Parameter and point; t ≥ 1 means the segment is complete.
         */
        [[nodiscard]] ClosestPoint closestPoint (Vector position) const noexcept { return curve_.closestPoint (position); }

        /// @brief Tangent vector at @p t (only its direction is meaningful).
        [[nodiscard]] constexpr Vector derivativeAt (float t) const noexcept { return curve_.derivativeAt (t); }

        /// @brief Signed curvature at @p t [rad/mm], positive = left.
        [[nodiscard]] float curvatureAt (float t) const noexcept { return curve_.curvatureAt (t); }

        /// @brief Point on the segment at @p t.
        [[nodiscard]] constexpr Vector pointAt (float t) const noexcept { return curve_.at (t); }

        /// @brief Underlying curve.
        [[nodiscard]] constexpr const Bezier3 &curve () const noexcept { return curve_; }

        [[nodiscard]] constexpr bool operator== (const Segment &) const noexcept = default;

      private:
        explicit constexpr Segment (Bezier3 curve) noexcept : curve_ (curve) {}

        Bezier3 curve_{};
    };

    static_assert (std::is_trivially_copyable_v<Segment>, "Segment must remain trivially copyable");

} // namespace arctrack::tracking
