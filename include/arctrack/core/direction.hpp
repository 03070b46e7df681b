#pragma once
/**
 * @file   direction.hpp
 * @brief  Continuous heading type with branch-aware comparison and unwrapping.
 */

#include <arctrack/core/math.hpp>
#include <arctrack/core/numeric.hpp>
#include <arctrack/core/vector.hpp>

#include <cmath>
#include <type_traits>

namespace arctrack::core
{
    /**
     * @class Direction
     * @brief Heading in radians.
     *
     * The stored angle is continuous (never wrapped) so sums of offsets stay
     * smooth. Comparison is on the normalized angle. Use @ref centeredAt to
     * subtract two headings without a spurious 2π jump.
     */
    class Direction
    {
      public:
        constexpr Direction () noexcept = default;

        /// @brief Heading of @p radians (any branch).
        [[nodiscard]] static constexpr Direction fromRadians (float radians) noexcept { return Direction{radians}; }

        /// @brief Heading of a vector, atan2(y, x). The zero vector maps to 0.
        [[nodiscard]] static Direction fromVector (Vector v) noexcept { return Direction{std::atan2 (v.y, v.x)}; }

        /// @brief Raw continuous angle [rad].
        [[nodiscard]] constexpr float radians () const noexcept { return angle_; }

        /// @brief Angle wrapped to [−π, π].
        [[nodiscard]] float normalized () const noexcept { return normalizeAngleSigned (angle_); }

        /// @brief Unit vector pointing along this heading.
        [[nodiscard]] Vector unitVector () const noexcept { return {std::cos (angle_), std::sin (angle_)}; }

        /**
         * @brief This heading expressed on the branch nearest @p reference.
         * @param reference  Heading whose raw angle selects the branch.
         * @return Angle in [reference.radians() − π, reference.radians() + π].
         */
        [[nodiscard]] float centeredAt (Direction reference) const noexcept { return unwrapAngleNear (angle_, reference.angle_); }

        [[nodiscard]] constexpr Direction operator+ (Direction o) const noexcept { return Direction{angle_ + o.angle_}; }
        [[nodiscard]] constexpr Direction operator+ (float offset) const noexcept { return Direction{angle_ + offset}; }
        [[nodiscard]] constexpr Direction operator- (float offset) const noexcept { return Direction{angle_ - offset}; }

        /// @brief Equal when the normalized angles are equal (2π-periodic).
        [[nodiscard]] bool operator== (Direction o) const noexcept { return normalizeAngle2Pi (angle_) == normalizeAngle2Pi (o.angle_); }

      private:
        explicit constexpr Direction (float radians) noexcept : angle_ (radians) {}

        float angle_{0.0f}; ///< Continuous angle [rad]
    };

    static_assert (std::is_trivially_copyable_v<Direction>, "Direction must remain trivially copyable");

    /*────────────────── Cardinal headings ──────────────────*/

    inline constexpr Direction DIRECTION_0 = Direction::fromRadians (0.0f);
    inline constexpr Direction DIRECTION_PI_2 = Direction::fromRadians (PI_OVER_TWO);
    inline constexpr Direction DIRECTION_PI = Direction::fromRadians (PI);
    inline constexpr Direction DIRECTION_3_PI_2 = Direction::fromRadians (3.0f * PI_OVER_TWO);

} // namespace arctrack::core
