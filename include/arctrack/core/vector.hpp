#pragma once
/**
 * @file   vector.hpp
 * @brief  2-D vector value type (millimetres), adapted as a Boost.Geometry point.
 */

#include <boost/geometry/core/access.hpp>
#include <boost/geometry/core/coordinate_dimension.hpp>
#include <boost/geometry/core/coordinate_system.hpp>
#include <boost/geometry/core/coordinate_type.hpp>
#include <boost/geometry/core/cs.hpp>
#include <boost/geometry/core/tag.hpp>
#include <boost/geometry/core/tags.hpp>
#include <boost/geometry/geometries/register/point.hpp>

#include <cmath>
#include <type_traits>

namespace arctrack::core
{
    /**
     * @struct Vector
     * @brief  Immutable-by-convention 2-D vector / point in millimetres.
     */
    struct Vector
    {
        float x{}; ///< X component [mm]
        float y{}; ///< Y component [mm]

        [[nodiscard]] constexpr Vector operator+ (Vector o) const noexcept { return {x + o.x, y + o.y}; }
        [[nodiscard]] constexpr Vector operator- (Vector o) const noexcept { return {x - o.x, y - o.y}; }
        [[nodiscard]] constexpr Vector operator- () const noexcept { return {-x, -y}; }
        [[nodiscard]] constexpr Vector operator* (float s) const noexcept { return {x * s, y * s}; }
        [[nodiscard]] friend constexpr Vector operator* (float s, Vector v) noexcept { return v * s; }

        [[nodiscard]] constexpr bool operator== (const Vector &) const noexcept = default;

        /// @brief Dot product.
        [[nodiscard]] constexpr float dot (Vector o) const noexcept { return x * o.x + y * o.y; }

        /**
         * @brief Scalar 2-D cross product (z of the 3-D cross product).
         *
         * Positive when @p o points to the left of this vector.
         */
        [[nodiscard]] constexpr float cross (Vector o) const noexcept { return x * o.y - y * o.x; }

        /// @brief Euclidean length.
        [[nodiscard]] float magnitude () const noexcept { return std::hypot (x, y); }
    };

    static_assert (std::is_trivially_copyable_v<Vector>, "Vector must remain trivially copyable");

} // namespace arctrack::core

BOOST_GEOMETRY_REGISTER_POINT_2D (arctrack::core::Vector, float, boost::geometry::cs::cartesian, x, y)
