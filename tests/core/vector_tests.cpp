/**
 * @file vector_tests.cpp
 * @brief Unit tests for the Vector value type and its Boost.Geometry adaptation.
 */

#include <arctrack/core/vector.hpp>

// Checked before <boost/geometry.hpp> so vector.hpp must carry its own trait headers.
static_assert (boost::geometry::traits::dimension<arctrack::core::Vector>::value == 2);
static_assert (std::is_same_v<boost::geometry::traits::coordinate_type<arctrack::core::Vector>::type, float>);

#include <boost/geometry.hpp>
#include <gtest/gtest.h>

using arctrack::core::Vector;
namespace bg = boost::geometry;

/// @brief Component-wise arithmetic.
TEST (VectorTests, Arithmetic)
{
    constexpr Vector a{3.0f, 4.0f};
    constexpr Vector b{1.0f, -2.0f};

    static_assert (a + b == Vector{4.0f, 2.0f});
    EXPECT_EQ (a - b, (Vector{2.0f, 6.0f}));
    EXPECT_EQ (-a, (Vector{-3.0f, -4.0f}));
    EXPECT_EQ (a * 2.0f, (Vector{6.0f, 8.0f}));
    EXPECT_EQ (0.5f * a, (Vector{1.5f, 2.0f}));
}

/// @brief Dot, cross and magnitude.
TEST (VectorTests, Products)
{
    const Vector a{3.0f, 4.0f};
    EXPECT_FLOAT_EQ (a.magnitude (), 5.0f);
    EXPECT_FLOAT_EQ (a.dot ({1.0f, 0.0f}), 3.0f);

    const Vector east{1.0f, 0.0f};
    EXPECT_GT (east.cross ({0.0f, 50.0f}), 0.0f);  // left of east
    EXPECT_LT (east.cross ({0.0f, -50.0f}), 0.0f); // right of east
    EXPECT_EQ (east.cross ({10.0f, 0.0f}), 0.0f);  // collinear
}

/// @brief Registered as a Boost.Geometry point.
TEST (VectorTests, BoostGeometryPoint)
{
    const Vector a{0.0f, 0.0f};
    const Vector b{3.0f, 4.0f};
    EXPECT_FLOAT_EQ (static_cast<float> (bg::distance (a, b)), 5.0f);
    EXPECT_FLOAT_EQ (bg::get<0> (b), 3.0f);
    EXPECT_FLOAT_EQ (bg::get<1> (b), 4.0f);
}
