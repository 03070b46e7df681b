/**
 * @file correction_tests.cpp
 * @brief Unit tests for offset curvature, the s-curve law and the PID law.
 */

#include <arctrack/tracking/correction.hpp>
#include <gtest/gtest.h>

#include <cmath>

using namespace arctrack::core;
using namespace arctrack::tracking;

namespace
{
    constexpr float TOL = 1e-4f;

    CrossTrack onEastLine (float distance, float heading, std::uint32_t elapsed = 1, float velocity = 1.0f)
    {
        return {distance, DIRECTION_0, Direction::fromRadians (heading), elapsed, velocity};
    }
} // namespace

/*────────────────────────── offset curvature ──────────────────────────*/

/// @brief Reference values of the concentric-arc inversion.
TEST (OffsetCurvatureTests, ReferenceValues)
{
    EXPECT_NEAR (offsetCurvature (1.0f, 0.0f), 1.0f, TOL);
    EXPECT_NEAR (offsetCurvature (1.0f, 0.5f), 2.0f, TOL);
    EXPECT_NEAR (offsetCurvature (1.0f, -0.5f), 2.0f / 3.0f, TOL);
    EXPECT_NEAR (offsetCurvature (-1.0f, 0.0f), -1.0f, TOL);
    EXPECT_NEAR (offsetCurvature (-1.0f, 0.5f), -2.0f, TOL);
    EXPECT_NEAR (offsetCurvature (-1.0f, -0.5f), -2.0f / 3.0f, TOL);
    EXPECT_EQ (offsetCurvature (0.0f, 0.5f), 0.0f);
}

/// @brief A straight path never asks for curvature, whatever the offset.
TEST (OffsetCurvatureTests, StraightPath)
{
    for (float d : {-1000.0f, -1.0f, 0.0f, 3.0f, 250.0f})
        EXPECT_EQ (offsetCurvature (0.0f, d), 0.0f);
}

/// @brief Sitting on the turn centre falls back to zero.
TEST (OffsetCurvatureTests, OnTurnCentre)
{
    EXPECT_EQ (offsetCurvature (0.5f, 2.0f), 0.0f);
    EXPECT_EQ (offsetCurvature (-0.5f, -2.0f), 0.0f);
}

/*────────────────────────────── s-curve ───────────────────────────────*/

/// @brief Zero offset on the path, strictly inside (−π/2, π/2) elsewhere.
TEST (SCurveTests, AngleOffsetBounds)
{
    EXPECT_EQ (sCurveAngleOffset (0.05f, 0.0f), 0.0f);
    EXPECT_EQ (sCurveAngleOffset (0.0f, 123.0f), 0.0f);

    for (float d = -150.0f; d <= 150.0f; d += 0.5f)
    {
        const float a = sCurveAngleOffset (0.05f, d);
        EXPECT_GT (a, -PI_OVER_TWO) << "d = " << d;
        EXPECT_LT (a, PI_OVER_TWO) << "d = " << d;
    }
}

/// @brief Strictly decreasing in d for positive strength.
TEST (SCurveTests, AngleOffsetMonotone)
{
    for (float k : {0.01f, 0.05f, 0.2f})
    {
        float previous = sCurveAngleOffset (k, -40.0f);
        for (float d = -39.5f; d <= 40.0f; d += 0.5f)
        {
            const float a = sCurveAngleOffset (k, d);
            EXPECT_LT (a, previous) << "k = " << k << " d = " << d;
            previous = a;
        }
    }
}

/// @brief Left of the path steers right, right of the path steers left.
TEST (SCurveTests, AngleOffsetSign)
{
    EXPECT_LT (sCurveAngleOffset (0.05f, 10.0f), 0.0f);
    EXPECT_GT (sCurveAngleOffset (0.05f, -10.0f), 0.0f);
    EXPECT_NEAR (sCurveAngleOffset (0.05f, 10.0f), -sCurveAngleOffset (0.05f, -10.0f), 1e-6f);
}

/// @brief Curvature is the heading change over the projected distance.
TEST (SCurveTests, CorrectionCurvature)
{
    PathDebug debug{};
    const SCurveCorrection gains{0.05f};
    const CrossTrack ct = onEastLine (10.0f, 0.0f, 2, 0.5f);

    const float adjust = sCurveCorrection (gains, ct, debug);
    const float expected = sCurveAngleOffset (0.05f, 10.0f) / 1.0f;
    EXPECT_NEAR (adjust, expected, TOL);
    EXPECT_LT (adjust, 0.0f);

    ASSERT_TRUE (debug.projectedDistance.has_value ());
    EXPECT_FLOAT_EQ (*debug.projectedDistance, 1.0f);
    ASSERT_TRUE (debug.adjustDirection.has_value ());
    EXPECT_NEAR (debug.adjustDirection->radians (), sCurveAngleOffset (0.05f, 10.0f), TOL);
    ASSERT_TRUE (debug.centeredDirection.has_value ());
    EXPECT_NEAR (*debug.centeredDirection, 0.0f, TOL);
    ASSERT_TRUE (debug.offsetDirection.has_value ());
    EXPECT_NEAR (*debug.offsetDirection, expected, TOL);
}

/// @brief Headings across the ±π seam do not produce a 2π jump.
TEST (SCurveTests, CorrectionAcrossSeam)
{
    PathDebug debug{};
    const SCurveCorrection gains{0.05f};
    // Path heads west (π); the vehicle heading −π + 0.1 is 0.1 rad left of it on the next branch.
    const CrossTrack ct{0.0f, DIRECTION_PI, Direction::fromRadians (-PI + 0.1f), 1, 1.0f};

    const float adjust = sCurveCorrection (gains, ct, debug);
    EXPECT_NEAR (adjust, -0.1f, TOL);
}

/// @brief Zero elapsed time or zero velocity gives no correction.
TEST (SCurveTests, ZeroProjectedDistance)
{
    PathDebug debug{};
    EXPECT_EQ (sCurveCorrection ({0.05f}, onEastLine (10.0f, 0.3f, 0, 1.0f), debug), 0.0f);
    EXPECT_EQ (sCurveCorrection ({0.05f}, onEastLine (10.0f, 0.3f, 5, 0.0f), debug), 0.0f);
    ASSERT_TRUE (debug.projectedDistance.has_value ());
    EXPECT_EQ (*debug.projectedDistance, 0.0f);
}

/// @brief Non-positive strength disables the law and leaves diagnostics empty.
TEST (SCurveTests, Disabled)
{
    PathDebug debug{};
    EXPECT_EQ (sCurveCorrection ({0.0f}, onEastLine (10.0f, 0.5f), debug), 0.0f);
    EXPECT_EQ (sCurveCorrection ({-1.0f}, onEastLine (10.0f, 0.5f), debug), 0.0f);
    EXPECT_FALSE (debug.adjustDirection.has_value ());
    EXPECT_FALSE (debug.projectedDistance.has_value ());
}

/*──────────────────────────────── PID ─────────────────────────────────*/

/// @brief Right of the path (d < 0) steers left (positive curvature).
TEST (PidTests, ProportionalSign)
{
    PidState state;
    PathDebug debug{};
    const PidCorrection gains{0.01f, 0.0f, 0.0f, 0.0f};

    EXPECT_NEAR (pidCorrection (gains, onEastLine (-20.0f, 0.0f), state, debug), 0.2f, TOL);
    EXPECT_NEAR (pidCorrection (gains, onEastLine (20.0f, 0.0f), state, debug), -0.2f, TOL);

    ASSERT_TRUE (debug.pid.has_value ());
    EXPECT_FLOAT_EQ (debug.pid->error, -20.0f);
    EXPECT_FLOAT_EQ (debug.pid->proportional, -0.2f);
}

/// @brief The derivative term is zero on the first step and tracks de/dt after.
TEST (PidTests, DerivativeFirstStep)
{
    PidState state;
    const PidCorrection gains{0.0f, 0.0f, 1.0f, 0.0f};

    const PidTerms first = state.step (gains, 5.0f, 1);
    EXPECT_EQ (first.derivative, 0.0f);
    EXPECT_TRUE (state.primed ());

    const PidTerms second = state.step (gains, 9.0f, 2);
    EXPECT_FLOAT_EQ (second.derivative, 2.0f);

    // Δt = 0 never divides.
    const PidTerms third = state.step (gains, 20.0f, 0);
    EXPECT_EQ (third.derivative, 0.0f);
}

/// @brief The integral accumulates ki·e·Δt; a new ki only weights error from then on.
TEST (PidTests, IntegralPersistsAcrossGainChanges)
{
    PidState state;
    const PidCorrection slow{0.0f, 0.1f, 0.0f, 0.0f};
    const PidCorrection fast{0.0f, 0.5f, 0.0f, 0.0f};

    (void)state.step (slow, 2.0f, 1);
    (void)state.step (slow, 2.0f, 3);
    EXPECT_FLOAT_EQ (state.integral (), 0.8f);

    const PidTerms t = state.step (fast, 1.0f, 2);
    EXPECT_FLOAT_EQ (t.integral, 0.8f + 0.5f * 1.0f * 2.0f);
    EXPECT_FLOAT_EQ (state.integral (), t.integral);

    // Dropping ki to zero freezes the accumulated term.
    const PidTerms frozen = state.step ({1.0f, 0.0f, 0.0f, 0.0f}, 7.0f, 1);
    EXPECT_FLOAT_EQ (frozen.integral, t.integral);
}

/// @brief A positive limit clamps the stored integral symmetrically.
TEST (PidTests, IntegralClamp)
{
    PidState state;
    const PidCorrection gains{0.0f, 1.0f, 0.0f, 4.0f};

    for (int i = 0; i < 10; ++i)
        (void)state.step (gains, 3.0f, 1);
    EXPECT_FLOAT_EQ (state.integral (), 4.0f);

    for (int i = 0; i < 10; ++i)
        (void)state.step (gains, -3.0f, 1);
    EXPECT_FLOAT_EQ (state.integral (), -4.0f);
}

/// @brief Reset forgets the integral and the previous error.
TEST (PidTests, Reset)
{
    PidState state;
    const PidCorrection gains{1.0f, 1.0f, 1.0f, 0.0f};
    (void)state.step (gains, 3.0f, 1);
    (void)state.step (gains, 4.0f, 1);

    state.reset ();
    EXPECT_EQ (state.integral (), 0.0f);
    EXPECT_EQ (state.previousError (), 0.0f);
    EXPECT_FALSE (state.primed ());

    const PidTerms t = state.step (gains, 1.0f, 1);
    EXPECT_EQ (t.derivative, 0.0f);
    EXPECT_FLOAT_EQ (t.integral, 1.0f);
}

/// @brief All-zero gains disable the law; the state only loses its derivative history.
TEST (PidTests, Disabled)
{
    PidState state;
    PathDebug debug{};
    EXPECT_EQ (pidCorrection ({}, onEastLine (-20.0f, 0.0f), state, debug), 0.0f);
    EXPECT_FALSE (state.primed ());
    EXPECT_FALSE (debug.pid.has_value ());

    const PidCorrection gains{0.0f, 0.5f, 1.0f, 0.0f};
    (void)pidCorrection (gains, onEastLine (-20.0f, 0.0f), state, debug);
    ASSERT_TRUE (state.primed ());
    const float integral = state.integral ();

    PathDebug idle{};
    EXPECT_EQ (pidCorrection ({}, onEastLine (-1.0f, 0.0f), state, idle), 0.0f);
    EXPECT_FALSE (state.primed ());
    EXPECT_FLOAT_EQ (state.integral (), integral);
}

/// @brief After skip() the next step has no derivative term.
TEST (PidTests, SkipRestartsDerivative)
{
    PidState state;
    const PidCorrection gains{0.0f, 0.0f, 1.0f, 0.0f};

    (void)state.step (gains, 40.0f, 1);
    state.skip ();
    EXPECT_FALSE (state.primed ());

    const PidTerms resumed = state.step (gains, 1.0f, 98);
    EXPECT_EQ (resumed.derivative, 0.0f);

    const PidTerms next = state.step (gains, 3.0f, 1);
    EXPECT_FLOAT_EQ (next.derivative, 2.0f);
}

/// @brief The output is the sum of the reported terms.
TEST (PidTests, OutputIsSumOfTerms)
{
    PidState state;
    PathDebug debug{};
    const PidCorrection gains{0.002f, 0.0001f, 0.05f, 0.0f};

    (void)pidCorrection (gains, onEastLine (12.0f, 0.0f), state, debug);
    const float out = pidCorrection (gains, onEastLine (10.0f, 0.0f), state, debug);
    ASSERT_TRUE (debug.pid.has_value ());
    EXPECT_FLOAT_EQ (out, debug.pid->proportional + debug.pid->integral + debug.pid->derivative);
    EXPECT_FLOAT_EQ (debug.pid->derivative, 0.05f * 2.0f);
}
