#pragma once
/**
 * @file   circuits.hpp
 * @brief  Reproducible segment lists for tests and the simulator.
 *
 * Every builder returns segments in push order: the destination first, the
 * first segment to drive last, so the list can be handed straight to
 * @ref arctrack::tracking::PathController::addSegments.
 */

#include <arctrack.hpp>

#include <array>
#include <cstddef>

namespace arctrack::utils
{
    using arctrack::core::DIRECTION_0;
    using arctrack::core::DIRECTION_3_PI_2;
    using arctrack::core::DIRECTION_PI;
    using arctrack::core::DIRECTION_PI_2;
    using arctrack::core::Vector;
    using arctrack::tracking::Segment;

    /**
     * @brief Counter-clockwise rounded rectangle.
     *
     * Driving starts on the bottom edge at (start.x + radius, start.y) heading
     * east and ends back at the same point after the corner at @p start.
     *
     * @param start   Bottom-left corner (intersection of the bottom and left edges).
     * @param width   Distance between the left and right edges [mm].
     * @param height  Distance between the bottom and top edges [mm].
     * @param radius  Corner radius [mm] (≤ half of width and height).
     * @return Eight segments in push order.
     */
    inline std::array<Segment, 8> squareCircuit (Vector start = {1170.0f, 1170.0f}, float width = 540.0f, float height = 540.0f, float radius = 180.0f)
    {
        const Vector bottomLeft = start;
        const Vector topLeft = start + Vector{0.0f, height};
        const Vector topRight = start + Vector{width, height};
        const Vector bottomRight = start + Vector{width, 0.0f};

        return {
            Segment::corner (bottomLeft, DIRECTION_3_PI_2, DIRECTION_0, radius),
            Segment::line (topLeft - Vector{0.0f, radius}, bottomLeft + Vector{0.0f, radius}),
            Segment::corner (topLeft, DIRECTION_PI, DIRECTION_3_PI_2, radius),
            Segment::line (topRight - Vector{radius, 0.0f}, topLeft + Vector{radius, 0.0f}),
            Segment::corner (topRight, DIRECTION_PI_2, DIRECTION_PI, radius),
            Segment::line (bottomRight + Vector{0.0f, radius}, topRight - Vector{0.0f, radius}),
            Segment::corner (bottomRight, DIRECTION_0, DIRECTION_PI_2, radius),
            Segment::line (bottomLeft + Vector{radius, 0.0f}, bottomRight - Vector{radius, 0.0f}),
        };
    }

    /**
     * @brief Pose at the beginning of @ref squareCircuit (on the path, heading east).
     */
    inline core::Pose squareCircuitStart (Vector start = {1170.0f, 1170.0f}, float radius = 180.0f)
    {
        return {start + Vector{radius, 0.0f}, DIRECTION_0};
    }

    /**
     * @brief Straight approach followed by a 90° left turn.
     * @param origin  Start of the approach line, driven heading east.
     * @param length  Length of the approach line [mm].
     * @param radius  Turn radius [mm].
     * @return Two segments in push order (turn, then line).
     */
    inline std::array<Segment, 2> lineThenLeftTurn (Vector origin, float length, float radius)
    {
        const Vector corner = origin + Vector{length + radius, 0.0f};
        return {
            Segment::corner (corner, DIRECTION_0, DIRECTION_PI_2, radius),
            Segment::line (origin, origin + Vector{length, 0.0f}),
        };
    }

} // namespace arctrack::utils
