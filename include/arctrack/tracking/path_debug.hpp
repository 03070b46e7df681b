#pragma once
/**
 * @file   path_debug.hpp
 * @brief  Per-tick diagnostics of the path controller.
 *
 * Pure observability: nothing here is ever read back into control decisions.
 * A field stays empty when the branch that computes it did not run.
 */

#include <arctrack/core/direction.hpp>
#include <arctrack/geometry/bezier.hpp>
#include <arctrack/tracking/path_buffer.hpp>

#include <cstdint>
#include <optional>

namespace arctrack::tracking
{
    /**
     * @struct PidTerms
     * @brief  Individual contributions of the feedback strategy.
     */
    struct PidTerms
    {
        float error{};        ///< e = −d [mm]
        float proportional{}; ///< kp·e
        float integral{};     ///< Σ ki·e·Δt
        float derivative{};   ///< kd·de/dt

        [[nodiscard]] constexpr bool operator== (const PidTerms &) const noexcept = default;
    };

    /**
     * @struct PathDebug
     * @brief  Every intermediate value of one @ref PathController::update call.
     */
    struct PathDebug
    {
        std::optional<PathBuffer> path;                     ///< Remaining segments after the tick
        std::uint8_t completedSegments{0};                  ///< Segments popped during the tick
        std::optional<geometry::ClosestPoint> closestPoint; ///< Projection onto the active segment
        std::optional<float> distanceFrom;                  ///< Signed cross-track distance d [mm]
        std::optional<core::Direction> tangentDirection;    ///< Path heading at the closest point
        std::optional<float> pathCurvature;                 ///< Path curvature at the closest point
        std::optional<float> offsetCurvature;               ///< Curvature of the concentric arc through the vehicle
        std::optional<core::Direction> adjustDirection;     ///< S-curve target heading
        std::optional<float> centeredDirection;             ///< Heading unwrapped near adjustDirection [rad]
        std::optional<float> offsetDirection;               ///< adjustDirection − centeredDirection [rad]
        std::optional<float> projectedDistance;             ///< Δt·velocity [mm]
        std::optional<PidTerms> pid;                        ///< Feedback-strategy terms
        std::optional<float> adjustCurvature;               ///< Correction curvature
        std::optional<float> targetCurvature;               ///< Commanded curvature

        [[nodiscard]] bool operator== (const PathDebug &) const noexcept = default;
    };

} // namespace arctrack::tracking
