#pragma once
/**
 * @file   pose.hpp
 * @brief  Vehicle pose supplied by the estimator each tick.
 */

#include <arctrack/core/direction.hpp>
#include <arctrack/core/vector.hpp>

#include <type_traits>

namespace arctrack::core
{
    /**
     * @struct Pose
     * @brief  Position and heading valid for the current tick.
     */
    struct Pose
    {
        Vector position{};     ///< Position [mm]
        Direction direction{}; ///< Heading

        [[nodiscard]] bool operator== (const Pose &) const noexcept = default;
    };

    static_assert (std::is_trivially_copyable_v<Pose>, "Pose must remain trivially copyable");

} // namespace arctrack::core
