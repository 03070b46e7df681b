#pragma once
/**
 * @file   arctrack.hpp
 * @brief  Umbrella header – include the full arctrack public interface.
 *
 * Include this single header in a translation unit to access the entire API:
 *  - Core primitives (vector, direction, pose, math, numeric constants, logging)
 *  - Geometry (cubic Bézier curve)
 *  - Tracking (segments, path buffer, correction laws, path controller)
 *  - Vehicle command mixer and YAML configuration
 */

/*──────────────────────────── Core ────────────────────────────*/
#include <arctrack/core/direction.hpp>
#include <arctrack/core/log.hpp>
#include <arctrack/core/math.hpp>
#include <arctrack/core/numeric.hpp>
#include <arctrack/core/pose.hpp>
#include <arctrack/core/vector.hpp>

/*────────────────────────── Geometry ──────────────────────────*/
#include <arctrack/geometry/bezier.hpp>

/*────────────────────────── Tracking ──────────────────────────*/
#include <arctrack/tracking/correction.hpp>
#include <arctrack/tracking/path_buffer.hpp>
#include <arctrack/tracking/path_config.hpp>
#include <arctrack/tracking/path_controller.hpp> // Steering law
#include <arctrack/tracking/path_debug.hpp>
#include <arctrack/tracking/segment.hpp>

/*────────────────────── Vehicle & config ──────────────────────*/
#include <arctrack/config/config_watcher.hpp>
#include <arctrack/config/tracker_config.hpp>
#include <arctrack/vehicle/differential_drive.hpp>
