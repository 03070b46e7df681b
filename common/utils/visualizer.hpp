#pragma once
/**
 * @file
 * @brief Lightweight SVG visualizer for tracked paths and simulated runs.
 *
 * Header-only helper to export simple SVG figures that show:
 *  - the planned segments (sampled as polylines, corners and lines colored apart),
 *  - segment endpoints,
 *  - the trail actually driven, and
 *  - start/final poses.
 *
 * The visualizer auto-fits the world extents of the first drawn geometry into a
 * square canvas and flips the Y axis for SVG (world Y up).
 */

#include <arctrack.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace arctrack::utils
{
    /**
     * @brief Simple color palette for the SVG output.
     */
    struct Palette
    {
        std::string canvasBackground = "#373639ff"; ///< Background color for the entire generated image.
        std::string pathLine = "#dcdfd3ff";         ///< Stroke color for straight segments.
        std::string pathCorner = "#88d8b0";         ///< Stroke color for curved segments.
        std::string endpoint = "#6d737fff";         ///< Fill color for segment endpoints.
        std::string trail = "#ffb300ff";            ///< Stroke color for the driven trail.
        std::string startPose = "#033aa9ff";        ///< Fill color for the start pose marker.
        std::string goalPose = "#03a940ff";         ///< Fill color for the final pose marker.
        std::string axes = "#c0c5ce";               ///< Stroke color for axes.
    };

    /**
     * @brief SVG visualizer that auto-fits world geometry to a square canvas.
     *
     * Typical usage:
     * @code
     *   Visualizer viz("out.svg");
     *   viz.drawSegments(segments);
     *   viz.drawTrail(poses);
     *   viz.drawStartPose(poses.front());
     *   viz.drawGoalPose(poses.back());
     * @endcode
     */
    class Visualizer
    {
      public:
        /**
         * @brief Construct a visualizer bound to an output file.
         * @param filename   Target SVG file path.
         * @param canvasPx   Square canvas size in pixels (width = height = canvasPx).
         * @param palette    Optional color palette (defaults provided).
         */
        explicit Visualizer (std::string_view filename, int canvasPx = 800, Palette palette = {})
            : canvasPx_ (canvasPx), palette_ (std::move (palette)), out_ (std::string (filename), std::ios::trunc)
        {
            if (!out_)
                ARCTRACK_LOG_ERROR ("cannot open SVG output %.*s", static_cast<int> (filename.size ()), filename.data ());
            resetWorldExtents ();
        }

        /// @brief Flush and close the SVG file if still open.
        ~Visualizer () { finish (); }

        Visualizer (const Visualizer &) = delete;
        Visualizer &operator= (const Visualizer &) = delete;

        /// @brief True if the output file is open for writing.
        [[nodiscard]] bool good () const { return out_.is_open () && out_.good (); }

        [[nodiscard]] const Palette &getPalette () const { return palette_; }

        /**
         * @brief Draw Cartesian axes through the canvas center.
         * @param stroke  Stroke width in pixels.
         */
        void drawAxes (double stroke = 0.5)
        {
            ensureHeader ();
            const double cx = canvasWidth_ / 2.0;
            const double cy = canvasHeight_ / 2.0;
            lineSvg (0, cy, canvasWidth_, cy, palette_.axes, stroke);
            lineSvg (cx, 0, cx, canvasHeight_, palette_.axes, stroke);
        }

        /**
         * @brief Draw planned segments as sampled polylines with endpoint dots.
         * @param segments  Segments in any order.
         * @param samples   Polyline vertices per segment (≥ 2).
         * @param stroke    Stroke width in pixels.
         */
        void drawSegments (std::span<const tracking::Segment> segments, std::size_t samples = 32, double stroke = 2.0)
        {
            if (segments.empty ())
                return;
            samples = std::max<std::size_t> (samples, 2);

            for (const auto &segment : segments)
                for (std::size_t i = 0; i < samples; ++i)
                {
                    const core::Vector p = segment.pointAt (sampleT (i, samples));
                    trackWorld (p.x, p.y);
                }

            ensureHeader ();

            for (const auto &segment : segments)
            {
                const bool straight = segment.curvatureAt (0.0f) == 0.0f && segment.curvatureAt (0.5f) == 0.0f;
                const std::string &color = straight ? palette_.pathLine : palette_.pathCorner;

                out_ << R"(  <polyline fill="none" stroke=")" << color << R"(" stroke-width=")" << stroke << R"(" points=")";
                for (std::size_t i = 0; i < samples; ++i)
                {
                    const core::Vector p = segment.pointAt (sampleT (i, samples));
                    const auto [x, y] = toSvg (p.x, p.y);
                    out_ << x << ',' << y << ' ';
                }
                out_ << "\"/>\n";
            }

            for (const auto &segment : segments)
            {
                circleWorld (segment.curve ().start.x, segment.curve ().start.y, 2.5, palette_.endpoint);
                circleWorld (segment.curve ().end.x, segment.curve ().end.y, 2.5, palette_.endpoint);
            }
        }

        /**
         * @brief Draw the positions of a pose history as one polyline.
         * @param poses   Poses in time order.
         * @param color   Optional stroke color (defaults to @ref Palette::trail).
         * @param stroke  Stroke width in pixels.
         */
        void drawTrail (std::span<const core::Pose> poses, std::string color = {}, double stroke = 1.0, double opacity = 0.9)
        {
            if (poses.size () < 2)
                return;

            for (const auto &p : poses)
                trackWorld (p.position.x, p.position.y);

            ensureHeader ();

            if (color.empty ())
                color = palette_.trail;

            out_ << R"(  <polyline fill="none" stroke=")" << color << R"(" stroke-width=")" << stroke << R"(" stroke-opacity=")" << opacity << R"(" points=")";
            for (const auto &p : poses)
            {
                const auto [x, y] = toSvg (p.position.x, p.position.y);
                out_ << x << ',' << y << ' ';
            }
            out_ << "\"/>\n";
        }

        /**
         * @brief Draw a triangular pose marker pointing along the pose heading.
         * @param pose   Pose to draw.
         * @param rPx    Marker size (approximate radius in pixels).
         * @param color  Fill color for the marker.
         */
        void drawPose (const core::Pose &pose, double rPx, const std::string &color)
        {
            trackWorld (pose.position.x, pose.position.y);
            ensureHeader ();

            const double heading = pose.direction.radians ();
            const auto [cx, cy] = toSvg (pose.position.x, pose.position.y);
            const double dx = std::cos (heading) * rPx;
            const double dy = -std::sin (heading) * rPx; // flip Y for SVG

            const double ax = cx + dx;
            const double ay = cy + dy;
            const double bx = cx - 0.5 * dx + 0.35 * dy;
            const double by = cy - 0.5 * dy - 0.35 * dx;
            const double cx2 = cx - 0.5 * dx - 0.35 * dy;
            const double cy2 = cy - 0.5 * dy + 0.35 * dx;

            out_ << "  <polygon fill=\"" << color << "\" points=\"" << ax << ',' << ay << ' ' << bx << ',' << by << ' ' << cx2 << ',' << cy2 << "\"/>\n";
        }

        void drawStartPose (const core::Pose &pose, double rPx = 9.0) { drawPose (pose, rPx, palette_.startPose); }
        void drawGoalPose (const core::Pose &pose, double rPx = 9.0) { drawPose (pose, rPx, palette_.goalPose); }

        /// @brief Finalize the SVG (idempotent). Called automatically by the destructor.
        void finish ()
        {
            if (out_.is_open ())
            {
                ensureHeader ();
                out_ << " </g>\n</svg>\n";
                out_.close ();
            }
        }

      private:
        [[nodiscard]] static float sampleT (std::size_t i, std::size_t samples) { return static_cast<float> (i) / static_cast<float> (samples - 1); }

        /*──────────────────── header & transforms ──────────────────────*/

        /// @brief Reset world extents to ±∞ sentinels.
        void resetWorldExtents ()
        {
            xMinWorld_ = std::numeric_limits<double>::infinity ();
            xMaxWorld_ = -xMinWorld_;
            yMinWorld_ = xMinWorld_;
            yMaxWorld_ = -xMinWorld_;
        }

        /// @brief Expand stored world extents to include (x,y).
        void trackWorld (double x, double y)
        {
            xMinWorld_ = std::min (xMinWorld_, x);
            xMaxWorld_ = std::max (xMaxWorld_, x);
            yMinWorld_ = std::min (yMinWorld_, y);
            yMaxWorld_ = std::max (yMaxWorld_, y);
        }

        /// @brief Ensure the SVG header/group has been written (runs auto-fit first if needed).
        void ensureHeader ()
        {
            if (svgOpen_)
                return;
            autoFit ();
            beginSvg ();
        }

        /// @brief Compute an automatic scale/offset to center-fit world geometry into the canvas.
        void autoFit ()
        {
            if (!std::isfinite (xMinWorld_))
                return;

            const double dx = xMaxWorld_ - xMinWorld_;
            const double dy = yMaxWorld_ - yMinWorld_;
            const double half = std::max (dx, dy) / 2.0;
            if (half < 1e-9)
                return; // degenerate

            scale_ = (1.0 - margin_) * canvasPx_ / (2.0 * half);
            offsetX_ = -(xMinWorld_ + xMaxWorld_) / 2.0;
            offsetY_ = -(yMinWorld_ + yMaxWorld_) / 2.0;
        }

        /// @brief Begin the SVG document and open a root <g> group.
        void beginSvg ()
        {
            canvasWidth_ = canvasHeight_ = canvasPx_;
            out_ << R"(<?xml version="1.0"?>)"
                 << "\n<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << canvasWidth_ << "\" height=\"" << canvasHeight_ << "\" viewBox=\"0 0 " << canvasWidth_ << ' '
                 << canvasHeight_ << "\">\n"
                 << "  <rect width=\"" << canvasWidth_ << "\" height=\"" << canvasHeight_ << "\" fill=\"" << palette_.canvasBackground << "\"/>\n"
                 << "  <g>\n";
            svgOpen_ = true;
        }

        /**
         * @brief Convert world coordinates to canvas (SVG) coordinates.
         * @return Pair {xCanvas, yCanvas}. Y is flipped for SVG.
         */
        [[nodiscard]] std::pair<double, double> toSvg (double xw, double yw) const
        {
            const double x = (xw + offsetX_) * scale_ + canvasWidth_ / 2.0;
            const double y = (yw + offsetY_) * scale_ + canvasHeight_ / 2.0;
            return {x, canvasHeight_ - y}; // flip Y
        }

        /*──────────────────── low-level SVG helpers ────────────────────*/

        void lineSvg (double x0, double y0, double x1, double y1, const std::string &color, double width)
        {
            out_ << "  <line x1=\"" << x0 << "\" y1=\"" << y0 << "\" x2=\"" << x1 << "\" y2=\"" << y1 << "\" stroke=\"" << color << "\" stroke-width=\"" << width << "\"/>\n";
        }

        void circleWorld (double x, double y, double rPx, const std::string &color)
        {
            const auto [cx, cy] = toSvg (x, y);
            out_ << "  <circle cx=\"" << cx << "\" cy=\"" << cy << "\" r=\"" << rPx << "\" fill=\"" << color << "\" stroke=\"none\"/>\n";
        }

        /*────────────────────────── data ───────────────────────────────*/
        int canvasPx_;      ///< Canvas size (square) in pixels.
        Palette palette_;   ///< Active color palette.
        std::ofstream out_; ///< Output SVG stream.

        double xMinWorld_; ///< Tracked world extents (min X).
        double xMaxWorld_; ///< Tracked world extents (max X).
        double yMinWorld_; ///< Tracked world extents (min Y).
        double yMaxWorld_; ///< Tracked world extents (max Y).

        double scale_ = 1.0;   ///< Pixels per world unit.
        double offsetX_ = 0.0; ///< World X offset applied before scaling.
        double offsetY_ = 0.0; ///< World Y offset applied before scaling.
        double margin_ = 0.05; ///< Fractional margin for auto-fit.

        bool svgOpen_ = false; ///< Whether the SVG header/group is open.
        int canvasWidth_ = 0;  ///< Canvas width in pixels.
        int canvasHeight_ = 0; ///< Canvas height in pixels.
    };

} // namespace arctrack::utils
