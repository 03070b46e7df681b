#pragma once
/**
 * @file   path_buffer.hpp
 * @brief  Fixed-capacity stack of the segments that remain to be tracked.
 */

#include <arctrack/core/numeric.hpp>
#include <arctrack/tracking/segment.hpp>

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <type_traits>

namespace arctrack::tracking
{
    /**
     * @brief  Bounded LIFO stack of @ref Segment.
     *
     * Segments are stored in insertion order; the most recently added one is
     * the *active* segment and completed segments are removed from that same
     * end. No heap allocation.
     *
     * @tparam N  Capacity.
     */
    template <std::size_t N> class SegmentStack
    {
        static_assert (N <= std::numeric_limits<std::uint8_t>::max (), "SegmentStack<N>: N must be ≤ 255 because 'n_' is uint8_t.");

      public:
        static constexpr std::size_t capacity = N;

        /**
         * @brief Push a batch of segments, first element first.
         * @param segments  Segments to append; the last one becomes active.
         * @return Free slots left on success, or the index of the first
         *         segment that did not fit. Segments before that index stay
         *         pushed; nothing else is touched.
         */
        [[nodiscard]] std::expected<std::size_t, std::size_t> addSegments (std::span<const Segment> segments) noexcept
        {
            for (std::size_t i = 0; i < segments.size (); ++i)
            {
                if (!push (segments[i]))
                    return std::unexpected (i);
            }
            return freeSlots ();
        }

        /**
         * @brief Push one segment.
         * @return False if the stack is full (contents unchanged).
         */
        constexpr bool push (const Segment &segment) noexcept
        {
            assert (n_ <= N && "SegmentStack count beyond capacity");
            if (n_ >= N)
                return false;
            buf_[n_++] = segment;
            return true;
        }

        /// @brief Segment currently tracked, or nullptr when empty.
        [[nodiscard]] constexpr const Segment *active () const noexcept { return n_ > 0 ? &buf_[n_ - 1] : nullptr; }

        /// @brief Remove and return the active segment.
        constexpr std::optional<Segment> popActive () noexcept
        {
            if (n_ == 0)
                return std::nullopt;
            return buf_[--n_];
        }

        /// @brief Drop every segment.
        constexpr void clear () noexcept { n_ = 0; }

        [[nodiscard]] constexpr std::size_t size () const noexcept { return n_; }
        [[nodiscard]] constexpr bool empty () const noexcept { return n_ == 0; }
        [[nodiscard]] constexpr bool full () const noexcept { return n_ == N; }
        [[nodiscard]] constexpr std::size_t freeSlots () const noexcept { return N - n_; }

        /**
         * @brief  Read-only view in insertion order (active segment last).
         * @return Span of size @ref size.
         */
        [[nodiscard]] constexpr std::span<const Segment> view () const noexcept { return {buf_.data (), static_cast<std::size_t> (n_)}; }

        /// @brief Equal when the live segments are equal (unused slots ignored).
        [[nodiscard]] constexpr bool operator== (const SegmentStack &o) const noexcept
        {
            if (n_ != o.n_)
                return false;
            for (std::size_t i = 0; i < n_; ++i)
                if (!(buf_[i] == o.buf_[i]))
                    return false;
            return true;
        }

      private:
        std::array<Segment, N> buf_{}; ///< Inline storage.
        std::uint8_t n_{0};            ///< Number of live segments (≤ N).
    };

    /// The controller's path buffer.
    using PathBuffer = SegmentStack<core::PATH_BUFFER_CAPACITY>;

    static_assert (std::is_trivially_copyable_v<PathBuffer>, "PathBuffer must remain trivially copyable");

} // namespace arctrack::tracking
