#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "BufferedWindow.hpp"
#include "ByteRange.hpp"

namespace renterd::core {

struct ReadPlan {
    enum class Action : uint8_t {
        Noop,
        EndOfObject,
        Serve,
        Fetch
    };

    Action action = Action::Noop;
    // Serve: bytes at the position already buffered. 0 means pull from the body.
    size_t from_buffer = 0;
    // Fetch: range to request.
    ByteRange range;
};

/**
 * @brief Decides whether a read at a position can be served from the open
 * body or needs a new ranged request, and tracks what the open body covers.
 *
 * The negotiator is also the single place that learns the object's total
 * length: from the download-initiation call, from response headers, and from
 * an open-ended body that ends.
 */
class RangeNegotiator {
   public:
    explicit RangeNegotiator(std::optional<uint64_t> total_length = std::nullopt);

    /**
     * @brief Plans a read of `requested_len` bytes at `position`.
     * @param slice_end When set, a Fetch asks for [position, slice_end) only.
     */
    [[nodiscard]] ReadPlan plan(uint64_t position, size_t requested_len,
                                const BufferedWindow& window,
                                std::optional<uint64_t> slice_end = std::nullopt) const;

    [[nodiscard]] std::optional<uint64_t> total_length() const noexcept { return total_length_; }

    /**
     * @brief Records a total length reported by the server.
     * @throws ClientError(Protocol) if it contradicts an earlier observation.
     */
    void observe_total_length(uint64_t total);

    // A response body now delivers `range`.
    void on_body_opened(const ByteRange& range);
    // The open body ended after delivering everything up to `end_offset`.
    void on_body_exhausted(uint64_t end_offset);
    // The open body was dropped (superseded, failed or closed).
    void on_body_released() noexcept;

    [[nodiscard]] bool body_live() const noexcept { return body_range_.has_value() && !exhausted_; }
    [[nodiscard]] const std::optional<ByteRange>& body_range() const noexcept { return body_range_; }

   private:
    std::optional<uint64_t> total_length_;
    std::optional<ByteRange> body_range_;
    bool exhausted_ = false;
};

}  // namespace renterd::core
