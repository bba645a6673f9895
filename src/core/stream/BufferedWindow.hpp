#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace renterd::core {

/**
 * @brief Bytes pulled from the current response body but not yet handed to
 * the reader.
 *
 * Covers the contiguous span [start(), end()) of the object. Consumed bytes
 * are only dropped from storage when room is needed for new ones, so taking
 * is O(1) and unread() after a failed read rarely copies.
 *
 * The stream offers at most free_space() bytes to push(), which keeps the
 * buffered amount under the high-water mark and turns it into backpressure on
 * the response body.
 */
class BufferedWindow {
   public:
    explicit BufferedWindow(size_t high_water_mark);

    [[nodiscard]] bool valid() const noexcept { return valid_; }
    [[nodiscard]] uint64_t start() const noexcept { return start_; }
    [[nodiscard]] uint64_t end() const noexcept { return start_ + size(); }
    [[nodiscard]] size_t size() const noexcept { return buffer_.size() - head_; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] size_t high_water_mark() const noexcept { return high_water_mark_; }
    [[nodiscard]] size_t free_space() const noexcept;

    // Re-anchor an empty, valid window at `start`.
    void reset(uint64_t start);

    // Release all bytes and invalidate the window.
    void discard();

    // Append to the tail. Returns the number of bytes accepted.
    size_t push(std::span<const uint8_t> bytes);

    // Move up to out.size() bytes from the head into `out`.
    size_t take(std::span<uint8_t> out);

    // Drop bytes before `offset`. Offsets past end() empty the window there.
    void drop_until(uint64_t offset);

    // Put bytes back in front of the head; start() moves back by bytes.size().
    void unread(std::span<const uint8_t> bytes);

   private:
    void compact();

    std::vector<uint8_t> buffer_;
    size_t head_ = 0;
    uint64_t start_ = 0;
    size_t high_water_mark_;
    bool valid_ = false;
};

}  // namespace renterd::core
