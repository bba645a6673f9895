#include "BufferedWindow.hpp"

#include <algorithm>
#include <stdexcept>

namespace renterd::core {

BufferedWindow::BufferedWindow(size_t high_water_mark) : high_water_mark_(high_water_mark) {
    if (high_water_mark_ == 0) {
        throw std::invalid_argument("BufferedWindow high-water mark must be > 0");
    }
}

size_t BufferedWindow::free_space() const noexcept {
    return size() >= high_water_mark_ ? 0 : high_water_mark_ - size();
}

void BufferedWindow::reset(uint64_t start) {
    buffer_.clear();
    head_ = 0;
    start_ = start;
    valid_ = true;
}

void BufferedWindow::discard() {
    buffer_.clear();
    buffer_.shrink_to_fit();
    head_ = 0;
    valid_ = false;
}

size_t BufferedWindow::push(std::span<const uint8_t> bytes) {
    const size_t accepted = std::min(bytes.size(), free_space());
    if (accepted == 0) {
        return 0;
    }
    if (head_ > 0 && buffer_.size() + accepted > buffer_.capacity()) {
        compact();
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.begin() + accepted);
    return accepted;
}

size_t BufferedWindow::take(std::span<uint8_t> out) {
    const size_t n = std::min(out.size(), size());
    std::copy_n(buffer_.begin() + head_, n, out.begin());
    head_ += n;
    start_ += n;
    if (head_ == buffer_.size()) {
        buffer_.clear();
        head_ = 0;
    }
    return n;
}

void BufferedWindow::drop_until(uint64_t offset) {
    if (offset <= start_) {
        return;
    }
    if (offset >= end()) {
        buffer_.clear();
        head_ = 0;
        start_ = offset;
        return;
    }
    const auto n = static_cast<size_t>(offset - start_);
    head_ += n;
    start_ += n;
}

void BufferedWindow::unread(std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        return;
    }
    if (bytes.size() <= head_) {
        head_ -= bytes.size();
        std::copy(bytes.begin(), bytes.end(), buffer_.begin() + head_);
    } else {
        compact();
        buffer_.insert(buffer_.begin(), bytes.begin(), bytes.end());
    }
    start_ -= bytes.size();
    valid_ = true;
}

void BufferedWindow::compact() {
    buffer_.erase(buffer_.begin(), buffer_.begin() + head_);
    head_ = 0;
}

}  // namespace renterd::core
