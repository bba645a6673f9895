#include "ByteSource.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace renterd::network {

boost::asio::awaitable<size_t> MemoryByteSource::read_some(boost::asio::mutable_buffer buffer) {
    const size_t n = std::min(buffer.size(), data_.size() - offset_);
    std::memcpy(buffer.data(), data_.data() + offset_, n);
    offset_ += n;
    co_return n;
}

boost::asio::awaitable<std::string> ReadToString(ByteSource& source, size_t limit) {
    constexpr size_t CHUNK = 4096;
    std::string out;
    std::array<char, CHUNK> chunk{};
    while (out.size() < limit) {
        size_t want = std::min(chunk.size(), limit - out.size());
        size_t n = co_await source.read_some(boost::asio::buffer(chunk.data(), want));
        if (n == 0) break;
        out.append(chunk.data(), n);
    }
    co_return out;
}

}  // namespace renterd::network
