#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace renterd::network {

/**
 * @brief An incremental source of bytes: a response body being received, or
 * the content of a request being uploaded.
 *
 * Destroying a source releases whatever it reads from (for response bodies,
 * the connection).
 */
class ByteSource {
   public:
    virtual ~ByteSource() = default;

    /**
     * @brief Reads up to buffer.size() bytes.
     * @return Bytes read; 0 only at the end of the source.
     */
    virtual boost::asio::awaitable<size_t> read_some(boost::asio::mutable_buffer buffer) = 0;
};

/// Byte source over an in-memory copy of `data`.
class MemoryByteSource : public ByteSource {
   public:
    explicit MemoryByteSource(std::vector<uint8_t> data) : data_(std::move(data)) {}

    boost::asio::awaitable<size_t> read_some(boost::asio::mutable_buffer buffer) override;

   private:
    std::vector<uint8_t> data_;
    size_t offset_ = 0;
};

/**
 * @brief Drains a source into a string, stopping after `limit` bytes.
 */
boost::asio::awaitable<std::string> ReadToString(ByteSource& source, size_t limit);

}  // namespace renterd::network
