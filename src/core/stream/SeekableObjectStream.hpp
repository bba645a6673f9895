#pragma once

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "BufferedWindow.hpp"
#include "ByteRange.hpp"
#include "RangeNegotiator.hpp"
#include "RemoteObjectHandle.hpp"
#include "RequestExecutor.hpp"
#include "config.hpp"

namespace renterd::core {

enum class SeekMode : uint8_t {
    FromStart,
    FromCurrent,
    FromEnd
};

enum class StreamState : uint8_t {
    Idle,
    Fetching,
    Streaming,
    Exhausted,
    Closed
};

std::string_view to_string(StreamState state) noexcept;

struct ReadResult {
    std::vector<uint8_t> bytes;
    // Set when the read stopped because the object has no more bytes.
    bool end_of_object = false;
};

/**
 * @brief A remote object as a seekable, incrementally read byte stream.
 *
 * @details
 * **Fetching:**
 * Nothing is requested until a read needs bytes that the open response body
 * cannot deliver. A request then asks for `Range: bytes=<position>-` and
 * supersedes the previous body, whose connection is closed first, so a stream
 * never holds more than one connection. Seeks only move the position.
 *
 * **Buffering:**
 * Bytes are pulled from the body in pieces of at most `chunk_size` and never
 * beyond `high_water_mark` bytes ahead of the reader.
 *
 * **Failure and cancellation:**
 * A read that throws (transport failure, protocol violation, cancellation)
 * leaves the position where it was, clamped to the length if the read learned
 * it, and drops the body. The window is restored to its state before the call,
 * including the bytes the read had taken; the next call starts over with a new
 * request.
 *
 * Not safe for concurrent use; one consumer at a time.
 */
class SeekableObjectStream {
   public:
    SeekableObjectStream(std::shared_ptr<network::RequestExecutor> executor,
                         RemoteObjectHandle handle, StreamConfig cfg = {});
    ~SeekableObjectStream();

    SeekableObjectStream(const SeekableObjectStream&) = delete;
    SeekableObjectStream& operator=(const SeekableObjectStream&) = delete;
    SeekableObjectStream(SeekableObjectStream&&) = delete;
    SeekableObjectStream& operator=(SeekableObjectStream&&) = delete;

    /**
     * @brief Reads up to `max_len` bytes at the current position.
     *
     * Fewer bytes are returned only at the end of the object, in which case
     * `end_of_object` is set.
     * @throws ClientError NotFound, RangeNotSatisfiable, Transport, Protocol,
     * NotSeekable (range fallback disabled).
     */
    boost::asio::awaitable<ReadResult> read(size_t max_len);

    /**
     * @brief Reads the slice [offset, offset + len), requesting only that
     * slice from the server when it is not buffered. Leaves the position
     * after the returned bytes.
     */
    boost::asio::awaitable<ReadResult> read_at(uint64_t offset, size_t len);

    /**
     * @brief Moves the position; never fetches object bytes.
     *
     * FromEnd on an object of unknown length sends a one-byte probe to learn
     * it. Targets past a known length are clamped to it.
     * @return The new position.
     * @throws ClientError UnknownLength, InvalidArgument (target before 0),
     * NotSeekable (sequential stream).
     */
    boost::asio::awaitable<uint64_t> seek(int64_t offset, SeekMode mode);

    [[nodiscard]] std::optional<uint64_t> length() const noexcept;
    [[nodiscard]] uint64_t position() const noexcept { return position_; }
    [[nodiscard]] StreamState state() const noexcept { return state_; }
    [[nodiscard]] const RemoteObjectHandle& handle() const noexcept { return handle_; }
    [[nodiscard]] size_t buffered() const noexcept { return window_.size(); }

    // Releases the connection and buffered bytes. Further calls throw.
    void close() noexcept;

   private:
    friend class ReadRollbackGuard;

    boost::asio::awaitable<ReadResult> read_impl(size_t max_len,
                                                 std::optional<uint64_t> slice_end);
    boost::asio::awaitable<void> fetch(const ByteRange& range);
    boost::asio::awaitable<void> pull();
    boost::asio::awaitable<uint64_t> discard_prefix(network::ByteSource& body, uint64_t count);
    boost::asio::awaitable<uint64_t> probe_length();

    [[nodiscard]] network::ApiRequest make_request(const std::optional<ByteRange>& range) const;
    void release_body() noexcept;
    void rollback(uint64_t position, std::span<const uint8_t> taken,
                  std::optional<BufferedWindow>& saved) noexcept;
    [[nodiscard]] uint64_t clamp_to_length(uint64_t offset) const noexcept;
    void ensure_open() const;

    std::shared_ptr<network::RequestExecutor> executor_;
    RemoteObjectHandle handle_;
    StreamConfig cfg_;
    RangeNegotiator negotiator_;
    BufferedWindow window_;
    std::unique_ptr<network::ByteSource> body_;
    std::vector<uint8_t> scratch_;
    uint64_t position_ = 0;
    StreamState state_ = StreamState::Idle;
};

}  // namespace renterd::core
