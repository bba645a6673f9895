#include "SeekableObjectStream.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <new>
#include <stdexcept>

#include "ApiCall.hpp"
#include "ClientError.hpp"
#include "ReadRollbackGuard.hpp"
#include "Types.hpp"

namespace renterd::core {

std::string_view to_string(StreamState state) noexcept {
    switch (state) {
        case StreamState::Idle: return "idle";
        case StreamState::Fetching: return "fetching";
        case StreamState::Streaming: return "streaming";
        case StreamState::Exhausted: return "exhausted";
        case StreamState::Closed: return "closed";
    }
    return "unknown";
}

// =========================================================
//  ReadRollbackGuard
// =========================================================

ReadRollbackGuard::ReadRollbackGuard(SeekableObjectStream& stream,
                                     const std::vector<uint8_t>& taken)
    : stream_(stream), taken_(taken), position_(stream.position_) {}

void ReadRollbackGuard::save_window() {
    if (!saved_window_) {
        saved_window_ = stream_.window_;
        taken_before_save_ = taken_.size();
    }
}

ReadRollbackGuard::~ReadRollbackGuard() {
    if (!engaged_) {
        return;
    }
    std::span<const uint8_t> taken(taken_);
    if (saved_window_) {
        taken = taken.first(taken_before_save_);
    }
    stream_.rollback(position_, taken, saved_window_);
}

namespace {

// Puts a stream state back unless disarmed.
class StateRestorer {
   public:
    StateRestorer(StreamState& state, StreamState restore) : state_(state), restore_(restore) {}
    ~StateRestorer() {
        if (engaged_) {
            state_ = restore_;
        }
    }
    void disarm() { engaged_ = false; }

    StateRestorer(const StateRestorer&) = delete;
    StateRestorer& operator=(const StateRestorer&) = delete;

   private:
    StreamState& state_;
    StreamState restore_;
    bool engaged_ = true;
};

}  // namespace

// =========================================================
//  SeekableObjectStream
// =========================================================

SeekableObjectStream::SeekableObjectStream(std::shared_ptr<network::RequestExecutor> executor,
                                           RemoteObjectHandle handle, StreamConfig cfg)
    : executor_(std::move(executor)),
      handle_(std::move(handle)),
      cfg_(cfg),
      negotiator_(handle_.length),
      window_(cfg.high_water_mark) {
    if (!executor_) {
        throw std::invalid_argument("SeekableObjectStream requires a request executor");
    }
    if (cfg_.chunk_size == 0) {
        throw std::invalid_argument("SeekableObjectStream chunk size must be > 0");
    }
    spdlog::debug("[{}] Stream opened (length {}, {})", handle_.path,
                  handle_.length ? std::to_string(*handle_.length) : "unknown",
                  handle_.seekable ? "seekable" : "sequential");
}

SeekableObjectStream::~SeekableObjectStream() { close(); }

std::optional<uint64_t> SeekableObjectStream::length() const noexcept {
    return negotiator_.total_length();
}

void SeekableObjectStream::close() noexcept {
    if (state_ == StreamState::Closed) {
        return;
    }
    release_body();
    window_.discard();
    state_ = StreamState::Closed;
    spdlog::debug("[{}] Stream closed at offset {}", handle_.path, position_);
}

void SeekableObjectStream::ensure_open() const {
    if (state_ == StreamState::Closed) {
        throw std::logic_error("stream for `" + handle_.path + "` is closed");
    }
}

void SeekableObjectStream::release_body() noexcept {
    if (body_) {
        body_.reset();
        spdlog::trace("[{}] Response body released", handle_.path);
    }
    negotiator_.on_body_released();
}

uint64_t SeekableObjectStream::clamp_to_length(uint64_t offset) const noexcept {
    const auto total = negotiator_.total_length();
    return total && offset > *total ? *total : offset;
}

void SeekableObjectStream::rollback(uint64_t position, std::span<const uint8_t> taken,
                                    std::optional<BufferedWindow>& saved) noexcept {
    release_body();
    if (saved) {
        window_ = std::move(*saved);
    }
    try {
        window_.unread(taken);
    } catch (const std::bad_alloc&) {
        spdlog::warn("[{}] Could not restore {} bytes to the window, dropping it", handle_.path,
                     taken.size());
        window_.discard();
    }
    // The failed read may have learned the length.
    position_ = clamp_to_length(position);
    state_ = StreamState::Idle;
    spdlog::debug("[{}] Read rolled back to offset {}", handle_.path, position_);
}

network::ApiRequest SeekableObjectStream::make_request(
    const std::optional<ByteRange>& range) const {
    auto builder = network::ApiRequestBuilder::get(handle_.api_path);
    if (handle_.bucket) {
        builder.param("bucket", *handle_.bucket);
    }
    if (range) {
        builder.header("Range", range->to_header_value());
    }
    return builder.build();
}

asio::awaitable<ReadResult> SeekableObjectStream::read(size_t max_len) {
    try {
        co_return co_await read_impl(max_len, std::nullopt);
    } catch (const boost::system::system_error& e) {
        throw ClientError(ErrorKind::Transport, e.code(), "reading `" + handle_.path + "`");
    }
}

asio::awaitable<ReadResult> SeekableObjectStream::read_at(uint64_t offset, size_t len) {
    ensure_open();
    if (len == 0) {
        co_return ReadResult{};
    }
    const uint64_t previous = position_;
    co_await seek(static_cast<int64_t>(std::min<uint64_t>(
                      offset, static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))),
                  SeekMode::FromStart);
    const uint64_t room = std::numeric_limits<uint64_t>::max() - position_;
    const uint64_t slice_end = len > room ? std::numeric_limits<uint64_t>::max() : position_ + len;
    try {
        co_return co_await read_impl(len, slice_end);
    } catch (const boost::system::system_error& e) {
        position_ = clamp_to_length(previous);
        throw ClientError(ErrorKind::Transport, e.code(), "reading `" + handle_.path + "`");
    } catch (...) {
        position_ = clamp_to_length(previous);
        throw;
    }
}

asio::awaitable<ReadResult> SeekableObjectStream::read_impl(size_t max_len,
                                                            std::optional<uint64_t> slice_end) {
    ensure_open();
    ReadResult result;
    if (max_len == 0) {
        co_return result;
    }

    ReadRollbackGuard guard(*this, result.bytes);
    result.bytes.reserve(std::min(max_len, cfg_.high_water_mark));

    while (result.bytes.size() < max_len) {
        const size_t want = max_len - result.bytes.size();
        const auto plan = negotiator_.plan(position_, want, window_, slice_end);

        if (plan.action == ReadPlan::Action::EndOfObject) {
            result.end_of_object = true;
            break;
        }
        if (plan.action == ReadPlan::Action::Fetch) {
            guard.save_window();
            co_await fetch(plan.range);
            continue;
        }
        if (plan.from_buffer == 0) {
            co_await pull();
            continue;
        }

        window_.drop_until(position_);
        const size_t old = result.bytes.size();
        result.bytes.resize(old + std::min(want, plan.from_buffer));
        const size_t got = window_.take(std::span(result.bytes).subspan(old));
        result.bytes.resize(old + got);
        position_ += got;
    }

    guard.disarm();
    if (result.end_of_object) {
        state_ = StreamState::Exhausted;
    } else {
        state_ = body_ ? StreamState::Streaming : StreamState::Idle;
    }
    spdlog::trace("[{}] Read {} bytes, now at offset {}", handle_.path, result.bytes.size(),
                  position_);
    co_return result;
}

asio::awaitable<void> SeekableObjectStream::pull() {
    window_.drop_until(position_);
    const size_t room = std::min(window_.free_space(), cfg_.chunk_size);
    scratch_.resize(room);

    const size_t n = co_await body_->read_some(asio::buffer(scratch_.data(), room));
    if (n == 0) {
        spdlog::debug("[{}] Response body ended at offset {}", handle_.path, window_.end());
        const uint64_t end = window_.end();
        negotiator_.on_body_exhausted(end);
        release_body();
        const auto total = negotiator_.total_length();
        state_ = total && end >= *total ? StreamState::Exhausted : StreamState::Idle;
        co_return;
    }
    window_.push(std::span<const uint8_t>(scratch_.data(), n));
    state_ = StreamState::Streaming;
}

asio::awaitable<uint64_t> SeekableObjectStream::discard_prefix(network::ByteSource& body,
                                                               uint64_t count) {
    scratch_.resize(cfg_.chunk_size);
    uint64_t discarded = 0;
    while (discarded < count) {
        const auto want = static_cast<size_t>(std::min<uint64_t>(scratch_.size(), count - discarded));
        const size_t n = co_await body.read_some(asio::buffer(scratch_.data(), want));
        if (n == 0) {
            break;
        }
        discarded += n;
    }
    co_return discarded;
}

asio::awaitable<void> SeekableObjectStream::fetch(const ByteRange& range) {
    // The superseded body goes first: one connection per stream at most.
    release_body();
    state_ = StreamState::Fetching;

    const bool ranged = handle_.seekable;
    spdlog::debug("[{}] Fetching {}", handle_.path,
                  ranged ? range.to_header_value() : std::string("full object"));

    auto response = co_await executor_->execute(
        make_request(ranged ? std::optional<ByteRange>(range) : std::nullopt));

    if (response.status == 416) {
        response.body.reset();
        std::optional<uint64_t> total;
        if (auto header = response.header(http::field::content_range)) {
            total = ParseContentRange(*header).total;
        }
        if (total) {
            negotiator_.observe_total_length(*total);
            if (range.start == *total) {
                // Asking for the first byte past the end is just the end.
                spdlog::debug("[{}] Range starts at the end of the object", handle_.path);
                state_ = StreamState::Exhausted;
                co_return;
            }
        }
        throw ClientError(ErrorKind::RangeNotSatisfiable,
                          "range " + range.to_header_value() + " of `" + handle_.path +
                              "` is not satisfiable" +
                              (total ? " (length " + std::to_string(*total) + ")" : ""));
    }

    if (!co_await network::CheckStatus(response)) {
        throw ClientError(ErrorKind::NotFound, "object `" + handle_.path + "` not found");
    }

    ByteRange delivered{range.start, std::nullopt};
    std::unique_ptr<network::ByteSource> body = std::move(response.body);

    if (response.status == 206) {
        auto header = response.header(http::field::content_range);
        if (!header) {
            throw ClientError(ErrorKind::Protocol, "206 response for `" + handle_.path +
                                                       "` without Content-Range");
        }
        const auto cr = ParseContentRange(*header);
        if (!cr.first || *cr.first != range.start) {
            throw ClientError(ErrorKind::Protocol,
                              "server answered " + std::string(*header) + " to " +
                                  range.to_header_value());
        }
        if (range.end && *cr.last + 1 > *range.end) {
            throw ClientError(ErrorKind::Protocol,
                              "server answered " + std::string(*header) + " to bounded " +
                                  range.to_header_value());
        }
        if (cr.total) {
            negotiator_.observe_total_length(*cr.total);
        }
        // Without a total the server only promised bytes up to `last`.
        if (range.end || !cr.total || *cr.last + 1 < *cr.total) {
            delivered.end = *cr.last + 1;
        }
    } else if (response.status == 200) {
        if (auto header = response.header(http::field::content_length)) {
            negotiator_.observe_total_length(ParseContentLength(*header));
        }
        if (range.start > 0) {
            if (ranged && cfg_.range_fallback == RangeFallback::Fail) {
                throw ClientError(ErrorKind::NotSeekable, "server ignored the range request for `" +
                                                              handle_.path + "`");
            }
            spdlog::warn("[{}] Server sent the full object, discarding {} bytes", handle_.path,
                         range.start);
            const uint64_t skipped = co_await discard_prefix(*body, range.start);
            if (skipped < range.start) {
                negotiator_.observe_total_length(skipped);
                throw ClientError(ErrorKind::RangeNotSatisfiable,
                                  "offset " + std::to_string(range.start) + " is beyond the end of `" +
                                      handle_.path + "` (length " + std::to_string(skipped) + ")");
            }
        }
    } else {
        throw ClientError(ErrorKind::Protocol, "unexpected status " +
                                                   std::to_string(response.status) +
                                                   " downloading `" + handle_.path + "`");
    }

    if (!body) {
        throw ClientError(ErrorKind::Protocol, "response for `" + handle_.path + "` has no body");
    }

    window_.reset(range.start);
    body_ = std::move(body);
    negotiator_.on_body_opened(delivered);
    state_ = StreamState::Streaming;
}

asio::awaitable<uint64_t> SeekableObjectStream::probe_length() {
    release_body();
    state_ = StreamState::Fetching;
    StateRestorer restore(state_, StreamState::Idle);
    spdlog::debug("[{}] Probing object length", handle_.path);

    auto response = co_await executor_->execute(make_request(ByteRange{0, 1}));

    std::optional<uint64_t> total;
    if (response.status == 206 || response.status == 416) {
        if (auto header = response.header(http::field::content_range)) {
            total = ParseContentRange(*header).total;
        }
    } else if (!co_await network::CheckStatus(response)) {
        throw ClientError(ErrorKind::NotFound, "object `" + handle_.path + "` not found");
    } else if (auto header = response.header(http::field::content_length)) {
        total = ParseContentLength(*header);
    }
    response.body.reset();
    restore.disarm();
    state_ = StreamState::Idle;

    if (!total) {
        throw ClientError(ErrorKind::UnknownLength,
                          "server did not report the length of `" + handle_.path + "`");
    }
    negotiator_.observe_total_length(*total);
    co_return *total;
}

asio::awaitable<uint64_t> SeekableObjectStream::seek(int64_t offset, SeekMode mode) {
    ensure_open();
    if (!handle_.seekable) {
        if (mode == SeekMode::FromCurrent && offset == 0) {
            co_return position_;
        }
        throw ClientError(ErrorKind::NotSeekable,
                          "the object at `" + handle_.path + "` is not seekable");
    }

    uint64_t base = 0;
    switch (mode) {
        case SeekMode::FromStart:
            break;
        case SeekMode::FromCurrent:
            base = position_;
            break;
        case SeekMode::FromEnd: {
            auto total = negotiator_.total_length();
            if (!total) {
                try {
                    total = co_await probe_length();
                } catch (const boost::system::system_error& e) {
                    throw ClientError(ErrorKind::Transport, e.code(),
                                      "probing `" + handle_.path + "`");
                }
            }
            base = *total;
            break;
        }
    }

    uint64_t target = 0;
    if (offset < 0) {
        // -(offset + 1) + 1 avoids overflowing on INT64_MIN
        const uint64_t back = static_cast<uint64_t>(-(offset + 1)) + 1;
        if (back > base) {
            throw ClientError(ErrorKind::InvalidArgument,
                              "invalid seek to a negative position in `" + handle_.path + "`");
        }
        target = base - back;
    } else {
        target = base + static_cast<uint64_t>(offset);
        if (target < base) {
            target = std::numeric_limits<uint64_t>::max();
        }
    }

    const auto total = negotiator_.total_length();
    if (total && target > *total) {
        target = *total;
    }

    position_ = target;
    if (state_ != StreamState::Fetching) {
        if (total && position_ >= *total) {
            state_ = StreamState::Exhausted;
        } else {
            state_ = body_ ? StreamState::Streaming : StreamState::Idle;
        }
    }
    spdlog::trace("[{}] Seek to offset {}", handle_.path, position_);
    co_return position_;
}

}  // namespace renterd::core
