#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/test/unit_test.hpp>
#include <limits>
#include <memory>

#include "ClientError.hpp"
#include "FakeRequestExecutor.hpp"
#include "SeekableObjectStream.hpp"
#include "TestSupport.hpp"

using renterd::core::ClientError;
using renterd::core::ErrorKind;
using renterd::core::RangeFallback;
using renterd::core::ReadResult;
using renterd::core::RemoteObjectHandle;
using renterd::core::SeekableObjectStream;
using renterd::core::SeekMode;
using renterd::core::StreamConfig;
using renterd::core::StreamState;
using renterd::test::FakeRequestExecutor;
using renterd::test::PatternBytes;
using renterd::test::Run;

namespace {

struct StreamFixture {
    asio::io_context ioc;
    std::shared_ptr<FakeRequestExecutor> server;

    explicit StreamFixture(size_t size = 1000)
        : server(std::make_shared<FakeRequestExecutor>(PatternBytes(size))) {}

    std::unique_ptr<SeekableObjectStream> open(std::optional<uint64_t> length, bool seekable = true,
                                               StreamConfig cfg = {}) {
        RemoteObjectHandle handle;
        handle.path = "/videos/clip.bin";
        handle.api_path = "worker/objects/videos/clip.bin";
        handle.length = length;
        handle.seekable = seekable;
        return std::make_unique<SeekableObjectStream>(server, handle, cfg);
    }

    ReadResult read(SeekableObjectStream& s, size_t n) { return Run(ioc, s.read(n)); }

    uint64_t seek(SeekableObjectStream& s, int64_t offset, SeekMode mode = SeekMode::FromStart) {
        return Run(ioc, s.seek(offset, mode));
    }
};

auto has_kind(ErrorKind kind) {
    return [kind](const ClientError& e) { return e.kind() == kind; };
}

StreamConfig small_window() {
    StreamConfig cfg;
    cfg.high_water_mark = 64;
    cfg.chunk_size = 16;
    return cfg;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(seekable_object_stream)

BOOST_AUTO_TEST_CASE(sequential_reads_concatenate_to_the_object) {
    StreamFixture f(1000);
    f.server->body_chunk = 7;
    auto stream = f.open(1000, true, small_window());

    std::vector<uint8_t> collected;
    for (;;) {
        auto r = f.read(*stream, 33);
        collected.insert(collected.end(), r.bytes.begin(), r.bytes.end());
        if (r.end_of_object) {
            BOOST_CHECK_LE(r.bytes.size(), 33u);
            break;
        }
        BOOST_CHECK_EQUAL(r.bytes.size(), 33u);
        BOOST_CHECK_LE(stream->buffered(), 64u);
    }
    BOOST_CHECK(collected == PatternBytes(1000));
    BOOST_CHECK_EQUAL(f.server->gets(), 1u);
    BOOST_CHECK(stream->state() == StreamState::Exhausted);
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 0);
}

BOOST_AUTO_TEST_CASE(seek_then_read_yields_bytes_from_target) {
    StreamFixture f(1000);
    auto stream = f.open(1000, true, small_window());

    f.read(*stream, 10);
    for (uint64_t p : {700u, 5u, 12u, 999u, 300u}) {
        BOOST_CHECK_EQUAL(f.seek(*stream, static_cast<int64_t>(p)), p);
        auto r = f.read(*stream, 20);
        const size_t expected = std::min<uint64_t>(20, 1000 - p);
        BOOST_CHECK(r.bytes == PatternBytes(expected, p));
        BOOST_CHECK_EQUAL(stream->position(), p + expected);
    }
}

BOOST_AUTO_TEST_CASE(seek_within_window_reuses_buffered_bytes) {
    StreamFixture f(1000);
    auto stream = f.open(1000, true, small_window());

    f.read(*stream, 4);
    BOOST_REQUIRE_GT(stream->buffered(), 8u);
    f.seek(*stream, 8);
    auto r = f.read(*stream, 4);
    BOOST_CHECK(r.bytes == PatternBytes(4, 8));
    BOOST_CHECK_EQUAL(f.server->gets(), 1u);
}

BOOST_AUTO_TEST_CASE(seeks_without_reads_issue_no_requests) {
    StreamFixture f(1000);
    auto stream = f.open(1000);

    f.seek(*stream, 10);
    f.seek(*stream, 5, SeekMode::FromCurrent);
    f.seek(*stream, -100, SeekMode::FromEnd);
    f.seek(*stream, -50, SeekMode::FromCurrent);
    BOOST_CHECK_EQUAL(stream->position(), 850u);
    BOOST_CHECK(f.server->requests.empty());
}

BOOST_AUTO_TEST_CASE(one_extra_request_per_discontiguous_read) {
    StreamFixture f(1000);
    f.server->body_chunk = 64;
    auto stream = f.open(1000);

    f.read(*stream, 100);
    BOOST_REQUIRE_LT(stream->buffered(), 400u);
    f.seek(*stream, 500);
    auto r = f.read(*stream, 100);

    BOOST_CHECK(r.bytes == PatternBytes(100, 500));
    const auto ranges = f.server->ranges();
    BOOST_REQUIRE_EQUAL(ranges.size(), 2u);
    BOOST_CHECK_EQUAL(*ranges[0], "bytes=0-");
    BOOST_CHECK_EQUAL(*ranges[1], "bytes=500-");
}

BOOST_AUTO_TEST_CASE(fetch_releases_previous_body_first) {
    StreamFixture f(1000);
    auto stream = f.open(1000, true, small_window());

    f.read(*stream, 10);
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 1);
    f.seek(*stream, 900);
    f.read(*stream, 10);
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 1);
    stream->close();
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 0);
    BOOST_CHECK(stream->state() == StreamState::Closed);
}

BOOST_AUTO_TEST_CASE(seek_past_known_length_clamps) {
    StreamFixture f(1000);
    auto stream = f.open(1000);

    BOOST_CHECK_EQUAL(f.seek(*stream, 5000), 1000u);
    auto r = f.read(*stream, 10);
    BOOST_CHECK(r.bytes.empty());
    BOOST_CHECK(r.end_of_object);
    BOOST_CHECK(f.server->requests.empty());
}

BOOST_AUTO_TEST_CASE(negative_target_is_invalid_argument) {
    StreamFixture f(1000);
    auto stream = f.open(1000);
    f.seek(*stream, 10);

    BOOST_CHECK_EXCEPTION(f.seek(*stream, -11, SeekMode::FromCurrent), ClientError,
                          has_kind(ErrorKind::InvalidArgument));
    BOOST_CHECK_EXCEPTION(f.seek(*stream, -1), ClientError, has_kind(ErrorKind::InvalidArgument));
    BOOST_CHECK_EQUAL(stream->position(), 10u);
}

BOOST_AUTO_TEST_CASE(from_end_probes_unknown_length) {
    StreamFixture f(1000);
    auto stream = f.open(std::nullopt);

    BOOST_CHECK(!stream->length());
    BOOST_CHECK_EQUAL(f.seek(*stream, -10, SeekMode::FromEnd), 990u);
    BOOST_CHECK_EQUAL(*stream->length(), 1000u);

    const auto ranges = f.server->ranges();
    BOOST_REQUIRE_EQUAL(ranges.size(), 1u);
    BOOST_CHECK_EQUAL(*ranges[0], "bytes=0-0");
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 0);

    auto r = f.read(*stream, 100);
    BOOST_CHECK(r.bytes == PatternBytes(10, 990));
    BOOST_CHECK(r.end_of_object);
}

BOOST_AUTO_TEST_CASE(from_end_without_reported_length_fails) {
    StreamFixture f(1000);
    f.server->report_total = false;
    auto stream = f.open(std::nullopt);

    BOOST_CHECK_EXCEPTION(f.seek(*stream, 0, SeekMode::FromEnd), ClientError,
                          has_kind(ErrorKind::UnknownLength));
    BOOST_CHECK_EQUAL(stream->position(), 0u);
    BOOST_CHECK(stream->state() == StreamState::Idle);
}

BOOST_AUTO_TEST_CASE(unknown_length_resolves_when_body_ends) {
    StreamFixture f(300);
    f.server->report_total = false;
    auto stream = f.open(std::nullopt);

    auto r = f.read(*stream, 1000);
    BOOST_CHECK(r.bytes == PatternBytes(300));
    BOOST_CHECK(r.end_of_object);
    BOOST_CHECK_EQUAL(*stream->length(), 300u);
}

BOOST_AUTO_TEST_CASE(read_at_sends_bounded_range) {
    StreamFixture f(1000);
    auto stream = f.open(1000);

    auto r = Run(f.ioc, stream->read_at(200, 50));
    BOOST_CHECK(r.bytes == PatternBytes(50, 200));
    BOOST_CHECK_EQUAL(stream->position(), 250u);
    BOOST_CHECK_EQUAL(*f.server->ranges().at(0), "bytes=200-249");

    // Continuing past the slice opens an open-ended range.
    auto next = f.read(*stream, 10);
    BOOST_CHECK(next.bytes == PatternBytes(10, 250));
    BOOST_CHECK_EQUAL(*f.server->ranges().at(1), "bytes=250-");
}

BOOST_AUTO_TEST_CASE(range_ignored_discards_until_position) {
    StreamFixture f(1000);
    f.server->support_ranges = false;
    auto stream = f.open(1000);

    f.seek(*stream, 600);
    auto r = f.read(*stream, 50);
    BOOST_CHECK(r.bytes == PatternBytes(50, 600));
    BOOST_CHECK_EQUAL(f.server->gets(), 1u);
}

BOOST_AUTO_TEST_CASE(range_ignored_fails_when_configured) {
    StreamFixture f(1000);
    f.server->support_ranges = false;
    StreamConfig cfg;
    cfg.range_fallback = RangeFallback::Fail;
    auto stream = f.open(1000, true, cfg);

    f.seek(*stream, 600);
    BOOST_CHECK_EXCEPTION(f.read(*stream, 50), ClientError, has_kind(ErrorKind::NotSeekable));
    BOOST_CHECK_EQUAL(stream->position(), 600u);
    BOOST_CHECK(stream->state() == StreamState::Idle);
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 0);
}

BOOST_AUTO_TEST_CASE(range_at_length_is_end_of_object) {
    StreamFixture f(1000);
    auto stream = f.open(std::nullopt);

    f.seek(*stream, 1000);
    auto r = f.read(*stream, 10);
    BOOST_CHECK(r.bytes.empty());
    BOOST_CHECK(r.end_of_object);
    BOOST_CHECK_EQUAL(*stream->length(), 1000u);
}

BOOST_AUTO_TEST_CASE(range_beyond_length_is_not_satisfiable) {
    StreamFixture f(1000);
    auto stream = f.open(std::nullopt);

    f.seek(*stream, 1500);
    BOOST_CHECK_EXCEPTION(f.read(*stream, 10), ClientError,
                          has_kind(ErrorKind::RangeNotSatisfiable));
    // The position never stays past a known length.
    BOOST_CHECK_EQUAL(*stream->length(), 1000u);
    BOOST_CHECK_EQUAL(stream->position(), 1000u);
    BOOST_CHECK(stream->state() == StreamState::Idle);

    auto r = f.read(*stream, 10);
    BOOST_CHECK(r.bytes.empty());
    BOOST_CHECK(r.end_of_object);
}

BOOST_AUTO_TEST_CASE(capped_ranges_without_total_continue_to_the_end) {
    StreamFixture f(1000);
    f.server->report_total = false;
    f.server->max_range = 100;
    auto stream = f.open(std::nullopt);

    auto r = f.read(*stream, 1000);
    BOOST_CHECK(r.bytes == PatternBytes(1000));
    BOOST_CHECK(!r.end_of_object);
    BOOST_CHECK_EQUAL(f.server->gets(), 10u);

    auto tail = f.read(*stream, 10);
    BOOST_CHECK(tail.bytes.empty());
    BOOST_CHECK(tail.end_of_object);
    BOOST_CHECK_EQUAL(*stream->length(), 1000u);
    BOOST_CHECK_EQUAL(*f.server->ranges().at(1), "bytes=100-");
    BOOST_CHECK_EQUAL(*f.server->ranges().back(), "bytes=1000-");
}

BOOST_AUTO_TEST_CASE(capped_ranges_with_total_continue_to_the_end) {
    StreamFixture f(1000);
    f.server->max_range = 300;
    auto stream = f.open(1000, true, small_window());

    auto r = f.read(*stream, 2000);
    BOOST_CHECK(r.bytes == PatternBytes(1000));
    BOOST_CHECK(r.end_of_object);
    BOOST_CHECK_EQUAL(f.server->gets(), 4u);
}

BOOST_AUTO_TEST_CASE(missing_object_is_not_found) {
    StreamFixture f(1000);
    f.server->exists = false;
    auto stream = f.open(1000);

    BOOST_CHECK_EXCEPTION(f.read(*stream, 10), ClientError, has_kind(ErrorKind::NotFound));
    BOOST_CHECK(stream->state() == StreamState::Idle);
}

BOOST_AUTO_TEST_CASE(mismatched_content_range_is_protocol_error) {
    StreamFixture f(1000);
    f.server->skew_first = 10;
    auto stream = f.open(1000);

    f.seek(*stream, 20);
    BOOST_CHECK_EXCEPTION(f.read(*stream, 10), ClientError, has_kind(ErrorKind::Protocol));
    BOOST_CHECK_EQUAL(stream->position(), 20u);
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 0);
}

BOOST_AUTO_TEST_CASE(early_end_of_body_is_protocol_error) {
    StreamFixture f(1000);
    f.server->truncate_body = 100;
    auto stream = f.open(1000, true, small_window());

    f.read(*stream, 50);
    BOOST_CHECK_EXCEPTION(f.read(*stream, 100), ClientError, has_kind(ErrorKind::Protocol));
    BOOST_CHECK_EQUAL(stream->position(), 50u);

    // The failed read gave back what it had taken.
    f.server->truncate_body.reset();
    auto r = f.read(*stream, 100);
    BOOST_CHECK(r.bytes == PatternBytes(100, 50));
}

BOOST_AUTO_TEST_CASE(server_error_maps_to_http_response) {
    StreamFixture f(1000);
    f.server->fail_status = 500;
    f.server->fail_body = "  internal error\n";
    auto stream = f.open(1000);

    try {
        f.read(*stream, 10);
        BOOST_FAIL("expected an error");
    } catch (const ClientError& e) {
        BOOST_CHECK(e.kind() == ErrorKind::HttpResponse);
        BOOST_CHECK_EQUAL(e.status(), 500u);
        BOOST_CHECK_EQUAL(e.body(), "internal error");
    }
}

BOOST_AUTO_TEST_CASE(cancelled_read_rolls_back) {
    StreamFixture f(1000);
    f.server->body_chunk = 10;
    auto stream = f.open(1000, true, small_window());

    auto first = f.read(*stream, 20);
    BOOST_CHECK(first.bytes == PatternBytes(20));

    f.server->body_delay = std::chrono::milliseconds(200);
    asio::cancellation_signal cancel;
    std::exception_ptr error;
    asio::co_spawn(f.ioc, stream->read(100),
                   asio::bind_cancellation_slot(
                       cancel.slot(), [&error](std::exception_ptr e, ReadResult) { error = e; }));

    asio::steady_timer timer(f.ioc, std::chrono::milliseconds(20));
    timer.async_wait([&cancel](const boost::system::error_code&) {
        cancel.emit(asio::cancellation_type::terminal);
    });
    f.ioc.restart();
    f.ioc.run();

    BOOST_REQUIRE(error);
    try {
        std::rethrow_exception(error);
    } catch (const ClientError& e) {
        BOOST_CHECK(e.kind() == ErrorKind::Transport);
        BOOST_CHECK(e.code() == asio::error::operation_aborted);
    }
    BOOST_CHECK_EQUAL(stream->position(), 20u);
    BOOST_CHECK(stream->state() == StreamState::Idle);
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 0);

    f.server->body_delay = std::chrono::milliseconds(0);
    auto next = f.read(*stream, 100);
    BOOST_CHECK(next.bytes == PatternBytes(100, 20));
}

BOOST_AUTO_TEST_CASE(failed_request_leaves_stream_ready_to_retry) {
    StreamFixture f(1000);
    auto stream = f.open(1000, true, small_window());
    f.seek(*stream, 300);

    f.server->transport_failures = 1;
    BOOST_CHECK_EXCEPTION(f.read(*stream, 50), ClientError, has_kind(ErrorKind::Transport));
    BOOST_CHECK(stream->state() == StreamState::Idle);
    BOOST_CHECK_EQUAL(stream->position(), 300u);
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 0);

    auto r = f.read(*stream, 50);
    BOOST_CHECK(r.bytes == PatternBytes(50, 300));
    BOOST_CHECK_EQUAL(stream->position(), 350u);
    const auto ranges = f.server->ranges();
    BOOST_REQUIRE_EQUAL(ranges.size(), 2u);
    BOOST_CHECK_EQUAL(*ranges[0], "bytes=300-");
    BOOST_CHECK_EQUAL(*ranges[1], "bytes=300-");
}

BOOST_AUTO_TEST_CASE(cancelled_read_restores_window_it_replaced) {
    StreamFixture f(1000);
    f.server->body_chunk = 10;
    auto stream = f.open(1000, true, small_window());

    auto first = f.read(*stream, 5);
    BOOST_CHECK(first.bytes == PatternBytes(5));
    const size_t buffered = stream->buffered();
    BOOST_REQUIRE_GT(buffered, 0u);

    f.seek(*stream, 500);
    f.server->body_delay = std::chrono::milliseconds(200);
    asio::cancellation_signal cancel;
    std::exception_ptr error;
    asio::co_spawn(f.ioc, stream->read(20),
                   asio::bind_cancellation_slot(
                       cancel.slot(), [&error](std::exception_ptr e, ReadResult) { error = e; }));

    asio::steady_timer timer(f.ioc, std::chrono::milliseconds(20));
    timer.async_wait([&cancel](const boost::system::error_code&) {
        cancel.emit(asio::cancellation_type::terminal);
    });
    f.ioc.restart();
    f.ioc.run();

    BOOST_REQUIRE(error);
    BOOST_CHECK_EQUAL(f.server->gets(), 2u);
    BOOST_CHECK_EQUAL(stream->position(), 500u);
    BOOST_CHECK_EQUAL(stream->buffered(), buffered);
    BOOST_CHECK_EQUAL(f.server->open_bodies(), 0);

    // The bytes buffered before the cancelled read are still served locally.
    f.server->body_delay = std::chrono::milliseconds(0);
    f.seek(*stream, 5);
    auto r = f.read(*stream, buffered);
    BOOST_CHECK(r.bytes == PatternBytes(buffered, 5));
    BOOST_CHECK_EQUAL(f.server->gets(), 2u);
}

BOOST_AUTO_TEST_CASE(cancelled_length_probe_leaves_stream_idle) {
    StreamFixture f(1000);
    auto stream = f.open(std::nullopt);
    f.seek(*stream, 40);

    f.server->response_delay = std::chrono::milliseconds(200);
    asio::cancellation_signal cancel;
    std::exception_ptr error;
    asio::co_spawn(f.ioc, stream->seek(-10, SeekMode::FromEnd),
                   asio::bind_cancellation_slot(
                       cancel.slot(), [&error](std::exception_ptr e, uint64_t) { error = e; }));

    asio::steady_timer timer(f.ioc, std::chrono::milliseconds(20));
    timer.async_wait([&cancel](const boost::system::error_code&) {
        cancel.emit(asio::cancellation_type::terminal);
    });
    f.ioc.restart();
    f.ioc.run();

    BOOST_REQUIRE(error);
    BOOST_CHECK(stream->state() == StreamState::Idle);
    BOOST_CHECK_EQUAL(stream->position(), 40u);
    BOOST_CHECK(!stream->length());

    f.server->response_delay = std::chrono::milliseconds(0);
    BOOST_CHECK_EQUAL(f.seek(*stream, -10, SeekMode::FromEnd), 990u);
    BOOST_CHECK(stream->state() == StreamState::Idle);
}

BOOST_AUTO_TEST_CASE(read_at_with_huge_length_requests_to_the_end) {
    StreamFixture f(1000);
    auto stream = f.open(std::nullopt);

    auto r = Run(f.ioc, stream->read_at(200, std::numeric_limits<size_t>::max()));
    BOOST_CHECK(r.bytes == PatternBytes(800, 200));
    BOOST_CHECK(r.end_of_object);
    BOOST_CHECK_EQUAL(*f.server->ranges().at(0), "bytes=200-18446744073709551614");
}

BOOST_AUTO_TEST_CASE(sequential_stream_rejects_seeks) {
    StreamFixture f(1000);
    auto stream = f.open(1000, false);

    BOOST_CHECK_EQUAL(f.seek(*stream, 0, SeekMode::FromCurrent), 0u);
    BOOST_CHECK_EXCEPTION(f.seek(*stream, 10), ClientError, has_kind(ErrorKind::NotSeekable));
    BOOST_CHECK_EXCEPTION(f.seek(*stream, 0, SeekMode::FromEnd), ClientError,
                          has_kind(ErrorKind::NotSeekable));

    auto r = f.read(*stream, 2000);
    BOOST_CHECK(r.bytes == PatternBytes(1000));
    BOOST_CHECK(r.end_of_object);
    BOOST_REQUIRE_EQUAL(f.server->ranges().size(), 1u);
    BOOST_CHECK(!f.server->ranges()[0]);
}

BOOST_AUTO_TEST_CASE(closed_stream_rejects_calls) {
    StreamFixture f(1000);
    auto stream = f.open(1000);
    stream->close();
    BOOST_CHECK_THROW(f.read(*stream, 1), std::logic_error);
    BOOST_CHECK_THROW(f.seek(*stream, 1), std::logic_error);
}

BOOST_AUTO_TEST_SUITE_END()
