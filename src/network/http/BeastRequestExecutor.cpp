#include "BeastRequestExecutor.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/json/serialize.hpp>
#include <boost/url/url.hpp>
#include <variant>
#include <vector>

#include "BasicAuth.hpp"
#include "ClientError.hpp"
#include "Types.hpp"

namespace renterd::network {

using core::ClientError;
using core::ErrorKind;

namespace {

// Size of the pieces an upload is read and sent in.
constexpr size_t UPLOAD_CHUNK_SIZE = 64 * 1024;

/**
 * @brief Response body read straight off the connection that produced it.
 */
template <class Stream>
class BeastResponseBody : public ByteSource {
   public:
    BeastResponseBody(Stream stream, beast::flat_buffer buffer,
                      std::unique_ptr<http::response_parser<http::buffer_body>> parser,
                      std::chrono::milliseconds timeout)
        : stream_(std::move(stream)),
          buffer_(std::move(buffer)),
          parser_(std::move(parser)),
          timeout_(timeout) {}

    ~BeastResponseBody() override {
        beast::error_code ec;
        beast::get_lowest_layer(stream_).socket().shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(stream_).socket().close(ec);
        spdlog::trace("Response body released, connection closed");
    }

    BeastResponseBody(const BeastResponseBody&) = delete;
    BeastResponseBody& operator=(const BeastResponseBody&) = delete;

    asio::awaitable<size_t> read_some(asio::mutable_buffer buffer) override {
        if (buffer.size() == 0) {
            co_return 0;
        }
        // A read can complete with only chunk framing parsed; keep going
        // until body bytes arrive or the message is done.
        while (!parser_->is_done()) {
            auto& body = parser_->get().body();
            body.data = buffer.data();
            body.size = buffer.size();

            beast::get_lowest_layer(stream_).expires_after(timeout_);
            auto [ec, _] = co_await http::async_read_some(stream_, buffer_, *parser_,
                                                          asio::as_tuple(asio::use_awaitable));
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                throw ClientError(ErrorKind::Transport, ec, "reading response body");
            }

            const size_t n = buffer.size() - parser_->get().body().size;
            if (n > 0) {
                co_return n;
            }
        }
        co_return 0;
    }

   private:
    Stream stream_;
    beast::flat_buffer buffer_;
    std::unique_ptr<http::response_parser<http::buffer_body>> parser_;
    std::chrono::milliseconds timeout_;
};

template <class Stream>
asio::awaitable<void> write_streamed(Stream& stream, http::request<http::buffer_body>& req,
                                     ByteSource* source, std::chrono::milliseconds timeout) {
    req.chunked(true);
    req.body().data = nullptr;
    req.body().more = true;

    http::request_serializer<http::buffer_body> sr{req};
    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await http::async_write_header(stream, sr, asio::use_awaitable);

    std::vector<uint8_t> chunk(UPLOAD_CHUNK_SIZE);
    size_t total = 0;
    for (;;) {
        size_t n = source ? co_await source->read_some(asio::buffer(chunk)) : 0;
        req.body().data = n > 0 ? chunk.data() : nullptr;
        req.body().size = n;
        req.body().more = n > 0;

        beast::get_lowest_layer(stream).expires_after(timeout);
        auto [ec, _] = co_await http::async_write(stream, sr, asio::as_tuple(asio::use_awaitable));
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }
        total += n;
        if (n == 0) {
            break;
        }
    }
    spdlog::debug("Uploaded {} bytes", total);
}

}  // namespace

BeastRequestExecutor::BeastRequestExecutor(asio::any_io_executor ex,
                                           const core::ClientConfig& cfg,
                                           std::shared_ptr<RateLimitPolicy> rate_limit)
    : executor_(std::move(ex)),
      endpoint_(cfg.endpoint()),
      authorization_(BasicAuthorization("api", cfg.api_password.reveal())),
      timeout_(cfg.request_timeout),
      verbose_(cfg.verbose_logging),
      verify_peer_(!cfg.accept_invalid_certs),
      rate_limit_(std::move(rate_limit)) {
    host_header_ = endpoint_.host;
    if ((endpoint_.tls && endpoint_.port != "443") || (!endpoint_.tls && endpoint_.port != "80")) {
        host_header_ += ":" + endpoint_.port;
    }

    if (endpoint_.tls) {
        ssl_ctx_ = std::make_unique<asio::ssl::context>(asio::ssl::context::tls_client);
        ssl_ctx_->set_default_verify_paths();
        if (cfg.accept_invalid_certs) {
            spdlog::warn("TLS certificate verification is disabled for {}", endpoint_.host);
            ssl_ctx_->set_verify_mode(asio::ssl::verify_none);
        } else {
            ssl_ctx_->set_verify_mode(asio::ssl::verify_peer);
        }
    }

    spdlog::debug("Request executor for {}://{}{} created", endpoint_.tls ? "https" : "http",
                  host_header_, endpoint_.base_path);
}

std::string BeastRequestExecutor::target_for(const ApiRequest& request) const {
    boost::urls::url url;
    url.set_path(endpoint_.base_path + request.path);
    for (const auto& [key, value] : request.params) {
        url.params().append(boost::urls::param_view(key, value));
    }
    return std::string(url.encoded_target());
}

template <class Message>
void BeastRequestExecutor::apply_headers(Message& msg, const ApiRequest& request) const {
    msg.set(http::field::host, host_header_);
    msg.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    msg.set(http::field::authorization, authorization_.reveal());
    for (const auto& [name, value] : request.headers) {
        msg.set(name, value);
    }
}

template <class Stream>
asio::awaitable<ApiResponse> BeastRequestExecutor::exchange(Stream stream, ApiRequest request) {
    const bool is_head = request.method == http::verb::head;
    const auto target = target_for(request);

    if (auto* content = std::get_if<StreamContent>(&request.content)) {
        http::request<http::buffer_body> req{request.method, target, 11};
        apply_headers(req, request);
        if (content->content_type) {
            req.set(http::field::content_type, *content->content_type);
        }
        co_await write_streamed(stream, req, content->source.get(), timeout_);
    } else {
        http::request<http::string_body> req{request.method, target, 11};
        apply_headers(req, request);
        if (auto* json = std::get_if<boost::json::value>(&request.content)) {
            req.set(http::field::content_type, "application/json");
            req.body() = boost::json::serialize(*json);
        }
        req.prepare_payload();
        beast::get_lowest_layer(stream).expires_after(timeout_);
        co_await http::async_write(stream, req, asio::use_awaitable);
    }

    beast::flat_buffer buffer;
    auto parser = std::make_unique<http::response_parser<http::buffer_body>>();
    parser->body_limit(boost::none);
    if (is_head) {
        parser->skip(true);
    }

    beast::get_lowest_layer(stream).expires_after(timeout_);
    co_await http::async_read_header(stream, buffer, *parser, asio::use_awaitable);

    ApiResponse response;
    response.status = parser->get().result_int();
    for (const auto& field : parser->get().base()) {
        response.headers.insert(field.name(), field.name_string(), field.value());
    }

    if (verbose_) {
        spdlog::trace("{} {} -> {}", std::string(http::to_string(request.method)), target,
                      response.status);
    }

    response.body = std::make_unique<BeastResponseBody<Stream>>(
        std::move(stream), std::move(buffer), std::move(parser), timeout_);
    co_return response;
}

asio::awaitable<ApiResponse> BeastRequestExecutor::execute(ApiRequest request) {
    if (rate_limit_) {
        co_await rate_limit_->acquire(request);
    }

    try {
        tcp::resolver resolver(executor_);
        auto results =
            co_await resolver.async_resolve(endpoint_.host, endpoint_.port, asio::use_awaitable);

        if (!endpoint_.tls) {
            beast::tcp_stream stream(executor_);
            stream.expires_after(timeout_);
            co_await stream.async_connect(results, asio::use_awaitable);
            spdlog::debug("Connected to {}:{}", endpoint_.host, endpoint_.port);
            co_return co_await exchange(std::move(stream), std::move(request));
        }

        beast::ssl_stream<beast::tcp_stream> stream(executor_, *ssl_ctx_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
            throw boost::system::system_error(
                beast::error_code(static_cast<int>(::ERR_get_error()),
                                  asio::error::get_ssl_category()));
        }
        if (verify_peer_) {
            stream.set_verify_callback(asio::ssl::host_name_verification(endpoint_.host));
        }

        beast::get_lowest_layer(stream).expires_after(timeout_);
        co_await beast::get_lowest_layer(stream).async_connect(results, asio::use_awaitable);
        co_await stream.async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);
        spdlog::debug("Connected to {}:{} (TLS)", endpoint_.host, endpoint_.port);
        co_return co_await exchange(std::move(stream), std::move(request));

    } catch (const boost::system::system_error& e) {
        spdlog::error("Request to {}:{} failed: {}", endpoint_.host, endpoint_.port,
                      e.code().message());
        throw ClientError(ErrorKind::Transport, e.code(),
                          "request to " + endpoint_.host + ":" + endpoint_.port + " failed");
    }
}

}  // namespace renterd::network
