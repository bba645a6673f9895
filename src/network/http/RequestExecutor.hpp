#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/fields.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "ApiRequest.hpp"
#include "ByteSource.hpp"

namespace renterd::network {

/**
 * @brief Status, headers and the not-yet-read body of one HTTP exchange.
 *
 * The body owns the connection it is read from; dropping the response (or
 * just the body) closes it.
 */
struct ApiResponse {
    unsigned status = 0;
    boost::beast::http::fields headers;
    std::unique_ptr<ByteSource> body;

    [[nodiscard]] std::optional<std::string_view> header(boost::beast::http::field name) const;
    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

/**
 * @brief Hook for throttling outgoing requests. Not provided by default.
 */
class RateLimitPolicy {
   public:
    virtual ~RateLimitPolicy() = default;

    // Suspends until `request` may be sent.
    virtual boost::asio::awaitable<void> acquire(const ApiRequest& request) = 0;
};

/**
 * @brief Sends one request and returns as soon as the response headers are in.
 *
 * Implementations report connection, TLS, timeout and cancellation failures
 * as ClientError(Transport) and never retry.
 */
class RequestExecutor {
   public:
    virtual ~RequestExecutor() = default;

    virtual boost::asio::awaitable<ApiResponse> execute(ApiRequest request) = 0;

    // The executor's rate limiting capability, if it has one.
    virtual RateLimitPolicy* rate_limit_policy() noexcept { return nullptr; }
};

}  // namespace renterd::network
