#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "RequestExecutor.hpp"
#include "config.hpp"

namespace renterd::network {

/**
 * @brief RequestExecutor over Boost.Beast, one connection per request.
 *
 * @details
 * The connection is handed to the response body and closed when the body is
 * destroyed, so an abandoned stream never keeps a socket open. Bodies are
 * parsed incrementally (chunked transfer encoding included) and every network
 * operation is bounded by the configured request timeout.
 */
class BeastRequestExecutor : public RequestExecutor {
   public:
    /**
     * @param ex Executor all I/O runs on.
     * @param cfg Validated client configuration; only read during construction.
     * @param rate_limit Optional throttle awaited before each request.
     */
    BeastRequestExecutor(boost::asio::any_io_executor ex, const core::ClientConfig& cfg,
                         std::shared_ptr<RateLimitPolicy> rate_limit = nullptr);

    boost::asio::awaitable<ApiResponse> execute(ApiRequest request) override;

    RateLimitPolicy* rate_limit_policy() noexcept override { return rate_limit_.get(); }

    // Request target (path and query) for `request`, percent-encoded.
    [[nodiscard]] std::string target_for(const ApiRequest& request) const;

   private:
    template <class Stream>
    boost::asio::awaitable<ApiResponse> exchange(Stream stream, ApiRequest request);

    template <class Message>
    void apply_headers(Message& msg, const ApiRequest& request) const;

    boost::asio::any_io_executor executor_;
    core::Endpoint endpoint_;
    std::string host_header_;
    core::Secret authorization_;
    std::chrono::milliseconds timeout_;
    bool verbose_;
    bool verify_peer_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::shared_ptr<RateLimitPolicy> rate_limit_;
};

}  // namespace renterd::network
