#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/json/value.hpp>
#include <optional>

#include "ApiRequest.hpp"
#include "RequestExecutor.hpp"

namespace renterd::network {

/**
 * @brief Executes `request` and maps error statuses.
 *
 * 401 becomes ClientError(Authentication), 404 an empty optional, any other
 * 4xx/5xx ClientError(HttpResponse) carrying the trimmed response text.
 */
boost::asio::awaitable<std::optional<ApiResponse>> SendApiRequestOptional(
    RequestExecutor& executor, ApiRequest request);

/// Same as SendApiRequestOptional, but 404 is ClientError(NotFound).
boost::asio::awaitable<ApiResponse> SendApiRequest(RequestExecutor& executor, ApiRequest request);

/**
 * @brief Maps the status of an already executed request, consuming the body
 * of error responses. Returns false for 404.
 */
boost::asio::awaitable<bool> CheckStatus(ApiResponse& response);

/// GET `path` and parse the body as JSON. Malformed JSON is ClientError(InvalidData).
boost::asio::awaitable<boost::json::value> GetJson(RequestExecutor& executor, std::string path,
                                                   std::optional<QueryParams> params = {});

}  // namespace renterd::network
