#include "ApiCall.hpp"

#include <spdlog/spdlog.h>

#include <boost/json/parse.hpp>
#include <string>

#include "ClientError.hpp"
#include "Types.hpp"

namespace renterd::network {

using core::ClientError;
using core::ErrorKind;

namespace {

// Error bodies are short diagnostics; never buffer more than this.
constexpr size_t MAX_ERROR_BODY = 64 * 1024;
// JSON responses of the state endpoints are small.
constexpr size_t MAX_JSON_BODY = 16 * 1024 * 1024;

std::string trim(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

std::optional<std::string_view> ApiResponse::header(http::field name) const {
    auto it = headers.find(name);
    if (it == headers.end()) return std::nullopt;
    return std::string_view(it->value().data(), it->value().size());
}

std::optional<std::string_view> ApiResponse::header(std::string_view name) const {
    auto it = headers.find(beast::string_view(name.data(), name.size()));
    if (it == headers.end()) return std::nullopt;
    return std::string_view(it->value().data(), it->value().size());
}

asio::awaitable<bool> CheckStatus(ApiResponse& response) {
    const unsigned status = response.status;
    if (status == 401) {
        response.body.reset();
        throw ClientError(ErrorKind::Authentication, "incorrect api password");
    }
    if (status == 404) {
        response.body.reset();
        co_return false;
    }
    if (status >= 400 && status < 600) {
        std::string text;
        if (response.body) {
            try {
                text = trim(co_await ReadToString(*response.body, MAX_ERROR_BODY));
            } catch (const ClientError& e) {
                spdlog::debug("Could not read error body for status {}: {}", status, e.what());
            }
            response.body.reset();
        }
        spdlog::error("API request failed [{}]: {}", status, text);
        throw ClientError(status, std::move(text));
    }
    co_return true;
}

asio::awaitable<std::optional<ApiResponse>> SendApiRequestOptional(RequestExecutor& executor,
                                                                   ApiRequest request) {
    spdlog::debug("{} {}", std::string(http::to_string(request.method)), request.path);
    auto response = co_await executor.execute(std::move(request));
    if (!co_await CheckStatus(response)) {
        co_return std::nullopt;
    }
    co_return std::optional<ApiResponse>(std::move(response));
}

asio::awaitable<ApiResponse> SendApiRequest(RequestExecutor& executor, ApiRequest request) {
    std::string path = request.path;
    auto response = co_await SendApiRequestOptional(executor, std::move(request));
    if (!response) {
        throw ClientError(ErrorKind::NotFound, "server sent 404 not found for " + path);
    }
    co_return std::move(*response);
}

asio::awaitable<boost::json::value> GetJson(RequestExecutor& executor, std::string path,
                                            std::optional<QueryParams> params) {
    auto request = ApiRequestBuilder::get(std::move(path)).params(std::move(params)).build();
    auto response = co_await SendApiRequest(executor, std::move(request));

    std::string text;
    if (response.body) {
        text = co_await ReadToString(*response.body, MAX_JSON_BODY);
    }

    boost::system::error_code ec;
    auto value = boost::json::parse(text, ec);
    if (ec) {
        throw ClientError(ErrorKind::InvalidData, "invalid json: " + ec.message());
    }
    co_return value;
}

}  // namespace renterd::network
