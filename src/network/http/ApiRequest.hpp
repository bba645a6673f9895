#pragma once

#include <boost/beast/http/verb.hpp>
#include <boost/json/value.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "ByteSource.hpp"

namespace renterd::network {

struct StreamContent {
    std::shared_ptr<ByteSource> source;
    std::optional<std::string> content_type;
};

using RequestContent = std::variant<std::monostate, boost::json::value, StreamContent>;

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief One API call, independent of how it is sent.
 *
 * `path` is relative to the configured API endpoint (e.g. "worker/objects/a").
 */
struct ApiRequest {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    std::string path;
    QueryParams params;
    std::vector<std::pair<std::string, std::string>> headers;
    RequestContent content;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

/**
 * @brief Fluent builder for ApiRequest, one entry point per HTTP method.
 */
class ApiRequestBuilder {
   public:
    static ApiRequestBuilder get(std::string path);
    static ApiRequestBuilder post(std::string path);
    static ApiRequestBuilder put(std::string path);
    static ApiRequestBuilder del(std::string path);
    static ApiRequestBuilder head(std::string path);

    ApiRequestBuilder& param(std::string key, std::string value);
    ApiRequestBuilder& params(std::optional<QueryParams> params);
    ApiRequestBuilder& header(std::string name, std::string value);
    ApiRequestBuilder& json(boost::json::value body);
    ApiRequestBuilder& stream(std::shared_ptr<ByteSource> source,
                              std::optional<std::string> content_type);

    ApiRequest build();

   private:
    ApiRequestBuilder(boost::beast::http::verb method, std::string path);

    ApiRequest request_;
};

/**
 * @brief Joins an object path under an API prefix: ("/foo/bar", "worker/objects")
 * gives "worker/objects/foo/bar".
 */
std::string EncodeObjectPath(std::string_view path, std::string_view prefix);

}  // namespace renterd::network
