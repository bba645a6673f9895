#include "ApiRequest.hpp"

#include <boost/beast/core/string.hpp>

namespace renterd::network {

namespace http = boost::beast::http;

std::optional<std::string_view> ApiRequest::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (boost::beast::iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

ApiRequestBuilder::ApiRequestBuilder(http::verb method, std::string path) {
    request_.method = method;
    request_.path = std::move(path);
}

ApiRequestBuilder ApiRequestBuilder::get(std::string path) {
    return {http::verb::get, std::move(path)};
}

ApiRequestBuilder ApiRequestBuilder::post(std::string path) {
    return {http::verb::post, std::move(path)};
}

ApiRequestBuilder ApiRequestBuilder::put(std::string path) {
    return {http::verb::put, std::move(path)};
}

ApiRequestBuilder ApiRequestBuilder::del(std::string path) {
    return {http::verb::delete_, std::move(path)};
}

ApiRequestBuilder ApiRequestBuilder::head(std::string path) {
    return {http::verb::head, std::move(path)};
}

ApiRequestBuilder& ApiRequestBuilder::param(std::string key, std::string value) {
    request_.params.emplace_back(std::move(key), std::move(value));
    return *this;
}

ApiRequestBuilder& ApiRequestBuilder::params(std::optional<QueryParams> params) {
    if (params) {
        for (auto& [key, value] : *params) {
            request_.params.emplace_back(std::move(key), std::move(value));
        }
    }
    return *this;
}

ApiRequestBuilder& ApiRequestBuilder::header(std::string name, std::string value) {
    request_.headers.emplace_back(std::move(name), std::move(value));
    return *this;
}

ApiRequestBuilder& ApiRequestBuilder::json(boost::json::value body) {
    request_.content = std::move(body);
    return *this;
}

ApiRequestBuilder& ApiRequestBuilder::stream(std::shared_ptr<ByteSource> source,
                                             std::optional<std::string> content_type) {
    request_.content = StreamContent{std::move(source), std::move(content_type)};
    return *this;
}

ApiRequest ApiRequestBuilder::build() { return std::move(request_); }

std::string EncodeObjectPath(std::string_view path, std::string_view prefix) {
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    std::string out(prefix);
    out.push_back('/');
    out.append(path);
    return out;
}

}  // namespace renterd::network
