#include "config.hpp"

#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

#include <boost/url/parse.hpp>
#include <filesystem>
#include <toml++/toml.hpp>

#include "ClientError.hpp"

namespace renterd::core {

Secret& Secret::operator=(const Secret& other) {
    if (this != &other) {
        wipe();
        value_ = other.value_;
    }
    return *this;
}

Secret::Secret(Secret&& other) noexcept : value_(other.value_) { other.wipe(); }

Secret& Secret::operator=(Secret&& other) noexcept {
    if (this != &other) {
        wipe();
        value_ = other.value_;
        other.wipe();
    }
    return *this;
}

Secret::~Secret() { wipe(); }

void Secret::wipe() noexcept {
    if (!value_.empty()) {
        OPENSSL_cleanse(value_.data(), value_.size());
        value_.clear();
    }
}

void ClientConfig::validate() const {
    if (api_endpoint_url.empty()) {
        throw ConfigError(
            "api endpoint is missing, you need to specify a valid url before building the client");
    }
    (void)endpoint();
    if (api_password.empty()) {
        throw ConfigError(
            "api password is missing, you need to specify a password before building the client");
    }
}

Endpoint ClientConfig::endpoint() const {
    auto parsed = boost::urls::parse_uri(api_endpoint_url);
    if (!parsed) {
        throw ConfigError("api endpoint `" + api_endpoint_url + "` is invalid");
    }
    const auto& url = *parsed;

    Endpoint ep;
    if (url.scheme_id() == boost::urls::scheme::https) {
        ep.tls = true;
    } else if (url.scheme_id() != boost::urls::scheme::http) {
        throw ConfigError("api endpoint `" + api_endpoint_url + "` is invalid");
    }

    if (!url.has_authority() || url.host().empty()) {
        throw ConfigError("api endpoint `" + api_endpoint_url + "` is invalid");
    }
    ep.host = url.host();
    ep.port = url.has_port() ? std::string(url.port()) : (ep.tls ? "443" : "80");

    ep.base_path = url.path();
    if (ep.base_path.empty() || ep.base_path.back() != '/') {
        ep.base_path.push_back('/');
    }
    return ep;
}

RangeFallback ParseRangeFallback(const std::string& name) {
    if (name == "discard") {
        return RangeFallback::DiscardUntilPosition;
    }
    if (name == "fail") {
        return RangeFallback::Fail;
    }
    throw ConfigError("unknown range_fallback `" + name + "` (expected `discard` or `fail`)");
}

namespace {

size_t require_size(const toml::node_view<toml::node>& node, size_t fallback, const char* key) {
    auto value = node.value_or<int64_t>(static_cast<int64_t>(fallback));
    if (value <= 0) {
        throw ConfigError(std::string("`") + key + "` must be a positive integer");
    }
    return static_cast<size_t>(value);
}

}  // namespace

AppConfig LoadConfig(const std::string& path) {
    AppConfig config;

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw ConfigError("Config parse error");
    }

    // 1. Client Settings
    if (auto client = tbl["client"]) {
        config.client.api_endpoint_url = client["endpoint"].value_or("");
        config.client.api_password = Secret(client["password"].value_or(std::string{}));
        config.client.accept_invalid_certs = client["accept_invalid_certs"].value_or(false);
        config.client.verbose_logging = client["verbose_logging"].value_or(false);
        config.client.request_timeout = std::chrono::milliseconds(
            require_size(client["request_timeout_ms"], config.client.request_timeout.count(),
                         "request_timeout_ms"));
    }

    // 2. Stream Settings
    if (auto stream = tbl["stream"]) {
        auto& sc = config.client.stream;
        sc.high_water_mark =
            require_size(stream["high_water_mark"], sc.high_water_mark, "high_water_mark");
        sc.chunk_size = require_size(stream["chunk_size"], sc.chunk_size, "chunk_size");
        sc.range_fallback =
            ParseRangeFallback(std::string(stream["range_fallback"].value_or("discard")));
    }

    // 3. Log Settings
    if (auto log = tbl["log"]) {
        config.log.level = log["level"].value_or(config.log.level);
        config.log.file = log["file"].value_or(config.log.file);
    }

    spdlog::info("Loaded configuration from {}", path);
    return config;
}

}  // namespace renterd::core
