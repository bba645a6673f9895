#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

static constexpr size_t KILOBYTE = 1024;
static constexpr size_t MEGABYTE = 1024 * KILOBYTE;

namespace renterd::core {

/**
 * @brief Owns a credential and wipes it from memory on destruction.
 */
class Secret {
   public:
    Secret() = default;
    explicit Secret(std::string value) : value_(std::move(value)) {}
    Secret(const Secret&) = default;
    Secret& operator=(const Secret& other);
    Secret(Secret&& other) noexcept;
    Secret& operator=(Secret&& other) noexcept;
    ~Secret();

    [[nodiscard]] const std::string& reveal() const noexcept { return value_; }
    [[nodiscard]] bool empty() const noexcept { return value_.empty(); }

   private:
    void wipe() noexcept;

    std::string value_;
};

// What to do when a ranged GET is answered with the full body (HTTP 200).
enum class RangeFallback : uint8_t {
    DiscardUntilPosition,
    Fail
};

struct StreamConfig {
    // Upper bound on bytes buffered ahead of the reader.
    size_t high_water_mark = 4 * MEGABYTE;
    // Largest single pull from the response body.
    size_t chunk_size = 64 * KILOBYTE;
    RangeFallback range_fallback = RangeFallback::DiscardUntilPosition;
};

struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    // Always ends with '/'.
    std::string base_path;
};

struct ClientConfig {
    std::string api_endpoint_url;
    Secret api_password;
    bool accept_invalid_certs = false;
    bool verbose_logging = false;
    std::chrono::milliseconds request_timeout{30000};  // NOLINT
    StreamConfig stream;

    /**
     * @brief Checks that the endpoint is an absolute http(s) URL with a host
     * and that a password is present.
     * @throws ConfigError describing the first problem found.
     */
    void validate() const;

    /// @throws ConfigError if the endpoint URL cannot be used.
    [[nodiscard]] Endpoint endpoint() const;
};

struct LogConfig {
    std::string level = "info";
    std::string file = "logs/renterd_fetch.log";
};

struct AppConfig {
    ClientConfig client;
    LogConfig log;
};

/**
 * @brief Loads configuration from a TOML file.
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig object.
 * @throws ConfigError if file cannot be parsed.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

RangeFallback ParseRangeFallback(const std::string& name);

}  // namespace renterd::core
