#pragma once

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace renterd::core {

enum class ErrorKind : uint8_t {
    NotFound,
    RangeNotSatisfiable,
    UnknownLength,
    Transport,
    Protocol,
    Authentication,
    HttpResponse,
    NotSeekable,
    InvalidData,
    InvalidArgument
};

std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @brief Every failure surfaced by the client.
 *
 * Transport failures keep the originating error_code so callers can tell a
 * cancellation (asio::error::operation_aborted) from a timeout or reset.
 * HttpResponse failures keep the status code and the trimmed response text.
 */
class ClientError : public std::runtime_error {
   public:
    ClientError(ErrorKind kind, const std::string& what);
    ClientError(ErrorKind kind, boost::system::error_code ec, const std::string& what);
    ClientError(unsigned status, std::string body);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] boost::system::error_code code() const noexcept { return ec_; }
    [[nodiscard]] unsigned status() const noexcept { return status_; }
    [[nodiscard]] const std::string& body() const noexcept { return body_; }

   private:
    ErrorKind kind_;
    boost::system::error_code ec_;
    unsigned status_ = 0;
    std::string body_;
};

/// Thrown when the client configuration is missing or unusable.
class ConfigError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

}  // namespace renterd::core
