#include "ClientError.hpp"

namespace renterd::core {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::RangeNotSatisfiable: return "range not satisfiable";
        case ErrorKind::UnknownLength: return "unknown length";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::HttpResponse: return "http response";
        case ErrorKind::NotSeekable: return "not seekable";
        case ErrorKind::InvalidData: return "invalid data";
        case ErrorKind::InvalidArgument: return "invalid argument";
    }
    return "unknown";
}

ClientError::ClientError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

ClientError::ClientError(ErrorKind kind, boost::system::error_code ec, const std::string& what)
    : std::runtime_error(what + ": " + ec.message()), kind_(kind), ec_(ec) {}

ClientError::ClientError(unsigned status, std::string body)
    : std::runtime_error("http response error, status code: " + std::to_string(status) +
                         ", text: " + body),
      kind_(ErrorKind::HttpResponse),
      status_(status),
      body_(std::move(body)) {}

}  // namespace renterd::core
