#include "ByteRange.hpp"

#include <charconv>

#include "ClientError.hpp"

namespace renterd::core {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::optional<uint64_t> parse_u64(std::string_view s) {
    if (s.empty()) return std::nullopt;
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

[[noreturn]] void malformed(std::string_view header, std::string_view value) {
    throw ClientError(ErrorKind::Protocol,
                      "malformed " + std::string(header) + " header: `" + std::string(value) + "`");
}

}  // namespace

std::string ByteRange::to_header_value() const {
    std::string value = "bytes=" + std::to_string(start) + "-";
    if (end) {
        value += std::to_string(*end - 1);
    }
    return value;
}

ContentRange ParseContentRange(std::string_view value) {
    constexpr std::string_view UNIT = "bytes ";
    auto v = trim(value);
    if (!v.starts_with(UNIT)) malformed("Content-Range", value);
    v.remove_prefix(UNIT.size());

    auto slash = v.find('/');
    if (slash == std::string_view::npos) malformed("Content-Range", value);
    auto span = trim(v.substr(0, slash));
    auto total = trim(v.substr(slash + 1));

    ContentRange cr;
    if (total != "*") {
        cr.total = parse_u64(total);
        if (!cr.total) malformed("Content-Range", value);
    }

    if (span != "*") {
        auto dash = span.find('-');
        if (dash == std::string_view::npos) malformed("Content-Range", value);
        cr.first = parse_u64(span.substr(0, dash));
        cr.last = parse_u64(span.substr(dash + 1));
        if (!cr.first || !cr.last || *cr.last < *cr.first) malformed("Content-Range", value);
        if (cr.total && *cr.last >= *cr.total) malformed("Content-Range", value);
    } else if (!cr.total) {
        // "bytes */*" carries no information at all
        malformed("Content-Range", value);
    }
    return cr;
}

uint64_t ParseContentLength(std::string_view value) {
    auto parsed = parse_u64(trim(value));
    if (!parsed) malformed("Content-Length", value);
    return *parsed;
}

}  // namespace renterd::core
