#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace renterd::core {

/**
 * @brief Half-open interval [start, end) of an object, or [start, inf) when
 * end is empty.
 */
struct ByteRange {
    uint64_t start = 0;
    std::optional<uint64_t> end;

    [[nodiscard]] bool is_open_ended() const noexcept { return !end.has_value(); }
    [[nodiscard]] bool contains(uint64_t offset) const noexcept {
        return offset >= start && (!end || offset < *end);
    }
    [[nodiscard]] std::optional<uint64_t> length() const noexcept {
        if (!end) return std::nullopt;
        return *end - start;
    }

    // "bytes=N-" or "bytes=N-M" (M inclusive)
    [[nodiscard]] std::string to_header_value() const;

    bool operator==(const ByteRange&) const = default;
};

/**
 * @brief A parsed Content-Range header: "bytes first-last/total".
 *
 * "first-last" is "*" in 416 responses and "total" is "*" when the server
 * does not know the size.
 */
struct ContentRange {
    std::optional<uint64_t> first;
    std::optional<uint64_t> last;  // inclusive
    std::optional<uint64_t> total;
};

/// @throws ClientError(Protocol) when the value is not a byte Content-Range.
ContentRange ParseContentRange(std::string_view value);

/// @throws ClientError(Protocol) when the value is not a decimal length.
uint64_t ParseContentLength(std::string_view value);

}  // namespace renterd::core
