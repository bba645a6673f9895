#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace renterd::core {

/**
 * @brief What the download-initiation call learned about an object.
 */
struct RemoteObjectHandle {
    // Object path as given by the caller.
    std::string path;
    // API route the object's bytes are fetched from.
    std::string api_path;
    std::optional<std::string> bucket;
    std::optional<uint64_t> length;
    std::optional<std::string> content_type;
    bool seekable = true;
};

}  // namespace renterd::core
