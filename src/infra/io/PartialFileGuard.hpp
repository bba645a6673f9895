#pragma once

#include <filesystem>
#include <string>

#include "spdlog/spdlog.h"

namespace renterd::infra {

/**
 * @brief RAII guard. Deletes a partially downloaded file unless disarmed.
 */
class PartialFileGuard {
   public:
    explicit PartialFileGuard(std::filesystem::path path) : path_(std::move(path)) {}

    // Disarm the guard once the download completed
    void disarm() { engaged_ = false; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    ~PartialFileGuard() {
        if (!engaged_ || path_.empty()) {
            return;
        }
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            return;
        }
        std::filesystem::remove(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove partial file {}: {}", path_.string(), ec.message());
        } else {
            spdlog::info("Removed partial download file: {}", path_.string());
        }
    }

    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;
    PartialFileGuard(PartialFileGuard&&) = delete;
    PartialFileGuard& operator=(PartialFileGuard&&) = delete;

   private:
    std::filesystem::path path_;
    bool engaged_ = true;
};

}  // namespace renterd::infra
