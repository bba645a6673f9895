#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "BufferedWindow.hpp"

namespace renterd::core {

class SeekableObjectStream;

/**
 * @brief RAII guard. Undoes a read on destruction unless disarmed.
 *
 * Covers exceptions as well as a coroutine frame destroyed while suspended:
 * the position goes back to where the read started and the bytes taken so
 * far are returned to the window.
 *
 * A read that has to fetch calls save_window() first. On rollback the saved
 * window is put back and only the bytes taken before the save are returned to
 * it; bytes from the new body are dropped.
 */
class ReadRollbackGuard {
   public:
    ReadRollbackGuard(SeekableObjectStream& stream, const std::vector<uint8_t>& taken);

    // Disarm the guard on success
    void disarm() { engaged_ = false; }

    // Keeps a copy of the window as it is now. Only the first call counts.
    void save_window();

    ~ReadRollbackGuard();

    ReadRollbackGuard(const ReadRollbackGuard&) = delete;
    ReadRollbackGuard& operator=(const ReadRollbackGuard&) = delete;
    ReadRollbackGuard(ReadRollbackGuard&&) = delete;
    ReadRollbackGuard& operator=(ReadRollbackGuard&&) = delete;

   private:
    SeekableObjectStream& stream_;
    const std::vector<uint8_t>& taken_;
    uint64_t position_;
    std::optional<BufferedWindow> saved_window_;
    size_t taken_before_save_ = 0;
    bool engaged_ = true;
};

}  // namespace renterd::core
