#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/stream_file.hpp>
#include <filesystem>
#include <span>

#include "ByteSource.hpp"

namespace renterd::infra {

// Open `path` for writing, creating parent directories and truncating.
boost::asio::stream_file OpenForWrite(const boost::asio::any_io_executor& ex,
                                      const std::filesystem::path& path);

boost::asio::awaitable<void> WriteAll(boost::asio::stream_file& file,
                                      std::span<const uint8_t> bytes);

/// Upload source reading a local file front to back.
class FileByteSource : public network::ByteSource {
   public:
    FileByteSource(const boost::asio::any_io_executor& ex, const std::filesystem::path& path);

    boost::asio::awaitable<size_t> read_some(boost::asio::mutable_buffer buffer) override;

   private:
    boost::asio::stream_file file_;
};

}  // namespace renterd::infra
