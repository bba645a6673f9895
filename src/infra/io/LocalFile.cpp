#include "LocalFile.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include "Types.hpp"

namespace renterd::infra {

asio::stream_file OpenForWrite(const asio::any_io_executor& ex, const std::filesystem::path& path) {
    if (path.has_parent_path()) {
        std::error_code dir_ec;
        std::filesystem::create_directories(path.parent_path(), dir_ec);
        if (dir_ec) {
            spdlog::warn("Could not create {}: {}", path.parent_path().string(), dir_ec.message());
        }
    }

    asio::stream_file file(ex);
    beast::error_code ec;
    file.open(path.string(),
              asio::stream_file::write_only | asio::stream_file::create |
                  asio::stream_file::truncate,
              ec);
    if (ec) {
        throw boost::system::system_error(ec, "Failed to open local file: " + path.string());
    }
    return file;
}

asio::awaitable<void> WriteAll(asio::stream_file& file, std::span<const uint8_t> bytes) {
    if (bytes.empty()) {
        co_return;
    }
    co_await asio::async_write(file, asio::buffer(bytes.data(), bytes.size()),
                               asio::use_awaitable);
}

FileByteSource::FileByteSource(const asio::any_io_executor& ex, const std::filesystem::path& path)
    : file_(ex) {
    beast::error_code ec;
    file_.open(path.string(), asio::stream_file::read_only, ec);
    if (ec) {
        throw boost::system::system_error(ec, "Failed to open local file: " + path.string());
    }
}

asio::awaitable<size_t> FileByteSource::read_some(asio::mutable_buffer buffer) {
    auto [ec, n] = co_await file_.async_read_some(buffer, asio::as_tuple(asio::use_awaitable));
    if (ec == asio::error::eof) {
        co_return 0;
    }
    if (ec) {
        throw boost::system::system_error(ec, "reading upload source");
    }
    co_return n;
}

}  // namespace renterd::infra
