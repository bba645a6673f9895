#pragma once

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ByteSource.hpp"
#include "RequestExecutor.hpp"
#include "SeekableObjectStream.hpp"
#include "config.hpp"

namespace renterd::api {

/**
 * @brief An object the worker is ready to serve, as reported by its HEAD response.
 */
class DownloadableObject {
   public:
    DownloadableObject(std::shared_ptr<network::RequestExecutor> executor,
                       core::StreamConfig stream_cfg, std::string path,
                       std::optional<std::string> bucket);

    std::string path;
    std::optional<std::string> bucket;
    std::optional<uint64_t> length;
    std::optional<std::string> content_type;
    std::optional<std::string> etag;
    std::optional<std::string> last_modified;
    bool seekable = false;

    /// Stream that reads the object front to back without range requests.
    [[nodiscard]] std::unique_ptr<core::SeekableObjectStream> open_stream() const;

    /**
     * @brief Stream positioned at `initial_offset` that can be seeked freely.
     * @throws ClientError(NotSeekable) when the server does not serve byte ranges
     *         for this object.
     */
    boost::asio::awaitable<std::unique_ptr<core::SeekableObjectStream>> open_seekable_stream(
        uint64_t initial_offset = 0) const;

   private:
    [[nodiscard]] core::RemoteObjectHandle handle(bool seekable) const;

    std::shared_ptr<network::RequestExecutor> executor_;
    core::StreamConfig stream_cfg_;
};

class ObjectsApi {
   public:
    ObjectsApi(std::shared_ptr<network::RequestExecutor> executor, core::StreamConfig stream_cfg)
        : executor_(std::move(executor)), stream_cfg_(stream_cfg) {}

    /// HEAD the object. An empty optional means the worker does not know it.
    boost::asio::awaitable<std::optional<DownloadableObject>> download(
        const std::string& path, std::optional<std::string> bucket = std::nullopt) const;

    /// PUT `source` as the object's content, sent with chunked encoding.
    boost::asio::awaitable<void> upload(const std::string& path,
                                        std::shared_ptr<network::ByteSource> source,
                                        std::optional<std::string> content_type = std::nullopt,
                                        std::optional<std::string> bucket = std::nullopt) const;

    boost::asio::awaitable<void> remove(const std::string& path,
                                        std::optional<std::string> bucket = std::nullopt,
                                        bool batch = false) const;

   private:
    std::shared_ptr<network::RequestExecutor> executor_;
    core::StreamConfig stream_cfg_;
};

// Request factories, exposed for tests.
network::ApiRequest DownloadHeadRequest(const std::string& path,
                                        const std::optional<std::string>& bucket);
network::ApiRequest UploadRequest(const std::string& path,
                                  std::shared_ptr<network::ByteSource> source,
                                  std::optional<std::string> content_type,
                                  const std::optional<std::string>& bucket);
network::ApiRequest DeleteRequest(const std::string& path, const std::optional<std::string>& bucket,
                                  bool batch);

}  // namespace renterd::api
