#include "Objects.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <string>

#include "ApiCall.hpp"
#include "ByteRange.hpp"
#include "ClientError.hpp"
#include "Types.hpp"

namespace renterd::api {

using core::ClientError;
using core::ErrorKind;
using network::ApiRequestBuilder;

namespace {

constexpr std::string_view OBJECTS_PREFIX = "worker/objects";

std::optional<network::QueryParams> bucket_param(const std::optional<std::string>& bucket) {
    if (!bucket) return std::nullopt;
    return network::QueryParams{{"bucket", *bucket}};
}

std::optional<std::string> copy_header(const network::ApiResponse& response, http::field name) {
    if (auto value = response.header(name)) {
        return std::string(*value);
    }
    return std::nullopt;
}

}  // namespace

network::ApiRequest DownloadHeadRequest(const std::string& path,
                                        const std::optional<std::string>& bucket) {
    return ApiRequestBuilder::head(network::EncodeObjectPath(path, OBJECTS_PREFIX))
        .params(bucket_param(bucket))
        .build();
}

network::ApiRequest UploadRequest(const std::string& path,
                                  std::shared_ptr<network::ByteSource> source,
                                  std::optional<std::string> content_type,
                                  const std::optional<std::string>& bucket) {
    return ApiRequestBuilder::put(network::EncodeObjectPath(path, OBJECTS_PREFIX))
        .params(bucket_param(bucket))
        .stream(std::move(source), std::move(content_type))
        .build();
}

network::ApiRequest DeleteRequest(const std::string& path, const std::optional<std::string>& bucket,
                                  bool batch) {
    auto builder = ApiRequestBuilder::del(network::EncodeObjectPath(path, OBJECTS_PREFIX));
    if (bucket) {
        builder.param("bucket", *bucket);
    }
    builder.param("batch", batch ? "true" : "false");
    return builder.build();
}

// =========================================================
//  DownloadableObject
// =========================================================

DownloadableObject::DownloadableObject(std::shared_ptr<network::RequestExecutor> executor,
                                       core::StreamConfig stream_cfg, std::string path,
                                       std::optional<std::string> bucket)
    : path(std::move(path)),
      bucket(std::move(bucket)),
      executor_(std::move(executor)),
      stream_cfg_(stream_cfg) {}

core::RemoteObjectHandle DownloadableObject::handle(bool seekable) const {
    core::RemoteObjectHandle h;
    h.path = path;
    h.api_path = network::EncodeObjectPath(path, OBJECTS_PREFIX);
    h.bucket = bucket;
    h.length = length;
    h.content_type = content_type;
    h.seekable = seekable;
    return h;
}

std::unique_ptr<core::SeekableObjectStream> DownloadableObject::open_stream() const {
    return std::make_unique<core::SeekableObjectStream>(executor_, handle(false), stream_cfg_);
}

asio::awaitable<std::unique_ptr<core::SeekableObjectStream>>
DownloadableObject::open_seekable_stream(uint64_t initial_offset) const {
    if (!seekable) {
        throw ClientError(ErrorKind::NotSeekable, "the object at `" + path + "` is not seekable");
    }
    auto stream = std::make_unique<core::SeekableObjectStream>(executor_, handle(true), stream_cfg_);
    if (initial_offset > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw ClientError(ErrorKind::InvalidArgument,
                          "initial offset " + std::to_string(initial_offset) + " is out of range");
    }
    co_await stream->seek(static_cast<int64_t>(initial_offset), core::SeekMode::FromStart);
    co_return stream;
}

// =========================================================
//  ObjectsApi
// =========================================================

asio::awaitable<std::optional<DownloadableObject>> ObjectsApi::download(
    const std::string& path, std::optional<std::string> bucket) const {
    auto response =
        co_await network::SendApiRequestOptional(*executor_, DownloadHeadRequest(path, bucket));
    if (!response) {
        spdlog::debug("Object `{}` not found", path);
        co_return std::nullopt;
    }
    response->body.reset();

    DownloadableObject object(executor_, stream_cfg_, path, std::move(bucket));

    if (auto value = response->header(http::field::content_length)) {
        try {
            object.length = core::ParseContentLength(*value);
        } catch (const ClientError& e) {
            throw ClientError(ErrorKind::InvalidData,
                              "invalid Content-Length for `" + path + "`: " + e.what());
        }
    }
    object.content_type = copy_header(*response, http::field::content_type);
    object.etag = copy_header(*response, http::field::etag);
    object.last_modified = copy_header(*response, http::field::last_modified);

    const auto accept_ranges = response->header(http::field::accept_ranges);
    const bool byte_ranges = accept_ranges && accept_ranges->starts_with("bytes");
    object.seekable = byte_ranges && object.length.value_or(0) > 0;

    spdlog::info("Object `{}` ready for download ({} bytes, {})", path,
                 object.length ? std::to_string(*object.length) : "unknown",
                 object.seekable ? "seekable" : "sequential");
    co_return object;
}

asio::awaitable<void> ObjectsApi::upload(const std::string& path,
                                         std::shared_ptr<network::ByteSource> source,
                                         std::optional<std::string> content_type,
                                         std::optional<std::string> bucket) const {
    spdlog::info("Uploading `{}`", path);
    auto response = co_await network::SendApiRequest(
        *executor_, UploadRequest(path, std::move(source), std::move(content_type), bucket));
    response.body.reset();
    spdlog::info("Upload of `{}` complete", path);
}

asio::awaitable<void> ObjectsApi::remove(const std::string& path,
                                         std::optional<std::string> bucket, bool batch) const {
    auto response = co_await network::SendApiRequest(*executor_, DeleteRequest(path, bucket, batch));
    response.body.reset();
    spdlog::info("Deleted `{}`", path);
}

}  // namespace renterd::api
