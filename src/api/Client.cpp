#include "Client.hpp"

#include <spdlog/spdlog.h>

#include <boost/json/value.hpp>
#include <stdexcept>

#include "ApiCall.hpp"
#include "BeastRequestExecutor.hpp"
#include "ClientError.hpp"
#include "Types.hpp"

namespace renterd::api {

using core::ClientError;
using core::ErrorKind;

namespace {

std::shared_ptr<network::RequestExecutor> make_executor(asio::any_io_executor ex,
                                                        const core::ClientConfig& cfg) {
    cfg.validate();
    return std::make_shared<network::BeastRequestExecutor>(std::move(ex), cfg);
}

}  // namespace

Client::Client(asio::any_io_executor ex, const core::ClientConfig& cfg)
    : executor_(make_executor(std::move(ex), cfg)), stream_cfg_(cfg.stream) {
    spdlog::info("renterd client for {} ready", cfg.api_endpoint_url);
}

Client::Client(std::shared_ptr<network::RequestExecutor> executor, core::StreamConfig stream_cfg)
    : executor_(std::move(executor)), stream_cfg_(stream_cfg) {
    if (!executor_) {
        throw std::invalid_argument("Client requires a request executor");
    }
}

asio::awaitable<models::BusState> BusApi::state() const {
    co_return models::ParseBusState(co_await network::GetJson(*executor_, "bus/state"));
}

asio::awaitable<models::AutopilotState> AutopilotApi::state() const {
    co_return models::ParseAutopilotState(
        co_await network::GetJson(*executor_, "autopilot/state"));
}

asio::awaitable<std::string> WorkerApi::id() const {
    auto value = co_await network::GetJson(*executor_, "worker/id");
    const auto* id = value.if_string();
    if (!id) {
        throw ClientError(ErrorKind::InvalidData, "worker id is not a json string");
    }
    co_return std::string(*id);
}

asio::awaitable<models::WorkerState> WorkerApi::state() const {
    co_return models::ParseWorkerState(co_await network::GetJson(*executor_, "worker/state"));
}

}  // namespace renterd::api
