#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <string>

#include "Objects.hpp"
#include "RequestExecutor.hpp"
#include "State.hpp"
#include "config.hpp"

namespace renterd::api {

class BusApi {
   public:
    explicit BusApi(std::shared_ptr<network::RequestExecutor> executor)
        : executor_(std::move(executor)) {}

    boost::asio::awaitable<models::BusState> state() const;

   private:
    std::shared_ptr<network::RequestExecutor> executor_;
};

class AutopilotApi {
   public:
    explicit AutopilotApi(std::shared_ptr<network::RequestExecutor> executor)
        : executor_(std::move(executor)) {}

    boost::asio::awaitable<models::AutopilotState> state() const;

   private:
    std::shared_ptr<network::RequestExecutor> executor_;
};

class WorkerApi {
   public:
    WorkerApi(std::shared_ptr<network::RequestExecutor> executor, core::StreamConfig stream_cfg)
        : executor_(std::move(executor)), stream_cfg_(stream_cfg) {}

    boost::asio::awaitable<std::string> id() const;
    boost::asio::awaitable<models::WorkerState> state() const;
    [[nodiscard]] ObjectsApi objects() const { return ObjectsApi(executor_, stream_cfg_); }

   private:
    std::shared_ptr<network::RequestExecutor> executor_;
    core::StreamConfig stream_cfg_;
};

/**
 * @brief Entry point to the renterd HTTP API.
 *
 * The client is a cheap handle over a shared request executor. Sub-APIs
 * returned by bus(), worker() and autopilot() share that executor and may
 * outlive the client.
 */
class Client {
   public:
    /// @throws ConfigError when `cfg` does not validate.
    Client(boost::asio::any_io_executor ex, const core::ClientConfig& cfg);

    explicit Client(std::shared_ptr<network::RequestExecutor> executor,
                    core::StreamConfig stream_cfg = {});

    [[nodiscard]] BusApi bus() const { return BusApi(executor_); }
    [[nodiscard]] WorkerApi worker() const { return WorkerApi(executor_, stream_cfg_); }
    [[nodiscard]] AutopilotApi autopilot() const { return AutopilotApi(executor_); }

    [[nodiscard]] const std::shared_ptr<network::RequestExecutor>& executor() const noexcept {
        return executor_;
    }

   private:
    std::shared_ptr<network::RequestExecutor> executor_;
    core::StreamConfig stream_cfg_;
};

}  // namespace renterd::api
