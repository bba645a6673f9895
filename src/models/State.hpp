#pragma once

#include <boost/json/value.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace renterd::models {

// -------- State Models --------
// Timestamps are kept as the RFC 3339 strings the daemon sends.

struct CommonState {
    std::string start_time;
    std::string network;
    std::string version;
    std::string commit;
    std::string os;
    std::string build_time;

    bool operator==(const CommonState&) const = default;
};

struct WorkerState {
    std::string id;
    CommonState common;

    bool operator==(const WorkerState&) const = default;
};

struct BusState {
    CommonState common;

    bool operator==(const BusState&) const = default;
};

struct AutopilotState {
    bool configured = false;
    bool migrating = false;
    std::string migrating_last_start;
    bool pruning = false;
    std::string pruning_last_start;
    bool scanning = false;
    std::string scanning_last_start;
    std::chrono::milliseconds uptime{0};
    CommonState common;

    bool operator==(const AutopilotState&) const = default;
};

// -------- Parsers --------
// All throw ClientError(InvalidData) on a missing or mistyped field.

CommonState ParseCommonState(const boost::json::value& v);
WorkerState ParseWorkerState(const boost::json::value& v);
BusState ParseBusState(const boost::json::value& v);
AutopilotState ParseAutopilotState(const boost::json::value& v);

}  // namespace renterd::models
