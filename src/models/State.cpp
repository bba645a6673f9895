#include "State.hpp"

#include <boost/json.hpp>
#include <exception>
#include <string>

#include "ClientError.hpp"

namespace json = boost::json;

namespace renterd::models {

using core::ClientError;
using core::ErrorKind;

namespace {

// --- Helpers ---

const json::object& as_object(const json::value& v) {
    const auto* obj = v.if_object();
    if (!obj) {
        throw ClientError(ErrorKind::InvalidData, "expected a json object");
    }
    return *obj;
}

template <class T>
T require(const json::object& obj, const char* key) {
    if (!obj.contains(key)) {
        throw ClientError(ErrorKind::InvalidData, std::string("Missing required key: ") + key);
    }
    try {
        return json::value_to<T>(obj.at(key));
    } catch (const std::exception& e) {
        throw ClientError(ErrorKind::InvalidData,
                          std::string("Failed to parse key '") + key + "': " + e.what());
    }
}

}  // namespace

CommonState ParseCommonState(const json::value& v) {
    const auto& obj = as_object(v);
    CommonState s;
    s.start_time = require<std::string>(obj, "startTime");
    s.network = require<std::string>(obj, "network");
    s.version = require<std::string>(obj, "version");
    s.commit = require<std::string>(obj, "commit");
    s.os = require<std::string>(obj, "os");
    s.build_time = require<std::string>(obj, "buildTime");
    return s;
}

WorkerState ParseWorkerState(const json::value& v) {
    WorkerState s;
    s.id = require<std::string>(as_object(v), "id");
    s.common = ParseCommonState(v);
    return s;
}

BusState ParseBusState(const json::value& v) { return BusState{ParseCommonState(v)}; }

AutopilotState ParseAutopilotState(const json::value& v) {
    const auto& obj = as_object(v);
    AutopilotState s;
    s.configured = require<bool>(obj, "configured");
    s.migrating = require<bool>(obj, "migrating");
    s.migrating_last_start = require<std::string>(obj, "migratingLastStart");
    s.pruning = require<bool>(obj, "pruning");
    s.pruning_last_start = require<std::string>(obj, "pruningLastStart");
    s.scanning = require<bool>(obj, "scanning");
    s.scanning_last_start = require<std::string>(obj, "scanningLastStart");
    s.uptime = std::chrono::milliseconds(require<int64_t>(obj, "uptimeMs"));
    s.common = ParseCommonState(v);
    return s;
}

}  // namespace renterd::models
