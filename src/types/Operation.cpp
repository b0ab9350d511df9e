#include "types/Operation.hpp"

#include <algorithm>
#include <stdexcept>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

using namespace wtc::types;

std::string wtc::types::newRequestId() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

OperationRequest wtc::types::makeRequest(std::string verb, std::string target, const int priority,
                                         std::string callerId, const pid_t pid) {
    OperationRequest r;
    r.id = newRequestId();
    r.verb = std::move(verb);
    r.target = std::move(target);
    r.priority = std::clamp(priority, OperationRequest::MIN_PRIORITY, OperationRequest::MAX_PRIORITY);
    r.caller_id = std::move(callerId);
    r.pid = pid;
    r.submitted_at = Clock::now();
    return r;
}

std::string wtc::types::to_string(const OperationResult::Status& status) {
    switch (status) {
        case OperationResult::Status::Success: return "success";
        case OperationResult::Status::Timeout: return "timeout";
        case OperationResult::Status::Cancelled: return "cancelled";
        case OperationResult::Status::Unavailable: return "unavailable";
        case OperationResult::Status::Conflict: return "conflict";
        default: return "unknown";
    }
}

OperationResult::Status wtc::types::to_status(const std::string& str) {
    if (str == "success") return OperationResult::Status::Success;
    if (str == "timeout") return OperationResult::Status::Timeout;
    if (str == "cancelled") return OperationResult::Status::Cancelled;
    if (str == "unavailable") return OperationResult::Status::Unavailable;
    if (str == "conflict") return OperationResult::Status::Conflict;
    throw std::invalid_argument("Invalid status string: " + str);
}

void wtc::types::to_json(nlohmann::json& j, const OperationRequest& r) {
    j = {
        {"id", r.id},
        {"verb", r.verb},
        {"target", r.target},
        {"priority", r.priority},
        {"caller_id", r.caller_id},
        {"pid", r.pid},
        {"timeout_ms", r.acquire_timeout.count()}
    };
}

void wtc::types::to_json(nlohmann::json& j, const OperationResult& r) {
    j = {
        {"request_id", r.request_id},
        {"status", to_string(r.status)},
        {"scope_used", r.scope_used},
        {"duration_ms", r.duration_ms},
        {"waited_ms", r.waited_ms},
        {"exit_code", r.exit_code},
        {"degraded", r.degraded}
    };
    if (!r.holder.empty()) j["holder"] = r.holder;
    if (!r.message.empty()) j["message"] = r.message;
}

void wtc::types::from_json(const nlohmann::json& j, OperationResult& r) {
    r.request_id = j.value("request_id", "");
    r.status = to_status(j.at("status").get<std::string>());
    r.scope_used = j.value("scope_used", "");
    r.duration_ms = j.value("duration_ms", uint64_t{0});
    r.waited_ms = j.value("waited_ms", uint64_t{0});
    r.holder = j.value("holder", "");
    r.message = j.value("message", "");
    r.exit_code = j.value("exit_code", 0);
    r.degraded = j.value("degraded", false);
}
