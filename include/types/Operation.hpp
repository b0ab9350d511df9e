#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <nlohmann/json_fwd.hpp>

namespace wtc::types {

using Clock = std::chrono::steady_clock;

struct OperationRequest {
    std::string id;             // uuid, assigned by makeRequest()
    std::string verb;
    std::string target;         // worktree id hint, may be empty
    int priority = 5;           // 1..10
    std::string caller_id;
    pid_t pid = 0;              // submitting process, 0 when in-process
    Clock::time_point submitted_at{};
    std::chrono::milliseconds acquire_timeout{0};   // per attempt; zero uses the coordinator's setting

    static constexpr int MIN_PRIORITY = 1;
    static constexpr int MAX_PRIORITY = 10;
};

// Clamps priority into range and stamps id + submitted_at.
OperationRequest makeRequest(std::string verb, std::string target, int priority,
                             std::string callerId, pid_t pid = 0);

std::string newRequestId();

struct OperationResult {
    enum class Status { Success, Timeout, Cancelled, Unavailable, Conflict };

    std::string request_id;
    Status status{Status::Success};
    std::string scope_used;
    uint64_t duration_ms = 0;   // submission to terminal state
    uint64_t waited_ms = 0;     // time spent acquiring (or contending before timeout)
    std::string holder;         // contended holder on timeout/conflict
    std::string message;
    int exit_code = 0;          // exit code reported by the caller-owned operation
    bool degraded = false;      // granted by the client-side fallback, not the coordinator

    [[nodiscard]] bool ok() const noexcept { return status == Status::Success; }
};

std::string to_string(const OperationResult::Status& status);
OperationResult::Status to_status(const std::string& str);

void to_json(nlohmann::json& j, const OperationRequest& r);
void to_json(nlohmann::json& j, const OperationResult& r);
void from_json(const nlohmann::json& j, OperationResult& r);

}
