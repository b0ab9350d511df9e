#pragma once

#include "types/Operation.hpp"

#include <cstdint>
#include <string>
#include <sys/types.h>
#include <nlohmann/json_fwd.hpp>

namespace wtc::coord {

struct Lock {
    std::string scope_id;
    std::string holder_id;      // request id, or "advisory:<caller>"
    std::string owner;          // caller id
    std::string verb;
    pid_t pid = 0;
    types::Clock::time_point acquired_at{}, ttl_deadline{};
    uint64_t generation = 0;
    bool advisory = false;
};

inline std::string advisoryHolderFor(const std::string& callerId) { return "advisory:" + callerId; }

void to_json(nlohmann::json& j, const Lock& l);

}
