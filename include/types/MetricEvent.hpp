#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wtc::types {

struct MetricEvent {
    enum class Type { Acquired, Released, Waited, TimedOut, StaleReclaimed };

    int64_t timestamp_ms = 0;   // unix epoch
    Type type{Type::Acquired};
    std::string scope_id;
    uint64_t duration_ms = 0;
    std::string verb;

    static MetricEvent now(Type type, std::string scopeId, uint64_t durationMs, std::string verb);

    // timestamp,event_type,scope_id,duration_ms,verb
    [[nodiscard]] std::string toCsvLine() const;
    static std::optional<MetricEvent> fromCsvLine(std::string_view line);
};

std::string to_string(const MetricEvent::Type& type);
MetricEvent::Type to_event_type(const std::string& str);

int64_t epochMillisNow();

}
