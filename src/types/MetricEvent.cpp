#include "types/MetricEvent.hpp"

#include <chrono>
#include <stdexcept>
#include <vector>
#include <fmt/format.h>

using namespace wtc::types;

int64_t wtc::types::epochMillisNow() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

MetricEvent MetricEvent::now(const Type type, std::string scopeId, const uint64_t durationMs, std::string verb) {
    return {epochMillisNow(), type, std::move(scopeId), durationMs, std::move(verb)};
}

std::string MetricEvent::toCsvLine() const {
    // Commas would shift the columns of the feed; verbs never legitimately carry them.
    std::string safeVerb = verb;
    for (auto& c : safeVerb) if (c == ',' || c == '\n') c = ' ';
    return fmt::format("{},{},{},{},{}", timestamp_ms, to_string(type), scope_id, duration_ms, safeVerb);
}

std::optional<MetricEvent> MetricEvent::fromCsvLine(const std::string_view line) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() < 4) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) return std::nullopt;
        fields.emplace_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    fields.emplace_back(line.substr(start));

    try {
        MetricEvent e;
        e.timestamp_ms = std::stoll(fields[0]);
        e.type = to_event_type(fields[1]);
        e.scope_id = fields[2];
        e.duration_ms = std::stoull(fields[3]);
        e.verb = fields[4];
        return e;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string wtc::types::to_string(const MetricEvent::Type& type) {
    switch (type) {
        case MetricEvent::Type::Acquired: return "acquired";
        case MetricEvent::Type::Released: return "released";
        case MetricEvent::Type::Waited: return "waited";
        case MetricEvent::Type::TimedOut: return "timed_out";
        case MetricEvent::Type::StaleReclaimed: return "stale_reclaimed";
        default: return "unknown";
    }
}

MetricEvent::Type wtc::types::to_event_type(const std::string& str) {
    if (str == "acquired") return MetricEvent::Type::Acquired;
    if (str == "released") return MetricEvent::Type::Released;
    if (str == "waited") return MetricEvent::Type::Waited;
    if (str == "timed_out") return MetricEvent::Type::TimedOut;
    if (str == "stale_reclaimed") return MetricEvent::Type::StaleReclaimed;
    throw std::invalid_argument("Invalid metric event type: " + str);
}
