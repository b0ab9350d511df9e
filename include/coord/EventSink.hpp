#pragma once

#include "types/MetricEvent.hpp"

namespace wtc::coord {

// One-way notification channel out of the registry. Implementations must not block.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void record(const types::MetricEvent& event) = 0;
};

}
