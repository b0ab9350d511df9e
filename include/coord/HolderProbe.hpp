#pragma once

#include "coord/Lock.hpp"

namespace wtc::coord {

// Decides whether the process/session behind a lock is still alive.
class HolderProbe {
public:
    virtual ~HolderProbe() = default;
    [[nodiscard]] virtual bool isAlive(const Lock& lock) const = 0;
};

// kill(pid, 0); in-process holders (pid 0) are always considered alive.
class ProcessProbe final : public HolderProbe {
public:
    [[nodiscard]] bool isAlive(const Lock& lock) const override;
};

}
