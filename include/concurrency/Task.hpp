#pragma once

#include <functional>
#include <memory>

namespace wtc::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

struct FunctionTask final : Task {
    explicit FunctionTask(std::function<void()> fn) : fn_(std::move(fn)) {}
    void operator()() override { fn_(); }

private:
    std::function<void()> fn_;
};

inline std::shared_ptr<Task> makeTask(std::function<void()> fn) {
    return std::make_shared<FunctionTask>(std::move(fn));
}

}
