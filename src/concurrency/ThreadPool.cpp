#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace wtc::concurrency;

ThreadPool::ThreadPool(std::string name, const unsigned int nThreads)
    : name_(std::move(name)) {
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.exchange(true)) return;
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
    }
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();
        else if (t.joinable()) t.detach();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("ThreadPool '" + name_ + "' is stopped");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            try {
                (*task)();
            } catch (const std::exception& e) {
                log::Registry::wtc()->error("[ThreadPool:{}] Task threw: {}", name_, e.what());
            }

        }
    });
}
