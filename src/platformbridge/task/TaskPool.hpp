#pragma once
#include "core/Error.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace PB {

// Worker threads owned by one engine instance. Handlers that must not block the
// platform thread submit their work here and answer from a worker.
class TaskPool {
public:
    using Job = std::function<void()>;

    explicit TaskPool(size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool();

    TaskPool(TaskPool const&)                    = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto submit(Job job) -> std::optional<Error>;
    // Stops accepting jobs, runs whatever is already queued and joins the workers.
    // Must not be called from a job.
    auto shutdown() -> void;
    auto size() const -> size_t;
    // Jobs that ended by throwing.
    auto failedJobs() const -> size_t;

private:
    auto workerFunction() -> void;

    std::vector<std::jthread> workers;
    std::queue<Job>           jobs;
    std::mutex                mutex;
    std::condition_variable   jobCV;
    std::atomic<bool>         shuttingDown{false};
    std::atomic<size_t>       activeWorkers{0};
    std::atomic<size_t>       failed{0};
};

} // namespace PB
