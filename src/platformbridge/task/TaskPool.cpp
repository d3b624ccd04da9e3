#include "task/TaskPool.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <system_error>

namespace PB {

TaskPool::TaskPool(size_t threadCount) {
    pb_log("TaskPool::TaskPool constructing", "TaskPool");
    if (threadCount == 0) threadCount = 1;
    for (size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&TaskPool::workerFunction, this);
            ++activeWorkers;
        } catch (std::system_error const& error) {
            pb_log("TaskPool::TaskPool failed to spawn worker: " + std::string(error.what()), "TaskPool", "Error");
            break;
        }
    }
    pb_log("TaskPool::TaskPool constructed with workers=" + std::to_string(activeWorkers.load()), "TaskPool");
}

TaskPool::~TaskPool() {
    pb_log("TaskPool::~TaskPool", "TaskPool");
    shutdown();
}

auto TaskPool::submit(Job job) -> std::optional<Error> {
    if (!job) {
        return Error{Error::Code::InvalidArgument, "Empty job"};
    }
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            pb_log("TaskPool::submit refused: shutting down", "TaskPool");
            return Error{Error::Code::ChannelClosed, "Task pool shutting down"};
        }
        if (this->workers.empty()) {
            return Error{Error::Code::UnknownError, "Task pool has no workers"};
        }
        this->jobs.push(std::move(job));
    }
    this->jobCV.notify_one();
    return std::nullopt;
}

auto TaskPool::shutdown() -> void {
    pb_log("TaskPool::shutdown begin", "TaskPool");
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->shuttingDown) {
            this->shuttingDown = true;
            this->jobCV.notify_all();
        }
    }

    for (auto& th : this->workers) {
        if (th.joinable()) {
            th.join();
        }
    }
    this->workers.clear();
    pb_log("TaskPool::shutdown all workers joined", "TaskPool");
}

auto TaskPool::size() const -> size_t {
    return this->workers.size();
}

auto TaskPool::failedJobs() const -> size_t {
    return this->failed.load();
}

auto TaskPool::workerFunction() -> void {
    pb_log("TaskPool::workerFunction start", "TaskPool");
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });

            if (this->jobs.empty()) {
                pb_log("TaskPool::workerFunction received shutdown with empty queue", "TaskPool");
                break;
            }
            job = std::move(this->jobs.front());
            this->jobs.pop();
        }

        try {
            job();
        } catch (std::exception const& error) {
            ++this->failed;
            pb_log("Exception in job: " + std::string(error.what()), "TaskPool", "Error");
        } catch (...) {
            ++this->failed;
            pb_log("Unknown exception in job", "TaskPool", "Error");
        }
    }
    pb_log("TaskPool::workerFunction exit", "TaskPool");
    --this->activeWorkers;
}

} // namespace PB
