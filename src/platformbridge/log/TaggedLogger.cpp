#ifdef PB_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace PB {

std::mutex TaggedLogger::outputMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false), nextThreadNumber(0) {
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return loggingEnabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(filterMutex);
    skipTags = std::move(tags);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(filterMutex);
    enabledTags = std::move(tags);
}

auto TaggedLogger::setSink(Sink newSink) -> void {
    std::lock_guard<std::mutex> lock(filterMutex);
    sink = std::move(newSink);
}

auto TaggedLogger::isEmitted(std::set<std::string> const& tags) const -> bool {
    std::lock_guard<std::mutex> lock(filterMutex);
    if (!this->enabledTags.empty()) {
        for (auto const& tag : tags)
            if (this->enabledTags.contains(tag))
                return true;
        return false;
    }
    for (auto const& tag : tags)
        if (this->skipTags.contains(tag))
            return false;
    return true;
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            this->drained.notify_all();
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            ++this->writing;
            lock.unlock();
            this->write(msg);
            lock.lock();
            --this->writing;
        }
        this->drained.notify_all();
    }
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return (this->messageQueue.empty() && this->writing == 0) || !this->running; });
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::formatLine(const LogMessage& msg) -> std::string {
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm    nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    for (auto const& tag : msg.tags) {
        oss << '[' << tag << ']';
    }
    if (!msg.tags.empty()) {
        oss << ' ';
    }
    oss << '[' << msg.threadName << "] ";
    oss << '[' << getShortPath(msg.location.file_name()) << ':' << msg.location.line() << "] ";
    oss << msg.message;
    return oss.str();
}

auto TaggedLogger::write(const LogMessage& msg) const -> void {
    if (!this->isEmitted(msg.tags)) {
        return;
    }
    auto line = formatLine(msg);
    Sink target;
    {
        std::lock_guard<std::mutex> lock(filterMutex);
        target = this->sink;
    }
    if (target) {
        target(line);
        return;
    }
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cerr << line << '\n' << std::flush;
}

auto TaggedLogger::printLine(const std::string& line) const -> void {
    std::lock_guard<std::mutex> lock(outputMutex);
    std::cout << line << std::endl;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    }
    std::string name = "Thread " + std::to_string(nextThreadNumber++);
    threadNames[id]  = name;
    return name;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace PB
#endif // PB_LOG_DEBUG
