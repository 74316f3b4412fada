#ifdef SV_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace SV {

std::mutex TaggedLogger::stderrMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : writer_(&TaggedLogger::run, this) {}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        stopping_ = true;
    }
    wake_.notify_one();
    if (writer_.joinable())
        writer_.join();
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(namesMutex_);
    names_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(skipMutex_);
    skipTags_ = std::move(tags);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(pendingMutex_);
    drained_.wait(lock, [this] { return pending_.empty() && !writing_; });
}

auto TaggedLogger::skipped(std::vector<std::string> const& tags) const -> bool {
    std::lock_guard<std::mutex> lock(skipMutex_);
    return std::any_of(tags.begin(), tags.end(), [this](std::string const& tag) { return skipTags_.contains(tag); });
}

auto TaggedLogger::enqueue(LogRecord record) -> void {
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        pending_.push_back(std::move(record));
    }
    wake_.notify_one();
}

auto TaggedLogger::run() -> void {
    std::unique_lock<std::mutex> lock(pendingMutex_);
    while (true) {
        wake_.wait(lock, [this] { return !pending_.empty() || stopping_; });
        if (pending_.empty()) {
            // stopping_ with nothing left to write
            drained_.notify_all();
            return;
        }

        std::deque<LogRecord> batch;
        batch.swap(pending_);
        writing_ = true;
        lock.unlock();

        std::string text;
        for (auto const& record : batch)
            text += format(record);
        {
            std::lock_guard<std::mutex> out(stderrMutex);
            std::cerr << text << std::flush;
        }

        lock.lock();
        writing_ = false;
        if (pending_.empty())
            drained_.notify_all();
    }
}

auto TaggedLogger::threadName(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(namesMutex_);
    auto [it, inserted] = names_.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(nextAnonymous_++);
    return it->second;
}

auto TaggedLogger::shortPath(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

auto TaggedLogger::format(LogRecord const& record) -> std::string {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()) % 1000;
    auto const seconds = std::chrono::system_clock::to_time_t(record.timestamp);
    std::tm    local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : record.tags)
        line << '[' << tag << ']';
    line << " [" << record.threadName << "] [" << shortPath(record.file) << ':' << record.line << "] " << record.message
         << '\n';
    return line.str();
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace SV
#endif // SV_LOG_DEBUG
