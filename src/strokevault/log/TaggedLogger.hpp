#pragma once
#ifdef SV_LOG_DEBUG
#include <parallel_hashmap/phmap.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <vector>

namespace SV {

/**
 * Background stderr logger. Records are tagged by subsystem ("Store",
 * "History", "Render", ...) and dropped at the call site when logging is
 * off or one of their tags is in the skip set.
 */
class TaggedLogger {
public:
    struct LogRecord {
        std::chrono::system_clock::time_point timestamp;
        std::vector<std::string>              tags; // sorted, unique
        std::string                           message;
        std::string                           threadName;
        char const*                           file = "";
        std::uint_least32_t                   line = 0;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setSkipTags(std::set<std::string> tags) -> void;
    // Blocks until every queued record has been written.
    auto flush() -> void;

    static std::mutex stderrMutex;

private:
    auto enqueue(LogRecord record) -> void;
    auto skipped(std::vector<std::string> const& tags) const -> bool;
    auto run() -> void;
    auto threadName(std::thread::id id) -> std::string;

    static auto format(LogRecord const& record) -> std::string;
    static auto shortPath(char const* file) -> std::string;

    std::deque<LogRecord>   pending_;
    std::mutex              pendingMutex_;
    std::condition_variable wake_;
    std::condition_variable drained_;
    bool                    stopping_ = false;
    bool                    writing_  = false;
    std::atomic<bool>       enabled_{false};

    mutable std::mutex    skipMutex_;
    std::set<std::string> skipTags_{"Arena", "TaskPool", "SpatialIndex"};

    std::mutex                                                                          namesMutex_;
    phmap::flat_hash_map<std::thread::id, std::string, std::hash<std::thread::id>>     names_;
    int                                                                                 nextAnonymous_ = 0;

    std::thread writer_;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabled_.load(std::memory_order_relaxed))
        return;

    std::vector<std::string> tagList{std::string(std::forward<Tags>(tags))...};
    std::sort(tagList.begin(), tagList.end());
    tagList.erase(std::unique(tagList.begin(), tagList.end()), tagList.end());
    if (skipped(tagList))
        return;

    enqueue(LogRecord{.timestamp  = std::chrono::system_clock::now(),
                      .tags       = std::move(tagList),
                      .message    = message,
                      .threadName = threadName(std::this_thread::get_id()),
                      .file       = location.file_name(),
                      .line       = location.line()});
}

#define sv_log(message, ...) ::SV::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace SV

#else
#define sv_log(message, ...) ((void)0)
#endif // SV_LOG_DEBUG
