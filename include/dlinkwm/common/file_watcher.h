#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <dlinkwm/core/types.h>

namespace dlinkwm::common {

enum class FileEventKind { Created, Modified, Removed };

constexpr const char* fileEventKindName(FileEventKind kind) {
    switch (kind) {
        case FileEventKind::Created: return "created";
        case FileEventKind::Modified: return "modified";
        case FileEventKind::Removed: return "removed";
    }
    return "unknown";
}

struct FileEvent {
    FileEventKind kind;
    std::filesystem::path path;
};

// Owned handle for a running watch loop. Destroying the handle stops and joins the
// background thread.
class WatchHandle {
public:
    ~WatchHandle();

    WatchHandle(const WatchHandle&) = delete;
    WatchHandle& operator=(const WatchHandle&) = delete;

    // Ask the loop to exit; returns immediately.
    void stop();
    // Block until the loop has exited (stop() or event source closed). Called from the
    // watcher's own thread (a callback dropping its handle) it detaches instead; the loop
    // then exits on its own.
    void join();
    bool running() const { return state_->running.load(std::memory_order_acquire); }
    // Completed scan passes; useful to wait for the watcher to observe a change.
    uint64_t scans() const { return state_->scans.load(std::memory_order_acquire); }
    const std::string& name() const { return name_; }

private:
    friend class PollingFileWatcher;

    // Shared with the loop so it outlives a handle destroyed from inside a callback.
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool stopRequested{false};
        std::atomic<bool> running{false};
        std::atomic<uint64_t> scans{0};

        bool stopping() {
            std::lock_guard<std::mutex> lk(mutex);
            return stopRequested;
        }
    };

    explicit WatchHandle(std::string name)
        : name_(std::move(name)), state_(std::make_shared<State>()) {}

    std::string name_;
    std::shared_ptr<State> state_;
    std::thread thread_;
};

// Portable change detection by periodic scanning of modification time and size.
// Events for one pass are delivered in path order on the watcher thread; events for the
// same path are delivered in the order the changes were observed.
class PollingFileWatcher {
public:
    struct Options {
        // Directory to scan, or a single file (which may not exist yet; its parent must).
        std::filesystem::path target;
        bool recursive = true;
        std::chrono::milliseconds interval{500};
        // Optional filter; files for which it returns false are ignored entirely.
        std::function<bool(const std::filesystem::path&)> filter;
        std::string name = "watcher";
    };

    using Callback = std::function<void(const FileEvent&)>;

    // Takes the baseline snapshot synchronously (setup failures are returned here) and then
    // starts the background loop. The callback must outlive the returned handle.
    static Result<std::unique_ptr<WatchHandle>> start(Options options, Callback callback);
};

} // namespace dlinkwm::common
