#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <dlinkwm/common/file_watcher.h>
#include <dlinkwm/core/types.h>

namespace dlinkwm::runtime {

class ModuleCache;

// Watches a directory for guest-module changes and keeps the cache current: a modified
// module is hot reloaded, a removed one is invalidated. Reload failures are logged and
// counted; they never stop the watch loop.
class HotReloadWatcher {
public:
    struct Options {
        std::filesystem::path watchDir;
        std::string extension = ".wasm";
        std::chrono::milliseconds pollInterval{500};
        bool recursive = true;
    };

    struct Stats {
        uint64_t reloads = 0;
        uint64_t failedReloads = 0;
        uint64_t invalidations = 0;
        uint64_t ignoredEvents = 0;
    };

    HotReloadWatcher(ModuleCache& cache, Options options);

    // Setup failures (missing directory, bad options) are returned here. The cache must
    // outlive the returned handle.
    Result<std::unique_ptr<common::WatchHandle>> start();

    Stats stats() const;
    const Options& options() const { return options_; }

private:
    struct Counters {
        std::atomic<uint64_t> reloads{0};
        std::atomic<uint64_t> failedReloads{0};
        std::atomic<uint64_t> invalidations{0};
        std::atomic<uint64_t> ignoredEvents{0};
    };

    ModuleCache& cache_;
    Options options_;
    std::shared_ptr<Counters> counters_;
};

} // namespace dlinkwm::runtime
