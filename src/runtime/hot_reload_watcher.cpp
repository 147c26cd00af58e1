#include <spdlog/spdlog.h>
#include <system_error>
#include <dlinkwm/runtime/hot_reload_watcher.h>
#include <dlinkwm/runtime/module_cache.h>

namespace dlinkwm::runtime {

namespace fs = std::filesystem;

HotReloadWatcher::HotReloadWatcher(ModuleCache& cache, Options options)
    : cache_(cache), options_(std::move(options)), counters_(std::make_shared<Counters>()) {}

Result<std::unique_ptr<common::WatchHandle>> HotReloadWatcher::start() {
    if (options_.watchDir.empty()) {
        return Error{ErrorCode::InvalidArgument, "Hot reload watch directory is not set"};
    }
    std::error_code ec;
    if (!fs::is_directory(options_.watchDir, ec)) {
        return Error{ErrorCode::IoError,
                     "Hot reload watch directory does not exist: " + options_.watchDir.string()};
    }

    common::PollingFileWatcher::Options opts;
    opts.target = options_.watchDir;
    opts.recursive = options_.recursive;
    opts.interval = options_.pollInterval;
    opts.name = "HotReload";
    if (!options_.extension.empty()) {
        opts.filter = [ext = options_.extension](const fs::path& p) {
            return p.extension() == ext;
        };
    }

    auto* cache = &cache_;
    auto counters = counters_;
    auto handle = common::PollingFileWatcher::start(
        std::move(opts), [cache, counters](const common::FileEvent& ev) {
            switch (ev.kind) {
                case common::FileEventKind::Modified: {
                    spdlog::info("[HotReload] Detected change in {}", ev.path.string());
                    auto reloaded = cache->hotReload(ev.path);
                    if (reloaded) {
                        counters->reloads.fetch_add(1, std::memory_order_relaxed);
                        spdlog::info("[HotReload] Reloaded {} (generation {})",
                                     ev.path.string(), reloaded.value()->generation());
                    } else {
                        counters->failedReloads.fetch_add(1, std::memory_order_relaxed);
                        spdlog::error("[HotReload] Failed to reload {}: {}", ev.path.string(),
                                      reloaded.error().message);
                    }
                    break;
                }
                case common::FileEventKind::Removed:
                    if (cache->invalidate(ev.path)) {
                        spdlog::info("[HotReload] {} removed; dropped cached module",
                                     ev.path.string());
                    }
                    counters->invalidations.fetch_add(1, std::memory_order_relaxed);
                    break;
                case common::FileEventKind::Created:
                    // Loaded lazily on first use
                    spdlog::debug("[HotReload] New module {}", ev.path.string());
                    counters->ignoredEvents.fetch_add(1, std::memory_order_relaxed);
                    break;
            }
        });
    if (!handle) {
        spdlog::error("[HotReload] Failed to start watcher on {}: {}",
                      options_.watchDir.string(), handle.error().message);
        return handle.error();
    }
    spdlog::info("[HotReload] Watching {} for *{} changes", options_.watchDir.string(),
                 options_.extension);
    return handle;
}

HotReloadWatcher::Stats HotReloadWatcher::stats() const {
    Stats s;
    s.reloads = counters_->reloads.load(std::memory_order_relaxed);
    s.failedReloads = counters_->failedReloads.load(std::memory_order_relaxed);
    s.invalidations = counters_->invalidations.load(std::memory_order_relaxed);
    s.ignoredEvents = counters_->ignoredEvents.load(std::memory_order_relaxed);
    return s;
}

} // namespace dlinkwm::runtime
