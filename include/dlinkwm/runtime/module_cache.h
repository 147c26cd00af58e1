#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <dlinkwm/core/types.h>
#include <dlinkwm/runtime/guest_engine.h>

namespace dlinkwm::runtime {

class HostMethodRegistry;

/**
 * @brief A compiled guest module as cached for one path
 *
 * Replaced wholesale when the file is recompiled; never mutated after insertion.
 */
struct ModuleRecord {
    std::string path;
    std::shared_ptr<const IGuestModule> module;
    std::size_t byteSize = 0;
    std::size_t digest = 0;
};

/**
 * @brief One live instance for a path, guarded by a read-write lock
 *
 * The execution context is not safe for concurrent use: hold lockExclusive() (or use
 * withExclusive) while calling into the instance. Holders of a replaced record may keep
 * using it; the cache will not hand it out again.
 */
class InstanceRecord {
public:
    InstanceRecord(std::string path, uint64_t generation,
                   std::shared_ptr<const ModuleRecord> module,
                   std::unique_ptr<IGuestInstance> instance)
        : path_(std::move(path)), generation_(generation), module_(std::move(module)),
          instance_(std::move(instance)) {}

    InstanceRecord(const InstanceRecord&) = delete;
    InstanceRecord& operator=(const InstanceRecord&) = delete;

    const std::string& path() const { return path_; }
    uint64_t generation() const { return generation_; }
    const std::shared_ptr<const ModuleRecord>& module() const { return module_; }

    std::unique_lock<std::shared_mutex> lockExclusive() { return std::unique_lock(mutex_); }

    // Caller must hold the exclusive lock.
    IGuestInstance& instance() { return *instance_; }

    template <typename Fn> auto withExclusive(Fn&& fn) {
        auto lock = lockExclusive();
        return fn(*instance_);
    }

private:
    std::string path_;
    uint64_t generation_;
    std::shared_ptr<const ModuleRecord> module_;
    std::shared_mutex mutex_;
    std::unique_ptr<IGuestInstance> instance_;
};

using InstanceHandle = std::shared_ptr<InstanceRecord>;

/**
 * @brief Compiles, caches and instantiates guest modules keyed by file path
 *
 * At most one ModuleRecord and one InstanceRecord exist per path. A miss runs
 * read-compile-instantiate-insert under a per-path load lock, so concurrent first loads of
 * the same path compile exactly once; lookups of unrelated paths are never blocked by it.
 */
class ModuleCache {
public:
    struct Options {
        GuestHeap::Options heap;
    };

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t compiles = 0;
        uint64_t moduleReuses = 0;
        uint64_t reloads = 0;
        uint64_t invalidations = 0;
        std::size_t modules = 0;
        std::size_t instances = 0;
        std::size_t loadLocks = 0;
    };

    ModuleCache(std::shared_ptr<IGuestEngine> engine, HostMethodRegistry& registry);
    ModuleCache(std::shared_ptr<IGuestEngine> engine, HostMethodRegistry& registry,
                Options options);
    ~ModuleCache();

    ModuleCache(const ModuleCache&) = delete;
    ModuleCache& operator=(const ModuleCache&) = delete;

    /**
     * @brief Live instance for `path`, loading it on a miss
     *
     * The compiled module is reused when the file's bytes are unchanged since it was compiled.
     * @return IoError, CompileError or InstantiationError on failure
     */
    Result<InstanceHandle> getOrLoad(const std::filesystem::path& path);

    /**
     * @brief Drop the module and instance for `path`
     * @return true if anything was removed (idempotent)
     */
    bool invalidate(const std::filesystem::path& path);

    /**
     * @brief Invalidate then load, as one step per path
     *
     * The returned handle is always a new record; earlier handles are never handed out again.
     */
    Result<InstanceHandle> hotReload(const std::filesystem::path& path);

    // Drop only the instance; the next load re-instantiates from the cached module when the
    // bytes are unchanged.
    bool resetInstance(const std::filesystem::path& path);

    bool containsModule(const std::filesystem::path& path) const;
    bool containsInstance(const std::filesystem::path& path) const;
    std::shared_ptr<const ModuleRecord> findModule(const std::filesystem::path& path) const;

    Stats stats() const;

    // Absolute, lexically normalized form used as the cache key.
    static std::string normalizeKey(const std::filesystem::path& path);

private:
    std::shared_ptr<std::mutex> loadLockFor(const std::string& key);
    // Drops the per-path lock once nobody but the caller holds it.
    void pruneLoadLock(const std::string& key, const std::shared_ptr<std::mutex>& held);
    // Requires the per-path load lock.
    Result<InstanceHandle> loadLocked(const std::string& key);
    bool eraseLocked(const std::string& key, bool dropModule);

    std::shared_ptr<IGuestEngine> engine_;
    HostMethodRegistry& registry_;
    Options options_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const ModuleRecord>> modules_;
    std::map<std::string, InstanceHandle> instances_;

    mutable std::mutex loadLocksMutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> loadLocks_;

    std::atomic<uint64_t> nextGeneration_{1};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> compiles_{0};
    std::atomic<uint64_t> moduleReuses_{0};
    std::atomic<uint64_t> reloads_{0};
    std::atomic<uint64_t> invalidations_{0};
};

} // namespace dlinkwm::runtime
