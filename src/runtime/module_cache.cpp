#include <spdlog/spdlog.h>
#include <fstream>
#include <functional>
#include <string_view>
#include <system_error>
#include <dlinkwm/runtime/host_method_registry.h>
#include <dlinkwm/runtime/module_cache.h>

namespace dlinkwm::runtime {

namespace fs = std::filesystem;

namespace {

Result<ByteVector> readModuleFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error{ErrorCode::IoError, "Module file not found: " + path};
    }
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Error{ErrorCode::IoError, "Cannot open module file: " + path};
    }
    const auto end = file.tellg();
    if (end < 0) {
        return Error{ErrorCode::IoError, "Cannot determine size of module file: " + path};
    }
    ByteVector bytes(static_cast<std::size_t>(end));
    file.seekg(0, std::ios::beg);
    if (!bytes.empty() &&
        !file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(end))) {
        return Error{ErrorCode::IoError, "Failed to read module file: " + path};
    }
    return bytes;
}

std::size_t digestOf(const ByteVector& bytes) {
    return std::hash<std::string_view>{}(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

} // namespace

ModuleCache::ModuleCache(std::shared_ptr<IGuestEngine> engine, HostMethodRegistry& registry)
    : ModuleCache(std::move(engine), registry, Options{}) {}

ModuleCache::ModuleCache(std::shared_ptr<IGuestEngine> engine, HostMethodRegistry& registry,
                         Options options)
    : engine_(std::move(engine)), registry_(registry), options_(options) {}

ModuleCache::~ModuleCache() = default;

std::string ModuleCache::normalizeKey(const fs::path& path) {
    std::error_code ec;
    auto abs = fs::absolute(path, ec);
    if (ec) {
        return path.lexically_normal().string();
    }
    return abs.lexically_normal().string();
}

std::shared_ptr<std::mutex> ModuleCache::loadLockFor(const std::string& key) {
    std::lock_guard<std::mutex> lock(loadLocksMutex_);
    auto& slot = loadLocks_[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void ModuleCache::pruneLoadLock(const std::string& key, const std::shared_ptr<std::mutex>& held) {
    std::lock_guard<std::mutex> lock(loadLocksMutex_);
    auto it = loadLocks_.find(key);
    // One reference in the map plus the caller's
    if (it != loadLocks_.end() && it->second == held && held.use_count() == 2) {
        loadLocks_.erase(it);
    }
}

Result<InstanceHandle> ModuleCache::getOrLoad(const fs::path& path) {
    const auto key = normalizeKey(path);
    {
        std::shared_lock lock(mutex_);
        auto it = instances_.find(key);
        if (it != instances_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    auto loadLock = loadLockFor(key);
    std::lock_guard<std::mutex> guard(*loadLock);
    {
        // Another caller may have finished loading while we waited
        std::shared_lock lock(mutex_);
        auto it = instances_.find(key);
        if (it != instances_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }
    misses_.fetch_add(1, std::memory_order_relaxed);
    auto loaded = loadLocked(key);
    if (!loaded) {
        pruneLoadLock(key, loadLock);
    }
    return loaded;
}

Result<InstanceHandle> ModuleCache::loadLocked(const std::string& key) {
    auto bytes = readModuleFile(key);
    if (!bytes) {
        spdlog::warn("[ModuleCache] {}", bytes.error().message);
        return bytes.error();
    }
    const auto& data = bytes.value();
    const auto digest = digestOf(data);

    std::shared_ptr<const ModuleRecord> record;
    {
        std::shared_lock lock(mutex_);
        auto it = modules_.find(key);
        if (it != modules_.end() && it->second->byteSize == data.size() &&
            it->second->digest == digest) {
            record = it->second;
        }
    }

    if (record) {
        moduleReuses_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[ModuleCache] Reusing compiled module for {}", key);
    } else {
        Result<std::shared_ptr<const IGuestModule>> compiled{ErrorCode::InternalError};
        try {
            compiled = engine_->compile(ByteSpan(data.data(), data.size()));
        } catch (const std::exception& e) {
            compiled = Error{ErrorCode::CompileError, e.what()};
        }
        if (!compiled) {
            spdlog::error("[ModuleCache] Failed to compile {}: {}", key,
                          compiled.error().message);
            return Error{ErrorCode::CompileError,
                         "Failed to compile module " + key + ": " + compiled.error().message};
        }
        compiles_.fetch_add(1, std::memory_order_relaxed);

        auto fresh = std::make_shared<ModuleRecord>();
        fresh->path = key;
        fresh->module = std::move(compiled).value();
        fresh->byteSize = data.size();
        fresh->digest = digest;
        record = std::move(fresh);

        std::unique_lock lock(mutex_);
        modules_[key] = record;
        spdlog::info("[ModuleCache] Compiled {} ({} bytes) with {}", key, data.size(),
                     engine_->name());
    }

    HostImports imports;
    imports.registry = &registry_;
    imports.heap = options_.heap;

    Result<std::unique_ptr<IGuestInstance>> instantiated{ErrorCode::InternalError};
    try {
        instantiated = engine_->instantiate(record->module, imports);
    } catch (const std::exception& e) {
        instantiated = Error{ErrorCode::InstantiationError, e.what()};
    }
    if (!instantiated) {
        spdlog::error("[ModuleCache] Failed to instantiate {}: {}", key,
                      instantiated.error().message);
        return Error{ErrorCode::InstantiationError,
                     "Failed to instantiate module " + key + ": " + instantiated.error().message};
    }

    auto handle = std::make_shared<InstanceRecord>(
        key, nextGeneration_.fetch_add(1, std::memory_order_relaxed), record,
        std::move(instantiated).value());
    {
        std::unique_lock lock(mutex_);
        instances_[key] = handle;
    }
    spdlog::debug("[ModuleCache] Instantiated {} (generation {})", key, handle->generation());
    return handle;
}

bool ModuleCache::eraseLocked(const std::string& key, bool dropModule) {
    std::unique_lock lock(mutex_);
    bool removed = instances_.erase(key) > 0;
    if (dropModule) {
        removed = modules_.erase(key) > 0 || removed;
    }
    return removed;
}

bool ModuleCache::invalidate(const fs::path& path) {
    const auto key = normalizeKey(path);
    auto loadLock = loadLockFor(key);
    std::lock_guard<std::mutex> guard(*loadLock);
    const bool removed = eraseLocked(key, true);
    if (removed) {
        invalidations_.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("[ModuleCache] Invalidated {}", key);
    }
    pruneLoadLock(key, loadLock);
    return removed;
}

Result<InstanceHandle> ModuleCache::hotReload(const fs::path& path) {
    const auto key = normalizeKey(path);
    auto loadLock = loadLockFor(key);
    std::lock_guard<std::mutex> guard(*loadLock);
    if (eraseLocked(key, true)) {
        invalidations_.fetch_add(1, std::memory_order_relaxed);
    }
    reloads_.fetch_add(1, std::memory_order_relaxed);
    misses_.fetch_add(1, std::memory_order_relaxed);

    auto loaded = loadLocked(key);
    if (loaded) {
        spdlog::info("[ModuleCache] Hot reloaded {} (generation {})", key,
                     loaded.value()->generation());
    }
    return loaded;
}

bool ModuleCache::resetInstance(const fs::path& path) {
    const auto key = normalizeKey(path);
    auto loadLock = loadLockFor(key);
    std::lock_guard<std::mutex> guard(*loadLock);
    return eraseLocked(key, false);
}

bool ModuleCache::containsModule(const fs::path& path) const {
    const auto key = normalizeKey(path);
    std::shared_lock lock(mutex_);
    return modules_.count(key) > 0;
}

bool ModuleCache::containsInstance(const fs::path& path) const {
    const auto key = normalizeKey(path);
    std::shared_lock lock(mutex_);
    return instances_.count(key) > 0;
}

std::shared_ptr<const ModuleRecord> ModuleCache::findModule(const fs::path& path) const {
    const auto key = normalizeKey(path);
    std::shared_lock lock(mutex_);
    auto it = modules_.find(key);
    return it == modules_.end() ? nullptr : it->second;
}

ModuleCache::Stats ModuleCache::stats() const {
    Stats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.compiles = compiles_.load(std::memory_order_relaxed);
    s.moduleReuses = moduleReuses_.load(std::memory_order_relaxed);
    s.reloads = reloads_.load(std::memory_order_relaxed);
    s.invalidations = invalidations_.load(std::memory_order_relaxed);
    std::shared_lock lock(mutex_);
    s.modules = modules_.size();
    s.instances = instances_.size();
    lock.unlock();
    std::lock_guard<std::mutex> locks(loadLocksMutex_);
    s.loadLocks = loadLocks_.size();
    return s;
}

} // namespace dlinkwm::runtime
