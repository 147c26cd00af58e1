#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include <dlinkwm/common/file_watcher.h>
#include <dlinkwm/core/types.h>

namespace dlinkwm::config {

// Default configuration file, relative to the working directory.
inline constexpr const char* kDefaultConfigPath = "dlinkwm.toml";

/**
 * @brief Runtime knobs read from the optional [runtime] section
 *
 * Consumed once when the host wires up the cache, watcher and gate. A reload swaps them
 * into the snapshot but running components keep their startup values until restart.
 */
struct RuntimeSettings {
    // How the gate obtains an instance per authorized call: "reload" (recompile and
    // re-instantiate), "fresh" (re-instantiate, reuse the compiled module) or "reuse".
    std::string instancePolicy = "reload";
    std::string watchDir;
    std::string moduleExtension = ".wasm";
    std::chrono::milliseconds pollInterval{500};
    // Unset: the host heap is appended to each instance's memory at instantiation.
    std::optional<uint32_t> heapBase;
    uint32_t heapSize = 1024 * 1024;

    bool operator==(const RuntimeSettings&) const = default;
};

/**
 * @brief Immutable view of one successfully loaded configuration file
 *
 * entryFunctions maps a guest-module path (as written in the file) to the ordered list of
 * export names the gate may call.
 */
struct ConfigSnapshot {
    std::map<std::string, std::vector<std::string>> entryFunctions;
    RuntimeSettings runtime;

    /**
     * @brief Parse TOML text
     * @return Snapshot or InvalidData naming the offending line
     */
    static Result<ConfigSnapshot> parse(std::string_view text);

    /**
     * @brief Load from disk; a missing file yields an empty snapshot
     */
    static Result<ConfigSnapshot> loadFromFile(const std::filesystem::path& path);

    std::string toToml() const;
    Result<void> saveToFile(const std::filesystem::path& path) const;
};

/**
 * @brief Write an empty default configuration if `path` does not exist
 * @return true if the file was created, false if it already existed
 */
Result<bool> createDefaultConfigIfMissing(
    const std::filesystem::path& path = std::filesystem::path(kDefaultConfigPath));

/**
 * @brief Thread-safe configuration store with file-driven hot reload
 *
 * Readers always see a complete snapshot. A failed reload is logged and the previous
 * snapshot stays in effect.
 */
class DynamicConfig {
public:
    // In-memory store without a backing file; reload() is NotSupported.
    explicit DynamicConfig(ConfigSnapshot initial = {});

    DynamicConfig(const DynamicConfig&) = delete;
    DynamicConfig& operator=(const DynamicConfig&) = delete;

    // Loads `path` (missing file == empty snapshot). Fails on unreadable or invalid files.
    static Result<std::unique_ptr<DynamicConfig>> open(const std::filesystem::path& path);

    // Permitted entry points for `modulePath`; empty when the module is not listed.
    std::vector<std::string> getEntryFunctionsForFile(const std::string& modulePath) const;

    std::shared_ptr<const ConfigSnapshot> snapshot() const;
    uint64_t version() const;
    const std::filesystem::path& path() const { return path_; }

    // Re-read the backing file and swap the snapshot on success. Logs a warning when the
    // [runtime] section changed, since those settings only apply at startup.
    Result<void> reload();

    void replace(ConfigSnapshot next);

    // True when the current [runtime] section differs from the one this store started with.
    bool runtimeSettingsStale() const;

    // Watch the backing file; creation or modification triggers reload(). The returned
    // handle must not outlive this store.
    Result<std::unique_ptr<common::WatchHandle>>
    startWatching(std::chrono::milliseconds interval = std::chrono::milliseconds(500));

private:
    std::filesystem::path path_;
    RuntimeSettings startupRuntime_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const ConfigSnapshot> current_;
    uint64_t version_{1};
};

} // namespace dlinkwm::config
