#include <spdlog/spdlog.h>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <dlinkwm/config/config_helpers.h>
#include <dlinkwm/config/dynamic_config.h>

namespace dlinkwm::config {

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultConfigText = R"(# dlinkwm configuration
#
# [entry_functions] maps a guest module path to the exports the host may call:
# "wasm/example.wasm" = ["run", "init"]

[entry_functions]
)";

Error lineError(std::size_t lineNo, const std::string& what) {
    return Error{ErrorCode::InvalidData, "line " + std::to_string(lineNo) + ": " + what};
}

// Splits `key = value`, accepting bare or quoted keys.
Result<std::pair<std::string, std::string>> splitKeyValue(const std::string& line) {
    std::string key;
    std::size_t pos = 0;
    if (!line.empty() && (line[0] == '"' || line[0] == '\'')) {
        auto quoted = parse_toml_string(line, pos);
        if (!quoted) {
            return quoted.error();
        }
        key = std::move(quoted).value();
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])))
            ++pos;
        if (pos >= line.size() || line[pos] != '=') {
            return Error{ErrorCode::InvalidData, "expected '=' after key"};
        }
    } else {
        pos = line.find('=');
        if (pos == std::string::npos) {
            return Error{ErrorCode::InvalidData, "expected key = value"};
        }
        key = line.substr(0, pos);
        trim(key);
        if (key.empty()) {
            return Error{ErrorCode::InvalidData, "empty key"};
        }
    }
    std::string value = line.substr(pos + 1);
    trim(value);
    if (value.empty()) {
        return Error{ErrorCode::InvalidData, "missing value for key '" + key + "'"};
    }
    return std::make_pair(std::move(key), std::move(value));
}

Result<std::string> parseScalarString(const std::string& value) {
    std::size_t pos = 0;
    auto parsed = parse_toml_string(value, pos);
    if (!parsed) {
        return parsed.error();
    }
    if (pos != value.size()) {
        return Error{ErrorCode::InvalidData, "unexpected content after string"};
    }
    return parsed;
}

Result<uint32_t> parseU32(const std::string& value) {
    auto parsed = parse_uint(value);
    if (!parsed) {
        return parsed.error();
    }
    if (parsed.value() > UINT32_MAX) {
        return Error{ErrorCode::InvalidData, "value out of range: " + value};
    }
    return static_cast<uint32_t>(parsed.value());
}

Result<void> applyRuntimeKey(RuntimeSettings& rt, const std::string& key,
                             const std::string& value) {
    if (key == "instance_policy" || key == "watch_dir" || key == "module_extension") {
        auto s = parseScalarString(value);
        if (!s) {
            return s.error();
        }
        if (key == "instance_policy") {
            const auto& p = s.value();
            if (p != "reload" && p != "fresh" && p != "reuse") {
                return Error{ErrorCode::InvalidData,
                             "instance_policy must be one of reload, fresh, reuse (got '" + p +
                                 "')"};
            }
            rt.instancePolicy = p;
        } else if (key == "watch_dir") {
            rt.watchDir = s.value();
        } else {
            rt.moduleExtension = s.value();
        }
        return {};
    }

    if (key == "poll_interval_ms" || key == "heap_base" || key == "heap_size") {
        auto n = parseU32(value);
        if (!n) {
            return n.error();
        }
        if (key == "poll_interval_ms") {
            if (n.value() == 0) {
                return Error{ErrorCode::InvalidData, "poll_interval_ms must be positive"};
            }
            rt.pollInterval = std::chrono::milliseconds(n.value());
        } else if (key == "heap_base") {
            rt.heapBase = n.value();
        } else {
            if (n.value() == 0) {
                return Error{ErrorCode::InvalidData, "heap_size must be positive"};
            }
            rt.heapSize = n.value();
        }
        return {};
    }

    spdlog::warn("[Config] Ignoring unknown [runtime] key '{}'", key);
    return {};
}

} // namespace

Result<ConfigSnapshot> ConfigSnapshot::parse(std::string_view text) {
    ConfigSnapshot snap;
    std::string section;
    std::istringstream in{std::string(text)};
    std::string raw;
    std::size_t lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        const std::size_t startLine = lineNo;
        std::string line = strip_comment(raw);
        trim(line);
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.size() < 2 || line.back() != ']' || line[1] == '[') {
                return lineError(startLine, "malformed section header '" + line + "'");
            }
            section = line.substr(1, line.size() - 2);
            trim(section);
            continue;
        }

        // Arrays may continue over following lines until the brackets balance.
        while (bracket_balance(line) > 0 && std::getline(in, raw)) {
            ++lineNo;
            std::string more = strip_comment(raw);
            trim(more);
            line += ' ';
            line += more;
        }

        auto kv = splitKeyValue(line);
        if (!kv) {
            return lineError(startLine, kv.error().message);
        }
        auto& [key, value] = kv.value();

        if (section == "entry_functions") {
            auto names = parse_string_array(value);
            if (!names) {
                return lineError(startLine, "entry functions for '" + key +
                                                "': " + names.error().message);
            }
            snap.entryFunctions[key] = std::move(names).value();
        } else if (section == "runtime") {
            auto applied = applyRuntimeKey(snap.runtime, key, value);
            if (!applied) {
                return lineError(startLine, applied.error().message);
            }
        }
        // Keys in other sections (or at the top level) are ignored.
    }
    return snap;
}

Result<ConfigSnapshot> ConfigSnapshot::loadFromFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        spdlog::debug("[Config] {} not found; using empty configuration", path.string());
        return ConfigSnapshot{};
    }
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::IoError, "Cannot open config file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error{ErrorCode::IoError, "Cannot read config file: " + path.string()};
    }

    auto parsed = parse(buffer.str());
    if (!parsed) {
        return Error{parsed.error().code, path.string() + ": " + parsed.error().message};
    }
    return parsed;
}

std::string ConfigSnapshot::toToml() const {
    std::ostringstream out;
    out << "[entry_functions]\n";
    for (const auto& [module, names] : entryFunctions) {
        out << quote_toml_string(module) << " = " << format_string_array(names) << "\n";
    }
    out << "\n[runtime]\n";
    out << "instance_policy = " << quote_toml_string(runtime.instancePolicy) << "\n";
    if (!runtime.watchDir.empty()) {
        out << "watch_dir = " << quote_toml_string(runtime.watchDir) << "\n";
    }
    out << "module_extension = " << quote_toml_string(runtime.moduleExtension) << "\n";
    out << "poll_interval_ms = " << runtime.pollInterval.count() << "\n";
    if (runtime.heapBase) {
        out << "heap_base = " << *runtime.heapBase << "\n";
    }
    out << "heap_size = " << runtime.heapSize << "\n";
    return out.str();
}

Result<void> ConfigSnapshot::saveToFile(const fs::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Cannot create directory " + path.parent_path().string() + ": " +
                             ec.message()};
        }
    }

    // Write to a temp file and rename so watchers never see a partial file
    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            return Error{ErrorCode::IoError, "Cannot write config file: " + tmp.string()};
        }
        file << toToml();
        file.flush();
        if (!file) {
            return Error{ErrorCode::IoError, "Failed writing config file: " + tmp.string()};
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error{ErrorCode::IoError, "Cannot replace config file: " + path.string()};
    }
    return {};
}

Result<bool> createDefaultConfigIfMissing(const fs::path& path) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return false;
    }
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Cannot create directory " +
                                                 path.parent_path().string() + ": " + ec.message()};
        }
    }
    std::ofstream file(path);
    if (!file) {
        return Error{ErrorCode::IoError, "Cannot create config file: " + path.string()};
    }
    file << kDefaultConfigText;
    if (!file) {
        return Error{ErrorCode::IoError, "Failed writing config file: " + path.string()};
    }
    spdlog::info("[Config] Created default configuration at {}", path.string());
    return true;
}

DynamicConfig::DynamicConfig(ConfigSnapshot initial)
    : startupRuntime_(initial.runtime),
      current_(std::make_shared<const ConfigSnapshot>(std::move(initial))) {}

Result<std::unique_ptr<DynamicConfig>> DynamicConfig::open(const fs::path& path) {
    auto loaded = ConfigSnapshot::loadFromFile(path);
    if (!loaded) {
        return loaded.error();
    }
    auto cfg = std::make_unique<DynamicConfig>(std::move(loaded).value());
    cfg->path_ = path;
    spdlog::info("[Config] Loaded {} ({} module(s) with entry functions)", path.string(),
                 cfg->snapshot()->entryFunctions.size());
    return std::move(cfg);
}

std::vector<std::string> DynamicConfig::getEntryFunctionsForFile(const std::string& modulePath) const {
    auto snap = snapshot();
    auto it = snap->entryFunctions.find(modulePath);
    if (it == snap->entryFunctions.end()) {
        return {};
    }
    return it->second;
}

std::shared_ptr<const ConfigSnapshot> DynamicConfig::snapshot() const {
    std::shared_lock lock(mutex_);
    return current_;
}

uint64_t DynamicConfig::version() const {
    std::shared_lock lock(mutex_);
    return version_;
}

Result<void> DynamicConfig::reload() {
    if (path_.empty()) {
        return Error{ErrorCode::NotSupported, "Configuration has no backing file"};
    }
    auto loaded = ConfigSnapshot::loadFromFile(path_);
    if (!loaded) {
        spdlog::error("[Config] Reload of {} failed, keeping previous configuration: {}",
                      path_.string(), loaded.error().message);
        return loaded.error();
    }
    const bool runtimeChanged = !(snapshot()->runtime == loaded.value().runtime);
    replace(std::move(loaded).value());
    spdlog::info("[Config] Reloaded {} (version {})", path_.string(), version());
    if (runtimeChanged) {
        spdlog::warn("[Config] [runtime] settings in {} changed; restart to apply them",
                     path_.string());
    }
    return {};
}

bool DynamicConfig::runtimeSettingsStale() const {
    return !(snapshot()->runtime == startupRuntime_);
}

void DynamicConfig::replace(ConfigSnapshot next) {
    auto fresh = std::make_shared<const ConfigSnapshot>(std::move(next));
    std::unique_lock lock(mutex_);
    current_ = std::move(fresh);
    ++version_;
}

Result<std::unique_ptr<common::WatchHandle>>
DynamicConfig::startWatching(std::chrono::milliseconds interval) {
    if (path_.empty()) {
        return Error{ErrorCode::NotSupported, "Configuration has no backing file to watch"};
    }

    common::PollingFileWatcher::Options opts;
    opts.target = path_;
    opts.recursive = false;
    opts.interval = interval;
    opts.name = "Config";

    return common::PollingFileWatcher::start(std::move(opts), [this](const common::FileEvent& ev) {
        switch (ev.kind) {
            case common::FileEventKind::Created:
            case common::FileEventKind::Modified: {
                auto r = reload();
                if (!r) {
                    // Already logged by reload(); the previous snapshot stays active
                    return;
                }
                break;
            }
            case common::FileEventKind::Removed:
                spdlog::warn("[Config] {} was removed; keeping current configuration",
                             path_.string());
                break;
        }
    });
}

} // namespace dlinkwm::config
