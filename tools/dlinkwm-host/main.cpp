#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <dlinkwm/config/config_helpers.h>
#include <dlinkwm/config/dynamic_config.h>
#include <dlinkwm/json/json_method_handler.h>
#include <dlinkwm/runtime/host_method_registry.h>
#include <dlinkwm/runtime/hot_reload_watcher.h>
#include <dlinkwm/runtime/invocation_gate.h>
#include <dlinkwm/runtime/module_cache.h>
#include <dlinkwm/runtime/wasm_runtime.h>

namespace {

namespace fs = std::filesystem;
using nlohmann::json;

void setupLogging(const std::string& level, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!logFile.empty()) {
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile, max_size, max_files));
        }
        auto logger = std::make_shared<spdlog::logger>("dlinkwm-host", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logging setup failed, using default logger: " << e.what() << "\n";
    }

    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    }
}

// {"data": {"name": "..."}} -> "Hello from custom handler, <name>!"
dlinkwm::Result<json> customGreet(const json& params) {
    if (!params.contains("data") || !params["data"].is_object() ||
        !params["data"].contains("name") || !params["data"]["name"].is_string()) {
        return dlinkwm::Error{dlinkwm::ErrorCode::InvalidArgument,
                              "custom_greet expects {\"data\": {\"name\": <string>}}"};
    }
    return json("Hello from custom handler, " + params["data"]["name"].get<std::string>() + "!");
}

void callOne(dlinkwm::runtime::InvocationGate& gate, const std::string& wasmPath,
             const std::string& function) {
    auto result = gate.callEntry(wasmPath, function);
    if (!result) {
        std::cout << "Error calling " << function << ": " << result.error().message << "\n";
        return;
    }
    const auto& r = result.value();
    std::cout << "Called " << function << " (instance generation " << r.generation << ")\n";
    if (r.returnText) {
        std::cout << "  Return value: '" << *r.returnText << "' (" << r.returnText->size()
                  << " bytes)\n";
    } else if (r.returnValue) {
        std::cout << "  Raw return value: " << *r.returnValue << "\n";
    } else {
        std::cout << "  (no return value)\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"dlinkwm host - load, call and hot reload WASM guest modules"};

    std::string wasmPath = "wasm/wasm_test.wasm";
    std::string configPath = dlinkwm::config::kDefaultConfigPath;
    std::string logLevel = "info";
    std::string logFile;
    bool hotReload = false;

    app.add_option("-w,--wasm-path", wasmPath, "Guest module to call")->default_val(wasmPath);
    app.add_option("-c,--config-path", configPath, "Configuration file path")
        ->default_val(configPath);
    app.add_flag("-r,--hot-reload", hotReload, "Watch the module directory and reload on change");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)")
        ->default_val("info");
    app.add_option("--log-file", logFile, "Also write logs to a rotating file");

    CLI11_PARSE(app, argc, argv);

    setupLogging(logLevel, logFile);

    if (!dlinkwm::runtime::WasmRuntime::available()) {
        spdlog::warn("Built without wasmtime; modules cannot be compiled");
    }

    dlinkwm::runtime::HostMethodRegistry registry;
    if (dlinkwm::json::registerJsonMethod(registry, "custom_greet", customGreet)) {
        spdlog::info("Registered host method 'custom_greet'");
    } else {
        spdlog::warn("Host method 'custom_greet' already registered");
    }

    auto created = dlinkwm::config::createDefaultConfigIfMissing(configPath);
    if (!created) {
        spdlog::error("Cannot create default configuration: {}", created.error().message);
        return 1;
    }

    auto opened = dlinkwm::config::DynamicConfig::open(configPath);
    if (!opened) {
        spdlog::error("Cannot load configuration {}: {}", configPath, opened.error().message);
        return 1;
    }
    auto config = std::move(opened).value();
    // [runtime] is read once here; edits while running only log a restart warning
    const auto runtimeSettings = config->snapshot()->runtime;

    auto configWatch = config->startWatching(runtimeSettings.pollInterval);
    if (!configWatch) {
        spdlog::warn("Configuration hot reload disabled: {}", configWatch.error().message);
    }

    dlinkwm::runtime::ModuleCache::Options cacheOptions;
    cacheOptions.heap.base = runtimeSettings.heapBase;
    cacheOptions.heap.size = runtimeSettings.heapSize;
    dlinkwm::runtime::ModuleCache cache(std::make_shared<dlinkwm::runtime::WasmRuntime>(),
                                        registry, cacheOptions);

    std::unique_ptr<dlinkwm::common::WatchHandle> moduleWatch;
    if (hotReload) {
        dlinkwm::runtime::HotReloadWatcher::Options watchOptions;
        watchOptions.watchDir = runtimeSettings.watchDir.empty()
                                    ? fs::path(wasmPath).parent_path()
                                    : fs::path(runtimeSettings.watchDir);
        if (watchOptions.watchDir.empty()) {
            watchOptions.watchDir = ".";
        }
        watchOptions.extension = runtimeSettings.moduleExtension;
        watchOptions.pollInterval = runtimeSettings.pollInterval;
        dlinkwm::runtime::HotReloadWatcher watcher(cache, watchOptions);
        auto started = watcher.start();
        if (!started) {
            spdlog::error("Hot reload disabled: {}", started.error().message);
        } else {
            moduleWatch = std::move(started).value();
        }
    }

    auto policy = dlinkwm::runtime::parseInstancePolicy(runtimeSettings.instancePolicy);
    dlinkwm::runtime::InvocationGate::Options gateOptions;
    if (policy) {
        gateOptions.policy = policy.value();
    }
    dlinkwm::runtime::InvocationGate gate(cache, *config, gateOptions);

    std::cout << "=== dlinkwm host ===\n"
              << "Module: " << wasmPath << "\n"
              << "Config: " << configPath << "\n"
              << "Instance policy: " << dlinkwm::runtime::instancePolicyName(gateOptions.policy)
              << "\n"
              << "Commands: 'call' (all entry functions), 'call <function>', 'quit'\n";

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream words(line);
        std::string command;
        words >> command;
        if (command.empty()) {
            continue;
        }
        if (command == "quit" || command == "exit") {
            break;
        }
        if (command != "call") {
            std::cout << "Unknown command: " << command << "\n";
            continue;
        }

        std::string function;
        words >> function;
        if (!function.empty()) {
            callOne(gate, wasmPath, function);
            continue;
        }

        auto functions = gate.allowedFunctions(wasmPath);
        if (functions.empty()) {
            std::cout << "No entry functions configured for " << wasmPath << " in " << configPath
                      << "\n";
            continue;
        }
        std::cout << "Entry functions: " << dlinkwm::config::format_string_array(functions)
                  << "\n";
        for (const auto& fn : functions) {
            callOne(gate, wasmPath, fn);
        }
    }

    if (moduleWatch) {
        moduleWatch->stop();
        moduleWatch->join();
    }
    if (configWatch) {
        configWatch.value()->stop();
        configWatch.value()->join();
    }
    const auto stats = cache.stats();
    spdlog::info("Cache: {} hit(s), {} miss(es), {} compile(s), {} reload(s)", stats.hits,
                 stats.misses, stats.compiles, stats.reloads);
    return 0;
}
