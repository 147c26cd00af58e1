#include <spdlog/spdlog.h>
#include <algorithm>
#include <dlinkwm/common/utf8_utils.h>
#include <dlinkwm/config/config_helpers.h>
#include <dlinkwm/config/dynamic_config.h>
#include <dlinkwm/runtime/guest_memory_utils.h>
#include <dlinkwm/runtime/invocation_gate.h>
#include <dlinkwm/runtime/module_cache.h>

namespace dlinkwm::runtime {

const char* instancePolicyName(InstancePolicy policy) {
    switch (policy) {
        case InstancePolicy::ReloadEveryCall: return "reload";
        case InstancePolicy::FreshInstance: return "fresh";
        case InstancePolicy::ReuseInstance: return "reuse";
    }
    return "reload";
}

Result<InstancePolicy> parseInstancePolicy(std::string_view text) {
    if (text == "reload")
        return InstancePolicy::ReloadEveryCall;
    if (text == "fresh")
        return InstancePolicy::FreshInstance;
    if (text == "reuse")
        return InstancePolicy::ReuseInstance;
    return Error{ErrorCode::InvalidArgument,
                 "Unknown instance policy '" + std::string(text) + "' (expected reload, fresh or reuse)"};
}

InvocationGate::InvocationGate(ModuleCache& cache, const config::DynamicConfig& config)
    : InvocationGate(cache, config, Options{}) {}

InvocationGate::InvocationGate(ModuleCache& cache, const config::DynamicConfig& config,
                               Options options)
    : cache_(cache), config_(config), options_(options) {}

std::vector<std::string> InvocationGate::allowedFunctions(const std::string& modulePath) const {
    auto snap = config_.snapshot();
    auto it = snap->entryFunctions.find(modulePath);
    if (it != snap->entryFunctions.end()) {
        return it->second;
    }
    const auto key = ModuleCache::normalizeKey(modulePath);
    for (const auto& [path, functions] : snap->entryFunctions) {
        if (ModuleCache::normalizeKey(path) == key) {
            return functions;
        }
    }
    return {};
}

Result<EntryCallResult> InvocationGate::callEntry(const std::string& modulePath,
                                                  const std::string& function) {
    const auto allowed = allowedFunctions(modulePath);
    if (std::find(allowed.begin(), allowed.end(), function) == allowed.end()) {
        spdlog::warn("[Gate] Rejected call to '{}' in {}", function, modulePath);
        return Error{ErrorCode::AuthorizationError,
                     "Function '" + function + "' is not configured as an entry function for module '" +
                         modulePath + "'. Allowed functions: " +
                         config::format_string_array(allowed)};
    }

    Result<InstanceHandle> loaded{ErrorCode::InternalError};
    switch (options_.policy) {
        case InstancePolicy::ReloadEveryCall:
            loaded = cache_.hotReload(modulePath);
            break;
        case InstancePolicy::FreshInstance:
            cache_.resetInstance(modulePath);
            loaded = cache_.getOrLoad(modulePath);
            break;
        case InstancePolicy::ReuseInstance:
            loaded = cache_.getOrLoad(modulePath);
            break;
    }
    if (!loaded) {
        return loaded.error();
    }
    auto handle = std::move(loaded).value();

    EntryCallResult out;
    out.function = function;
    out.generation = handle->generation();

    auto lock = handle->lockExclusive();
    auto& instance = handle->instance();

    auto ret = instance.callI32Export(function);
    if (ret) {
        out.returnValue = ret.value();
        if (auto* memory = instance.memory()) {
            auto text = readGuestCString(*memory, static_cast<uint32_t>(ret.value()));
            if (!text) {
                return Error{text.error().code, "Cannot read result of '" + function + "' in " +
                                                    modulePath + ": " + text.error().message};
            }
            if (!common::isValidUtf8(text.value())) {
                return Error{ErrorCode::ProtocolError,
                             "Result of '" + function + "' in " + modulePath +
                                 " is not valid UTF-8"};
            }
            out.returnText = std::move(text).value();
        }
        spdlog::info("[Gate] Called {} in {} (returned {:#x})", function, modulePath,
                     static_cast<uint32_t>(ret.value()));
        return out;
    }
    if (ret.error().code != ErrorCode::SignatureMismatch) {
        spdlog::error("[Gate] Call to '{}' in {} failed: {}", function, modulePath,
                      ret.error().message);
        return ret.error();
    }

    auto voidRet = instance.callVoidExport(function);
    if (!voidRet) {
        if (voidRet.error().code == ErrorCode::SignatureMismatch) {
            return Error{ErrorCode::SignatureMismatch,
                         "Cannot call function '" + function + "' in " + modulePath +
                             ": incompatible signature (expected () -> i32 or () -> ())"};
        }
        spdlog::error("[Gate] Call to '{}' in {} failed: {}", function, modulePath,
                      voidRet.error().message);
        return voidRet.error();
    }
    spdlog::info("[Gate] Called {} in {} (no return value)", function, modulePath);
    return out;
}

} // namespace dlinkwm::runtime
