#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <dlinkwm/core/types.h>

namespace dlinkwm::config {
class DynamicConfig;
} // namespace dlinkwm::config

namespace dlinkwm::runtime {

class ModuleCache;

// How the gate obtains the instance for an authorized call.
enum class InstancePolicy {
    ReloadEveryCall, // recompile and re-instantiate from disk on every call
    FreshInstance,   // new instance per call; compiled module reused while bytes are unchanged
    ReuseInstance,   // keep the cached instance (guest state persists between calls)
};

const char* instancePolicyName(InstancePolicy policy);
Result<InstancePolicy> parseInstancePolicy(std::string_view text);

struct EntryCallResult {
    std::string function;
    // Set when the export has signature () -> i32
    std::optional<int32_t> returnValue;
    // NUL-terminated UTF-8 string the returned pointer refers to, when memory is exported
    std::optional<std::string> returnText;
    uint64_t generation = 0;
};

/**
 * @brief Host-initiated entry into guest modules
 *
 * Only exports listed for the module in the current configuration snapshot may be called.
 * Authorization is checked before any module is loaded.
 */
class InvocationGate {
public:
    struct Options {
        InstancePolicy policy = InstancePolicy::ReloadEveryCall;
    };

    InvocationGate(ModuleCache& cache, const config::DynamicConfig& config);
    InvocationGate(ModuleCache& cache, const config::DynamicConfig& config, Options options);

    /**
     * @brief Call `function` exported by the module at `modulePath`
     *
     * Tries () -> i32 first (the result is read as a guest C string), then () -> ().
     * @return AuthorizationError, ExportNotFound, ExportNotCallable, SignatureMismatch,
     *         GuestTrap, ProtocolError or any load error from the cache
     */
    Result<EntryCallResult> callEntry(const std::string& modulePath, const std::string& function);

    // Entry functions configured for `modulePath` (exact key first, then by normalized path).
    std::vector<std::string> allowedFunctions(const std::string& modulePath) const;

    const Options& options() const { return options_; }

private:
    ModuleCache& cache_;
    const config::DynamicConfig& config_;
    Options options_;
};

} // namespace dlinkwm::runtime
