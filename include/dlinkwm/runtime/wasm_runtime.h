#pragma once

#include <memory>
#include <string>
#include <dlinkwm/runtime/guest_engine.h>

namespace dlinkwm::runtime {

// Guest engine backed by wasmtime-cpp. Instances get WASI with inherited stdio and the
// dlinkwm_host imports (universal_invoke, host_malloc, host_free). When wasmtime is not
// available at build time this class compiles to stubs that return NotSupported.
class WasmRuntime : public IGuestEngine {
public:
    WasmRuntime();
    ~WasmRuntime() override;

    WasmRuntime(const WasmRuntime&) = delete;
    WasmRuntime& operator=(const WasmRuntime&) = delete;

    // True when the build links wasmtime.
    static bool available();

    std::string name() const override;

    Result<std::shared_ptr<const IGuestModule>> compile(ByteSpan bytes) override;

    Result<std::unique_ptr<IGuestInstance>>
    instantiate(const std::shared_ptr<const IGuestModule>& module,
                const HostImports& imports) override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace dlinkwm::runtime
