#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <string_view>
#include <optional>
#include <variant>
#include <vector>
#include <dlinkwm/runtime/guest_heap.h>
#include <dlinkwm/runtime/host_method_registry.h>
#include <dlinkwm/runtime/invocation_protocol.h>
#include <dlinkwm/runtime/wasm_runtime.h>

#if defined(DLINKWM_HAVE_WASMTIME)
#include <wasmtime.hh>
#define DLINKWM_WASMTIME_AVAILABLE 1
#else
#define DLINKWM_WASMTIME_AVAILABLE 0
#endif

namespace dlinkwm::runtime {

#if DLINKWM_WASMTIME_AVAILABLE
namespace {

class WasmtimeModule : public IGuestModule {
public:
    WasmtimeModule(wasmtime::Module module, std::size_t bytes)
        : module_(std::move(module)), bytes_(bytes) {}

    std::size_t byteSize() const override { return bytes_; }
    const wasmtime::Module& module() const { return module_; }

private:
    wasmtime::Module module_;
    std::size_t bytes_;
};

// Linear memory view bound to one store context.
class WasmtimeMemory : public IGuestMemory {
public:
    WasmtimeMemory(wasmtime::Store::Context cx, wasmtime::Memory memory)
        : cx_(cx), memory_(memory) {}

    Result<ByteVector> read(uint32_t offset, uint32_t length) override {
        auto data = memory_.data(cx_);
        if (static_cast<uint64_t>(offset) + length > data.size()) {
            return Error{ErrorCode::ProtocolError,
                         "Guest read out of bounds: offset " + std::to_string(offset) + " len " +
                             std::to_string(length) + " memory " + std::to_string(data.size())};
        }
        ByteVector out(length);
        if (length > 0) {
            std::memcpy(out.data(), data.data() + offset, length);
        }
        return out;
    }

    Result<void> write(uint32_t offset, ByteSpan bytes) override {
        auto data = memory_.data(cx_);
        if (static_cast<uint64_t>(offset) + bytes.size() > data.size()) {
            return Error{ErrorCode::ProtocolError,
                         "Guest write out of bounds: offset " + std::to_string(offset) + " len " +
                             std::to_string(bytes.size()) + " memory " +
                             std::to_string(data.size())};
        }
        if (!bytes.empty()) {
            std::memcpy(data.data() + offset, bytes.data(), bytes.size());
        }
        return {};
    }

    uint64_t size() override { return memory_.data(cx_).size(); }

private:
    wasmtime::Store::Context cx_;
    wasmtime::Memory memory_;
};

std::optional<wasmtime::Memory> callerMemory(wasmtime::Caller& caller) {
    auto exp = caller.get_export("memory");
    if (!exp)
        return std::nullopt;
    if (auto* mem = std::get_if<wasmtime::Memory>(&*exp))
        return *mem;
    return std::nullopt;
}

// Reserves the host heap region inside `memory` and places `heap` on it.
Result<void> reserveHeap(wasmtime::Store::Context cx, wasmtime::Memory& memory, GuestHeap& heap) {
    const uint64_t current = memory.data(cx).size();
    auto placement = GuestHeap::plan(heap.options(), current);
    if (!placement) {
        return placement.error();
    }
    const auto& where = placement.value();
    if (where.growPages > 0) {
        auto grown = memory.grow(cx, where.growPages);
        if (!grown) {
            return Error{ErrorCode::ResourceExhausted,
                         "Cannot grow guest memory by " + std::to_string(where.growPages) +
                             " page(s) for the host heap: " + grown.err().message()};
        }
    }
    heap.assign(where.base);
    spdlog::debug("[Wasmtime] Host heap at {:#x}..{:#x} (guest memory was {} bytes)", where.base,
                  heap.regionEnd(), current);
    return {};
}

class WasmtimeInstance : public IGuestInstance {
public:
    WasmtimeInstance(std::unique_ptr<wasmtime::Store> store, wasmtime::Instance instance,
                     std::shared_ptr<GuestHeap> heap)
        : store_(std::move(store)), instance_(instance), heap_(std::move(heap)) {
        auto exp = instance_.get(*store_, "memory");
        if (exp) {
            if (auto* mem = std::get_if<wasmtime::Memory>(&*exp)) {
                memory_.emplace(store_->context(), *mem);
            }
        }
    }

    Result<int32_t> callI32Export(const std::string& name) override {
        auto func = lookup(name);
        if (!func) {
            return func.error();
        }
        try {
            auto typed = func.value().typed<std::monostate, int32_t>(*store_);
            if (!typed) {
                return Error{ErrorCode::SignatureMismatch,
                             "Export '" + name + "' is not () -> i32: " + typed.err().message()};
            }
            auto res = typed.ok().call(*store_, std::monostate());
            if (!res) {
                return Error{ErrorCode::GuestTrap,
                             "Export '" + name + "' trapped: " + res.err().message()};
            }
            return res.ok();
        } catch (const std::exception& e) {
            return Error{ErrorCode::GuestTrap, "Export '" + name + "' failed: " + e.what()};
        }
    }

    Result<void> callVoidExport(const std::string& name) override {
        auto func = lookup(name);
        if (!func) {
            return func.error();
        }
        try {
            auto typed = func.value().typed<std::monostate, std::monostate>(*store_);
            if (!typed) {
                return Error{ErrorCode::SignatureMismatch,
                             "Export '" + name + "' is not () -> (): " + typed.err().message()};
            }
            auto res = typed.ok().call(*store_, std::monostate());
            if (!res) {
                return Error{ErrorCode::GuestTrap,
                             "Export '" + name + "' trapped: " + res.err().message()};
            }
            return {};
        } catch (const std::exception& e) {
            return Error{ErrorCode::GuestTrap, "Export '" + name + "' failed: " + e.what()};
        }
    }

    IGuestMemory* memory() override { return memory_ ? &*memory_ : nullptr; }

private:
    Result<wasmtime::Func> lookup(const std::string& name) {
        auto exp = instance_.get(*store_, name);
        if (!exp) {
            return Error{ErrorCode::ExportNotFound, "Export '" + name + "' not found in module"};
        }
        if (auto* fn = std::get_if<wasmtime::Func>(&*exp)) {
            return *fn;
        }
        return Error{ErrorCode::ExportNotCallable, "Export '" + name + "' is not a function"};
    }

    std::unique_ptr<wasmtime::Store> store_;
    wasmtime::Instance instance_;
    std::shared_ptr<GuestHeap> heap_;
    std::optional<WasmtimeMemory> memory_;
};

} // namespace
#endif

struct WasmRuntime::Impl {
#if DLINKWM_WASMTIME_AVAILABLE
    wasmtime::Engine engine;

    Result<void> defineHostImports(wasmtime::Linker& linker, HostMethodRegistry* registry,
                                   const std::shared_ptr<GuestHeap>& heap) {
        const std::string module(protocol::kHostModule);

        auto invokeDefined = linker.func_wrap(
            module, std::string(protocol::kUniversalInvoke),
            [registry](wasmtime::Caller caller, int32_t namePtr, int32_t nameLen, int32_t format,
                       int32_t paramsPtr, int32_t paramsLen, int32_t retPtr) -> int32_t {
                auto mem = callerMemory(caller);
                if (!mem || !registry) {
                    spdlog::error("[Wasmtime] universal_invoke without exported memory");
                    return static_cast<int32_t>(protocol::InvokeStatus::MethodError);
                }
                WasmtimeMemory view(caller.context(), *mem);
                auto status = protocol::dispatch(
                    *registry, view,
                    protocol::InvokeRequest::fromGuestArgs(namePtr, nameLen, format, paramsPtr,
                                                           paramsLen, retPtr));
                return static_cast<int32_t>(status);
            });
        if (!invokeDefined) {
            return Error{ErrorCode::InstantiationError,
                         "Cannot define universal_invoke: " + invokeDefined.err().message()};
        }

        auto mallocDefined = linker.func_wrap(
            module, std::string(protocol::kHostMalloc),
            [heap](wasmtime::Caller, int32_t size) -> int32_t {
                if (size <= 0)
                    return 0;
                auto offset = heap->allocate(static_cast<uint32_t>(size));
                if (!offset) {
                    spdlog::warn("[Wasmtime] host_malloc({}) failed: heap exhausted", size);
                    return 0;
                }
                return static_cast<int32_t>(*offset);
            });
        if (!mallocDefined) {
            return Error{ErrorCode::InstantiationError,
                         "Cannot define host_malloc: " + mallocDefined.err().message()};
        }

        auto freeDefined = linker.func_wrap(module, std::string(protocol::kHostFree),
                                     [heap](wasmtime::Caller, int32_t ptr) {
                                         if (ptr == 0)
                                             return;
                                         if (!heap->release(static_cast<uint32_t>(ptr))) {
                                             spdlog::warn("[Wasmtime] host_free({:#x}): not a "
                                                          "live allocation",
                                                          static_cast<uint32_t>(ptr));
                                         }
                                     });
        if (!freeDefined) {
            return Error{ErrorCode::InstantiationError,
                         "Cannot define host_free: " + freeDefined.err().message()};
        }
        return {};
    }
#endif
};

WasmRuntime::WasmRuntime() : pImpl_(std::make_unique<Impl>()) {}

WasmRuntime::~WasmRuntime() = default;

bool WasmRuntime::available() {
    return DLINKWM_WASMTIME_AVAILABLE != 0;
}

std::string WasmRuntime::name() const {
    return "wasmtime";
}

Result<std::shared_ptr<const IGuestModule>> WasmRuntime::compile(ByteSpan bytes) {
#if DLINKWM_WASMTIME_AVAILABLE
    try {
        std::vector<uint8_t> wasm(bytes.size());
        if (!bytes.empty()) {
            std::memcpy(wasm.data(), bytes.data(), bytes.size());
        }
        // Anything without the binary magic is treated as text format
        static constexpr uint8_t kMagic[4] = {0x00, 0x61, 0x73, 0x6d};
        if (wasm.size() < 4 || !std::equal(wasm.begin(), wasm.begin() + 4, kMagic)) {
            auto binary = wasmtime::wat2wasm(
                std::string_view(reinterpret_cast<const char*>(wasm.data()), wasm.size()));
            if (!binary) {
                return Error{ErrorCode::CompileError, binary.err().message()};
            }
            wasm = binary.ok();
        }
        auto compiled = wasmtime::Module::compile(pImpl_->engine, wasm);
        if (!compiled) {
            return Error{ErrorCode::CompileError, compiled.err().message()};
        }
        std::shared_ptr<const IGuestModule> module =
            std::make_shared<WasmtimeModule>(compiled.ok(), bytes.size());
        return module;
    } catch (const std::exception& e) {
        return Error{ErrorCode::CompileError, e.what()};
    }
#else
    (void)bytes;
    return Error{ErrorCode::NotSupported, "wasmtime-cpp not available at build time"};
#endif
}

Result<std::unique_ptr<IGuestInstance>>
WasmRuntime::instantiate(const std::shared_ptr<const IGuestModule>& module,
                         const HostImports& imports) {
#if DLINKWM_WASMTIME_AVAILABLE
    auto wasmModule = std::dynamic_pointer_cast<const WasmtimeModule>(module);
    if (!wasmModule) {
        return Error{ErrorCode::InvalidArgument, "Module was not compiled by the wasmtime engine"};
    }
    try {
        auto store = std::make_unique<wasmtime::Store>(pImpl_->engine);

        wasmtime::WasiConfig wasi;
        wasi.inherit_stdin();
        wasi.inherit_stdout();
        wasi.inherit_stderr();
        auto wasiSet = store->context().set_wasi(std::move(wasi));
        if (!wasiSet) {
            return Error{ErrorCode::InstantiationError,
                         "Cannot configure WASI: " + wasiSet.err().message()};
        }

        wasmtime::Linker linker(pImpl_->engine);
        auto wasiDefined = linker.define_wasi();
        if (!wasiDefined) {
            return Error{ErrorCode::InstantiationError,
                         "Cannot define WASI imports: " + wasiDefined.err().message()};
        }

        auto heap = std::make_shared<GuestHeap>(imports.heap);
        auto hostDefined = pImpl_->defineHostImports(linker, imports.registry, heap);
        if (!hostDefined) {
            return hostDefined.error();
        }

        auto instance = linker.instantiate(*store, wasmModule->module());
        if (!instance) {
            return Error{ErrorCode::InstantiationError, instance.err().message()};
        }
        auto exported = instance.ok().get(*store, "memory");
        if (exported) {
            if (auto* mem = std::get_if<wasmtime::Memory>(&*exported)) {
                auto reserved = reserveHeap(store->context(), *mem, *heap);
                if (!reserved) {
                    return Error{ErrorCode::InstantiationError, reserved.error().message};
                }
            }
        }
        std::unique_ptr<IGuestInstance> out = std::make_unique<WasmtimeInstance>(
            std::move(store), instance.ok(), std::move(heap));
        return std::move(out);
    } catch (const std::exception& e) {
        return Error{ErrorCode::InstantiationError, e.what()};
    }
#else
    (void)module;
    (void)imports;
    return Error{ErrorCode::NotSupported, "wasmtime-cpp not available at build time"};
#endif
}

} // namespace dlinkwm::runtime
