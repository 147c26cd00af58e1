#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <dlinkwm/core/types.h>
#include <dlinkwm/runtime/guest_heap.h>

namespace dlinkwm::runtime {

class HostMethodRegistry;

// View over one instance's linear memory. Offsets are guest addresses; any access outside
// the current memory size fails with ProtocolError.
class IGuestMemory {
public:
    virtual ~IGuestMemory() = default;

    virtual Result<ByteVector> read(uint32_t offset, uint32_t length) = 0;
    virtual Result<void> write(uint32_t offset, ByteSpan data) = 0;
    virtual uint64_t size() = 0;
};

// A compiled, validated module. Immutable and shareable across instantiations.
class IGuestModule {
public:
    virtual ~IGuestModule() = default;

    virtual std::size_t byteSize() const = 0;
};

// One instantiated module together with its execution context. Not thread-safe: callers
// hold the owning InstanceRecord's exclusive lock while using it.
class IGuestInstance {
public:
    virtual ~IGuestInstance() = default;

    // Calls an export with signature () -> i32. Fails with ExportNotFound, ExportNotCallable,
    // SignatureMismatch or GuestTrap.
    virtual Result<int32_t> callI32Export(const std::string& name) = 0;

    // Calls an export with signature () -> (). Same failure modes as callI32Export.
    virtual Result<void> callVoidExport(const std::string& name) = 0;

    // Exported linear memory ("memory"), or nullptr if the module exports none.
    virtual IGuestMemory* memory() = 0;
};

// What the host wires into every instance's import namespace.
struct HostImports {
    HostMethodRegistry* registry = nullptr;
    GuestHeap::Options heap;
};

// Compiler/validator/executor capability. Implementations must be safe to call from
// several threads at once.
class IGuestEngine {
public:
    virtual ~IGuestEngine() = default;

    virtual std::string name() const = 0;

    // Fails with CompileError when the bytes are not a valid module.
    virtual Result<std::shared_ptr<const IGuestModule>> compile(ByteSpan bytes) = 0;

    // Fails with InstantiationError when imports cannot be resolved.
    virtual Result<std::unique_ptr<IGuestInstance>>
    instantiate(const std::shared_ptr<const IGuestModule>& module, const HostImports& imports) = 0;
};

} // namespace dlinkwm::runtime
