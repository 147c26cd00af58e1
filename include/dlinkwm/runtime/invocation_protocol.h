#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <dlinkwm/core/types.h>
#include <dlinkwm/runtime/serialization_format.h>

namespace dlinkwm::runtime {

class HostMethodRegistry;
class IGuestMemory;

namespace protocol {

// Import namespace and names the guest links against.
inline constexpr std::string_view kHostModule = "dlinkwm_host";
inline constexpr std::string_view kUniversalInvoke = "universal_invoke";
inline constexpr std::string_view kHostMalloc = "host_malloc";
inline constexpr std::string_view kHostFree = "host_free";

// Return codes of universal_invoke as seen by the guest.
enum class InvokeStatus : int32_t {
    Ok = 0,          // handler ran and its response frame was written
    MethodError = 1, // method name unreadable, not UTF-8, or not registered
    FormatError = 2, // unknown discriminant or parameter bytes unreadable
    WriteError = 3,  // response frame could not be written
};

// Response frame layout at the guest-supplied offset (little-endian, no padding):
//   [0..4)  u32 status   1 = handler success, 0 = handler failure
//   [4..8)  u32 length   payload size in bytes
//   [8..)   payload
inline constexpr std::size_t kResponseHeaderSize = 8;

// Arguments of universal_invoke exactly as received from the guest. Pointers and lengths
// are wasm32 values and are reinterpreted as unsigned.
struct InvokeRequest {
    uint32_t methodNamePtr = 0;
    uint32_t methodNameLen = 0;
    int32_t format = 0;
    uint32_t paramsPtr = 0;
    uint32_t paramsLen = 0;
    uint32_t responsePtr = 0;

    static InvokeRequest fromGuestArgs(int32_t namePtr, int32_t nameLen, int32_t format,
                                       int32_t paramsPtr, int32_t paramsLen, int32_t retPtr) {
        return InvokeRequest{static_cast<uint32_t>(namePtr), static_cast<uint32_t>(nameLen),
                             format,
                             static_cast<uint32_t>(paramsPtr), static_cast<uint32_t>(paramsLen),
                             static_cast<uint32_t>(retPtr)};
    }
};

struct ResponseFrame {
    bool success{false};
    ByteVector payload;
};

// Serializes a complete frame (header + payload) into a contiguous buffer.
ByteVector encodeResponse(bool success, ByteSpan payload);

// Parses a frame produced by encodeResponse or written by dispatch. Trailing bytes past the
// declared payload are ignored.
Result<ResponseFrame> decodeResponse(ByteSpan frame);

// Runs one guest->host call: reads the request from guest memory, resolves the handler in
// `registry`, invokes it and writes the response frame. Never throws.
InvokeStatus dispatch(const HostMethodRegistry& registry, IGuestMemory& memory,
                      const InvokeRequest& request);

} // namespace protocol
} // namespace dlinkwm::runtime
