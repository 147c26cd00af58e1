#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <dlinkwm/core/types.h>

namespace dlinkwm::common {

inline ByteVector toBytes(std::string_view text) {
    ByteVector out(text.size());
    if (!text.empty()) {
        std::memcpy(out.data(), text.data(), text.size());
    }
    return out;
}

inline std::string toString(ByteSpan bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

inline void putU32LE(std::byte* out, uint32_t value) {
    out[0] = static_cast<std::byte>(value & 0xFFu);
    out[1] = static_cast<std::byte>((value >> 8) & 0xFFu);
    out[2] = static_cast<std::byte>((value >> 16) & 0xFFu);
    out[3] = static_cast<std::byte>((value >> 24) & 0xFFu);
}

inline uint32_t getU32LE(const std::byte* in) {
    return static_cast<uint32_t>(in[0]) | (static_cast<uint32_t>(in[1]) << 8) |
           (static_cast<uint32_t>(in[2]) << 16) | (static_cast<uint32_t>(in[3]) << 24);
}

} // namespace dlinkwm::common
