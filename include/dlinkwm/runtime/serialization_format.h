#pragma once

#include <cstdint>
#include <optional>

namespace dlinkwm::runtime {

// Encoding of handler parameters and responses. The discriminant values are part of the
// guest ABI and must not change.
enum class SerializationFormat : uint32_t {
    Json = 0,
    Bincode = 1,
    Protobuf = 2,
    FlatBuffers = 3,
};

constexpr const char* formatName(SerializationFormat format) {
    switch (format) {
        case SerializationFormat::Json: return "json";
        case SerializationFormat::Bincode: return "bincode";
        case SerializationFormat::Protobuf: return "protobuf";
        case SerializationFormat::FlatBuffers: return "flatbuffers";
    }
    return "unknown";
}

constexpr std::optional<SerializationFormat> formatFromDiscriminant(int32_t value) {
    switch (value) {
        case 0: return SerializationFormat::Json;
        case 1: return SerializationFormat::Bincode;
        case 2: return SerializationFormat::Protobuf;
        case 3: return SerializationFormat::FlatBuffers;
        default: return std::nullopt;
    }
}

} // namespace dlinkwm::runtime
