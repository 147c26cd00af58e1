#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <dlinkwm/core/types.h>

namespace dlinkwm::runtime {
class IGuestMemory;
}

namespace dlinkwm::json {

// Reads [offset, offset+length) from guest memory and parses it as JSON.
Result<nlohmann::json> readGuestJson(runtime::IGuestMemory& memory, uint32_t offset,
                                     uint32_t length);

// Serializes `value` and writes it at `offset`. Returns the number of bytes written.
Result<std::size_t> writeGuestJson(runtime::IGuestMemory& memory, uint32_t offset,
                                   const nlohmann::json& value);

// Typed variants; T must be convertible with nlohmann's from_json/to_json.
template <typename T>
Result<T> readGuestValue(runtime::IGuestMemory& memory, uint32_t offset, uint32_t length) {
    auto doc = readGuestJson(memory, offset, length);
    if (!doc) {
        return doc.error();
    }
    try {
        return doc.value().template get<T>();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("JSON does not match type: ") + e.what()};
    }
}

template <typename T>
Result<std::size_t> writeGuestValue(runtime::IGuestMemory& memory, uint32_t offset,
                                    const T& value) {
    return writeGuestJson(memory, offset, nlohmann::json(value));
}

} // namespace dlinkwm::json
