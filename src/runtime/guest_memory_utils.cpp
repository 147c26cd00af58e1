#include <dlinkwm/common/byte_utils.h>
#include <dlinkwm/runtime/guest_engine.h>
#include <dlinkwm/runtime/guest_memory_utils.h>

namespace dlinkwm::runtime {

Result<std::string> readGuestCString(IGuestMemory& memory, uint32_t offset) {
    std::string out;
    uint64_t cursor = offset;
    while (true) {
        if (cursor > 0xFFFFFFFFull) {
            return Error{ErrorCode::ProtocolError,
                         "Unterminated string at offset " + std::to_string(offset)};
        }
        auto byte = memory.read(static_cast<uint32_t>(cursor), 1);
        if (!byte) {
            return Error{ErrorCode::ProtocolError,
                         "Unterminated string at offset " + std::to_string(offset) + ": " +
                             byte.error().message};
        }
        const std::byte b = byte.value().front();
        if (b == std::byte{0}) {
            break;
        }
        out.push_back(static_cast<char>(b));
        ++cursor;
    }
    return out;
}

Result<void> writeGuestCString(IGuestMemory& memory, uint32_t offset, const std::string& text) {
    ByteVector bytes = common::toBytes(text);
    bytes.push_back(std::byte{0});
    return memory.write(offset, bytes);
}

} // namespace dlinkwm::runtime
