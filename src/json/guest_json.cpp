#include <dlinkwm/common/byte_utils.h>
#include <dlinkwm/json/guest_json.h>
#include <dlinkwm/runtime/guest_engine.h>

namespace dlinkwm::json {

Result<nlohmann::json> readGuestJson(runtime::IGuestMemory& memory, uint32_t offset,
                                     uint32_t length) {
    auto bytes = memory.read(offset, length);
    if (!bytes) {
        return bytes.error();
    }
    try {
        return nlohmann::json::parse(common::toString(bytes.value()));
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("Invalid JSON in guest memory: ") +
                                                 e.what()};
    }
}

Result<std::size_t> writeGuestJson(runtime::IGuestMemory& memory, uint32_t offset,
                                   const nlohmann::json& value) {
    const std::string text = value.dump();
    auto wr = memory.write(offset, common::toBytes(text));
    if (!wr) {
        return wr.error();
    }
    return text.size();
}

} // namespace dlinkwm::json
