#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <exception>
#include <limits>
#include <dlinkwm/common/byte_utils.h>
#include <dlinkwm/common/utf8_utils.h>
#include <dlinkwm/runtime/guest_engine.h>
#include <dlinkwm/runtime/host_method_registry.h>
#include <dlinkwm/runtime/invocation_protocol.h>

namespace dlinkwm::runtime::protocol {

ByteVector encodeResponse(bool success, ByteSpan payload) {
    ByteVector out(kResponseHeaderSize + payload.size());
    common::putU32LE(out.data(), success ? 1u : 0u);
    common::putU32LE(out.data() + 4, static_cast<uint32_t>(payload.size()));
    if (!payload.empty()) {
        std::copy(payload.begin(), payload.end(), out.begin() + kResponseHeaderSize);
    }
    return out;
}

Result<ResponseFrame> decodeResponse(ByteSpan frame) {
    if (frame.size() < kResponseHeaderSize) {
        return Error{ErrorCode::ProtocolError,
                     "Response frame too short: " + std::to_string(frame.size()) + " bytes"};
    }
    const uint32_t status = common::getU32LE(frame.data());
    const uint32_t length = common::getU32LE(frame.data() + 4);
    if (status > 1) {
        return Error{ErrorCode::ProtocolError,
                     "Invalid response status: " + std::to_string(status)};
    }
    if (frame.size() - kResponseHeaderSize < length) {
        return Error{ErrorCode::ProtocolError, "Response payload truncated: expected " +
                                                   std::to_string(length) + " bytes, have " +
                                                   std::to_string(frame.size() -
                                                                  kResponseHeaderSize)};
    }
    ResponseFrame out;
    out.success = status == 1;
    auto body = frame.subspan(kResponseHeaderSize, length);
    out.payload.assign(body.begin(), body.end());
    return out;
}

namespace {

HandlerResponse invokeHandler(IHostMethodHandler& handler, const std::string& method,
                              ByteSpan params, SerializationFormat format) {
    try {
        auto res = handler.invoke(params, format);
        if (res) {
            return std::move(res).value();
        }
        spdlog::debug("[Invoke] '{}' failed ({}): {}", method, res.error().code,
                      res.error().message);
        return HandlerResponse{false, common::toBytes(res.error().message)};
    } catch (const std::exception& e) {
        spdlog::error("[Invoke] '{}' threw: {}", method, e.what());
        return HandlerResponse{false, common::toBytes(std::string("handler exception: ") +
                                                      e.what())};
    }
}

} // namespace

InvokeStatus dispatch(const HostMethodRegistry& registry, IGuestMemory& memory,
                      const InvokeRequest& request) {
    auto nameBytes = memory.read(request.methodNamePtr, request.methodNameLen);
    if (!nameBytes) {
        spdlog::warn("[Invoke] method name unreadable at {}+{}: {}", request.methodNamePtr,
                     request.methodNameLen, nameBytes.error().message);
        return InvokeStatus::MethodError;
    }
    std::string method = common::toString(nameBytes.value());
    if (!common::isValidUtf8(method)) {
        spdlog::warn("[Invoke] method name is not valid UTF-8: '{}'",
                     common::sanitizeUtf8(method));
        return InvokeStatus::MethodError;
    }

    auto format = formatFromDiscriminant(request.format);
    if (!format) {
        spdlog::warn("[Invoke] '{}': unknown serialization format {}", method, request.format);
        return InvokeStatus::FormatError;
    }

    auto params = memory.read(request.paramsPtr, request.paramsLen);
    if (!params) {
        spdlog::warn("[Invoke] '{}': parameters unreadable at {}+{}: {}", method,
                     request.paramsPtr, request.paramsLen, params.error().message);
        return InvokeStatus::FormatError;
    }

    auto handler = registry.find(method);
    if (!handler) {
        spdlog::warn("[Invoke] method not registered: '{}'", method);
        return InvokeStatus::MethodError;
    }

    spdlog::debug("[Invoke] '{}' format={} params={}B", method, formatName(*format),
                  params.value().size());
    HandlerResponse response = invokeHandler(*handler, method, params.value(), *format);

    if (response.payload.size() > std::numeric_limits<uint32_t>::max()) {
        spdlog::error("[Invoke] '{}': response too large ({} bytes)", method,
                      response.payload.size());
        return InvokeStatus::WriteError;
    }

    std::array<std::byte, 4> word{};
    common::putU32LE(word.data(), response.success ? 1u : 0u);
    if (!memory.write(request.responsePtr, word)) {
        return InvokeStatus::WriteError;
    }
    common::putU32LE(word.data(), static_cast<uint32_t>(response.payload.size()));
    if (!memory.write(request.responsePtr + 4, word)) {
        return InvokeStatus::WriteError;
    }
    if (!response.payload.empty()) {
        auto wr = memory.write(request.responsePtr + static_cast<uint32_t>(kResponseHeaderSize),
                               response.payload);
        if (!wr) {
            spdlog::warn("[Invoke] '{}': response payload write failed: {}", method,
                         wr.error().message);
            return InvokeStatus::WriteError;
        }
    }
    return InvokeStatus::Ok;
}

} // namespace dlinkwm::runtime::protocol
