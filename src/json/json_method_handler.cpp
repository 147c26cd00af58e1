#include <spdlog/spdlog.h>
#include <dlinkwm/common/byte_utils.h>
#include <dlinkwm/json/json_method_handler.h>

namespace dlinkwm::json {

JsonMethodHandler::JsonMethodHandler(std::string method, Function fn)
    : method_(std::move(method)), fn_(std::move(fn)) {}

Result<runtime::HandlerResponse> JsonMethodHandler::invoke(ByteSpan params,
                                                           runtime::SerializationFormat format) {
    if (format != runtime::SerializationFormat::Json) {
        return Error{ErrorCode::HandlerError, "Format '" + std::string(runtime::formatName(format)) +
                                                  "' not supported by method '" + method_ +
                                                  "' (expects json)"};
    }

    nlohmann::json input;
    try {
        input = nlohmann::json::parse(common::toString(params));
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::HandlerError,
                     "Invalid JSON parameters for '" + method_ + "': " + e.what()};
    }

    auto output = fn_(input);
    if (!output) {
        return Error{ErrorCode::HandlerError, output.error().message};
    }

    runtime::HandlerResponse response;
    response.success = true;
    response.payload = common::toBytes(output.value().dump());
    return response;
}

bool registerJsonMethod(runtime::HostMethodRegistry& registry, const std::string& name,
                        JsonMethodHandler::Function fn) {
    if (!fn) {
        return false;
    }
    return registry.registerMethod(name, std::make_shared<JsonMethodHandler>(name, std::move(fn)));
}

} // namespace dlinkwm::json
