#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include <dlinkwm/core/types.h>
#include <dlinkwm/runtime/host_method_registry.h>

namespace dlinkwm::json {

// Host method that speaks JSON only. Parameters are parsed into nlohmann::json, the result
// is serialized back as the response payload. Any other format is rejected at handler level.
class JsonMethodHandler : public runtime::IHostMethodHandler {
public:
    using Function = std::function<Result<nlohmann::json>(const nlohmann::json&)>;

    JsonMethodHandler(std::string method, Function fn);

    Result<runtime::HandlerResponse> invoke(ByteSpan params,
                                            runtime::SerializationFormat format) override;

private:
    std::string method_;
    Function fn_;
};

// Registers `fn` under `name` wrapped in a JsonMethodHandler.
bool registerJsonMethod(runtime::HostMethodRegistry& registry, const std::string& name,
                        JsonMethodHandler::Function fn);

} // namespace dlinkwm::json
