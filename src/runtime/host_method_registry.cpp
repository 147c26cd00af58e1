#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <dlinkwm/runtime/host_method_registry.h>

namespace dlinkwm::runtime {

bool HostMethodRegistry::registerMethod(const std::string& name,
                                        std::shared_ptr<IHostMethodHandler> handler) {
    if (!handler) {
        spdlog::warn("[HostMethods] refusing to register null handler for '{}'", name);
        return false;
    }
    if (name.empty()) {
        spdlog::warn("[HostMethods] refusing to register handler with empty name");
        return false;
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = methods_.try_emplace(name, std::move(handler));
    if (!inserted) {
        spdlog::debug("[HostMethods] '{}' already registered", name);
        return false;
    }
    spdlog::debug("[HostMethods] registered '{}'", name);
    return true;
}

bool HostMethodRegistry::registerMethod(const std::string& name,
                                        FunctionMethodHandler::Function fn) {
    if (!fn) {
        spdlog::warn("[HostMethods] refusing to register empty function for '{}'", name);
        return false;
    }
    return registerMethod(name, std::make_shared<FunctionMethodHandler>(std::move(fn)));
}

bool HostMethodRegistry::unregisterMethod(const std::string& name) {
    std::unique_lock lock(mutex_);
    if (methods_.erase(name) == 0) {
        return false;
    }
    spdlog::debug("[HostMethods] unregistered '{}'", name);
    return true;
}

bool HostMethodRegistry::hasMethod(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return methods_.find(name) != methods_.end();
}

std::shared_ptr<IHostMethodHandler> HostMethodRegistry::find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = methods_.find(name);
    return (it != methods_.end()) ? it->second : nullptr;
}

std::vector<std::string> HostMethodRegistry::methodNames() const {
    std::vector<std::string> names;
    {
        std::shared_lock lock(mutex_);
        names.reserve(methods_.size());
        for (const auto& [name, handler] : methods_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::size_t HostMethodRegistry::size() const {
    std::shared_lock lock(mutex_);
    return methods_.size();
}

void HostMethodRegistry::clear() {
    std::unique_lock lock(mutex_);
    methods_.clear();
}

} // namespace dlinkwm::runtime
