#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <dlinkwm/core/types.h>
#include <dlinkwm/runtime/serialization_format.h>

namespace dlinkwm::runtime {

/**
 * @brief Outcome reported by a host method handler
 *
 * `success` is the handler-level flag written into the response frame; it is distinct from
 * the protocol return code seen by the guest.
 */
struct HandlerResponse {
    bool success{false};
    ByteVector payload;
};

/**
 * @brief Host-side implementation of a method callable from guest code
 *
 * Handlers receive the raw parameter bytes together with the format the guest declared.
 * A handler that does not understand the format must return an error instead of decoding.
 * Errors are reported to the guest as a failed response frame carrying the error message.
 */
class IHostMethodHandler {
public:
    virtual ~IHostMethodHandler() = default;

    virtual Result<HandlerResponse> invoke(ByteSpan params, SerializationFormat format) = 0;
};

/**
 * @brief Adapter turning any callable into a handler
 */
class FunctionMethodHandler : public IHostMethodHandler {
public:
    using Function = std::function<Result<HandlerResponse>(ByteSpan, SerializationFormat)>;

    explicit FunctionMethodHandler(Function fn) : fn_(std::move(fn)) {}

    Result<HandlerResponse> invoke(ByteSpan params, SerializationFormat format) override {
        return fn_(params, format);
    }

private:
    Function fn_;
};

/**
 * @brief Table of host methods exposed to guests through universal_invoke
 *
 * Owned by the embedding application and passed by reference to every component that
 * dispatches guest calls. All operations are thread-safe; lookups take a shared lock,
 * mutations an exclusive one.
 */
class HostMethodRegistry {
public:
    HostMethodRegistry() = default;
    ~HostMethodRegistry() = default;

    HostMethodRegistry(const HostMethodRegistry&) = delete;
    HostMethodRegistry& operator=(const HostMethodRegistry&) = delete;

    /**
     * @brief Register a handler under a unique name
     * @return true if inserted, false if the name is taken (existing handler untouched)
     *         or the arguments are invalid
     */
    bool registerMethod(const std::string& name, std::shared_ptr<IHostMethodHandler> handler);

    /**
     * @brief Convenience overload wrapping a callable in FunctionMethodHandler
     */
    bool registerMethod(const std::string& name, FunctionMethodHandler::Function fn);

    /**
     * @brief Remove a handler
     * @return true if an entry existed and was removed
     */
    bool unregisterMethod(const std::string& name);

    [[nodiscard]] bool hasMethod(const std::string& name) const;

    /**
     * @brief Look up a handler for dispatch
     * @return Handler or nullptr. The returned handler stays valid after unregistration.
     */
    [[nodiscard]] std::shared_ptr<IHostMethodHandler> find(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> methodNames() const;
    [[nodiscard]] std::size_t size() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<IHostMethodHandler>> methods_;
};

} // namespace dlinkwm::runtime
