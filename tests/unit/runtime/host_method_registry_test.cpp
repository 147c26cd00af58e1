#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include <dlinkwm/common/byte_utils.h>
#include <dlinkwm/runtime/host_method_registry.h>

using namespace dlinkwm;
using namespace dlinkwm::runtime;

namespace {

FunctionMethodHandler::Function replyWith(std::string text) {
    return [text = std::move(text)](ByteSpan, SerializationFormat) -> Result<HandlerResponse> {
        return HandlerResponse{true, common::toBytes(text)};
    };
}

std::string answer(const HostMethodRegistry& registry, const std::string& name) {
    auto handler = registry.find(name);
    if (!handler)
        return "<missing>";
    auto res = handler->invoke({}, SerializationFormat::Json);
    if (!res)
        return "<error>";
    return common::toString(res.value().payload);
}

} // namespace

TEST(HostMethodRegistryTest, DoubleRegistrationKeepsOriginalHandler) {
    HostMethodRegistry registry;
    EXPECT_TRUE(registry.registerMethod("greet", replyWith("first")));
    EXPECT_FALSE(registry.registerMethod("greet", replyWith("second")));
    EXPECT_EQ(answer(registry, "greet"), "first");
    EXPECT_EQ(registry.size(), 1u);
}

TEST(HostMethodRegistryTest, UnregisterUnknownNameLeavesOthersIntact) {
    HostMethodRegistry registry;
    ASSERT_TRUE(registry.registerMethod("a", replyWith("A")));
    ASSERT_TRUE(registry.registerMethod("b", replyWith("B")));

    EXPECT_FALSE(registry.unregisterMethod("missing"));
    EXPECT_TRUE(registry.hasMethod("a"));
    EXPECT_TRUE(registry.hasMethod("b"));
    EXPECT_EQ(answer(registry, "b"), "B");
}

TEST(HostMethodRegistryTest, UnregisterThenRegisterAgain) {
    HostMethodRegistry registry;
    ASSERT_TRUE(registry.registerMethod("m", replyWith("old")));
    EXPECT_TRUE(registry.unregisterMethod("m"));
    EXPECT_FALSE(registry.hasMethod("m"));
    EXPECT_FALSE(registry.unregisterMethod("m"));
    EXPECT_TRUE(registry.registerMethod("m", replyWith("new")));
    EXPECT_EQ(answer(registry, "m"), "new");
}

TEST(HostMethodRegistryTest, RejectsNullHandlerAndEmptyName) {
    HostMethodRegistry registry;
    EXPECT_FALSE(registry.registerMethod("x", std::shared_ptr<IHostMethodHandler>{}));
    EXPECT_FALSE(registry.registerMethod("x", FunctionMethodHandler::Function{}));
    EXPECT_FALSE(registry.registerMethod("", replyWith("y")));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(HostMethodRegistryTest, FoundHandlerSurvivesUnregistration) {
    HostMethodRegistry registry;
    ASSERT_TRUE(registry.registerMethod("m", replyWith("still here")));
    auto handler = registry.find("m");
    ASSERT_TRUE(handler);
    ASSERT_TRUE(registry.unregisterMethod("m"));

    auto res = handler->invoke({}, SerializationFormat::Json);
    ASSERT_TRUE(res);
    EXPECT_EQ(common::toString(res.value().payload), "still here");
}

TEST(HostMethodRegistryTest, MethodNamesAreSorted) {
    HostMethodRegistry registry;
    registry.registerMethod("zeta", replyWith(""));
    registry.registerMethod("alpha", replyWith(""));
    registry.registerMethod("mid", replyWith(""));
    EXPECT_EQ(registry.methodNames(), (std::vector<std::string>{"alpha", "mid", "zeta"}));

    registry.clear();
    EXPECT_TRUE(registry.methodNames().empty());
}

TEST(HostMethodRegistryTest, ConcurrentRegistrationHasOneWinner) {
    HostMethodRegistry registry;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            if (registry.registerMethod("shared", replyWith(std::to_string(i))))
                winners.fetch_add(1);
            (void)registry.hasMethod("shared");
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(registry.size(), 1u);
}
