#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "../../common/in_memory_guest_memory.h"
#include <dlinkwm/common/byte_utils.h>
#include <dlinkwm/runtime/host_method_registry.h>
#include <dlinkwm/runtime/invocation_protocol.h>

using namespace dlinkwm;
using namespace dlinkwm::runtime;
using dlinkwm::tests::InMemoryGuestMemory;

namespace {

constexpr uint32_t kName = 16;
constexpr uint32_t kParams = 64;
constexpr uint32_t kResponse = 128;

uint32_t u32At(const InMemoryGuestMemory& mem, uint32_t offset) {
    return common::getU32LE(mem.bytes().data() + offset);
}

class InvocationProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.registerMethod("echo", [](ByteSpan params, SerializationFormat)
                                            -> Result<HandlerResponse> {
            return HandlerResponse{true, ByteVector(params.begin(), params.end())};
        });
    }

    protocol::InvokeStatus call(const std::string& method, int32_t format,
                                const std::string& params) {
        memory.put(kName, method);
        memory.put(kParams, params);
        protocol::InvokeRequest req;
        req.methodNamePtr = kName;
        req.methodNameLen = static_cast<uint32_t>(method.size());
        req.format = format;
        req.paramsPtr = kParams;
        req.paramsLen = static_cast<uint32_t>(params.size());
        req.responsePtr = kResponse;
        return protocol::dispatch(registry, memory, req);
    }

    bool responseUntouched() const {
        for (uint32_t i = kResponse; i < kResponse + 16; ++i) {
            if (memory.bytes()[i] != std::byte{0xAB})
                return false;
        }
        return true;
    }

    HostMethodRegistry registry;
    InMemoryGuestMemory memory{256, std::byte{0xAB}};
};

} // namespace

TEST_F(InvocationProtocolTest, EchoRoundTripWritesExactFrame) {
    EXPECT_EQ(call("echo", 0, "hi"), protocol::InvokeStatus::Ok);

    const auto& b = memory.bytes();
    const std::byte expected[] = {std::byte{1}, std::byte{0}, std::byte{0}, std::byte{0},
                                  std::byte{2}, std::byte{0}, std::byte{0}, std::byte{0},
                                  std::byte{'h'}, std::byte{'i'}};
    for (std::size_t i = 0; i < sizeof(expected); ++i) {
        EXPECT_EQ(b[kResponse + i], expected[i]) << "byte " << i;
    }
    // Nothing written past the payload
    EXPECT_EQ(b[kResponse + 10], std::byte{0xAB});
}

TEST_F(InvocationProtocolTest, InvalidDiscriminantLeavesResponseUntouched) {
    EXPECT_EQ(call("echo", 9, "hi"), protocol::InvokeStatus::FormatError);
    EXPECT_TRUE(responseUntouched());
    EXPECT_EQ(call("echo", -1, "hi"), protocol::InvokeStatus::FormatError);
    EXPECT_TRUE(responseUntouched());
}

TEST_F(InvocationProtocolTest, UnknownMethodReturnsMethodError) {
    EXPECT_EQ(call("nope", 0, "{}"), protocol::InvokeStatus::MethodError);
    EXPECT_TRUE(responseUntouched());
}

TEST_F(InvocationProtocolTest, InvalidUtf8NameReturnsMethodError) {
    EXPECT_EQ(call(std::string("ec\xC3\x28ho"), 0, "{}"), protocol::InvokeStatus::MethodError);
    EXPECT_TRUE(responseUntouched());
}

TEST_F(InvocationProtocolTest, UnreadableNameReturnsMethodError) {
    protocol::InvokeRequest req = protocol::InvokeRequest::fromGuestArgs(250, 20, 0, kParams, 0,
                                                                         kResponse);
    EXPECT_EQ(protocol::dispatch(registry, memory, req), protocol::InvokeStatus::MethodError);
}

TEST_F(InvocationProtocolTest, UnreadableParamsReturnFormatError) {
    memory.put(kName, "echo");
    auto req = protocol::InvokeRequest::fromGuestArgs(kName, 4, 0, 200, 100, kResponse);
    EXPECT_EQ(protocol::dispatch(registry, memory, req), protocol::InvokeStatus::FormatError);
    EXPECT_TRUE(responseUntouched());
}

TEST_F(InvocationProtocolTest, ResponseOutOfBoundsReturnsWriteError) {
    memory.put(kName, "echo");
    memory.put(kParams, "hi");
    auto req = protocol::InvokeRequest::fromGuestArgs(kName, 4, 0, kParams, 2, 252);
    EXPECT_EQ(protocol::dispatch(registry, memory, req), protocol::InvokeStatus::WriteError);
}

TEST_F(InvocationProtocolTest, HandlerErrorBecomesFailureFrame) {
    registry.registerMethod("json_only", [](ByteSpan, SerializationFormat f)
                                             -> Result<HandlerResponse> {
        if (f != SerializationFormat::Json)
            return Error{ErrorCode::HandlerError, "format not supported"};
        return HandlerResponse{true, {}};
    });

    EXPECT_EQ(call("json_only", 2, "x"), protocol::InvokeStatus::Ok);
    EXPECT_EQ(u32At(memory, kResponse), 0u);
    EXPECT_EQ(u32At(memory, kResponse + 4), std::string("format not supported").size());
    EXPECT_EQ(memory.str(kResponse + 8, 20), "format not supported");
}

TEST_F(InvocationProtocolTest, ThrowingHandlerBecomesFailureFrame) {
    registry.registerMethod("boom", [](ByteSpan, SerializationFormat) -> Result<HandlerResponse> {
        throw std::runtime_error("kaboom");
    });
    EXPECT_EQ(call("boom", 0, ""), protocol::InvokeStatus::Ok);
    EXPECT_EQ(u32At(memory, kResponse), 0u);
    auto frame = protocol::decodeResponse(ByteSpan(memory.bytes()).subspan(kResponse));
    ASSERT_TRUE(frame);
    EXPECT_NE(common::toString(frame.value().payload).find("kaboom"), std::string::npos);
}

TEST_F(InvocationProtocolTest, EmptyPayloadWritesOnlyHeader) {
    EXPECT_EQ(call("echo", 1, ""), protocol::InvokeStatus::Ok);
    EXPECT_EQ(u32At(memory, kResponse), 1u);
    EXPECT_EQ(u32At(memory, kResponse + 4), 0u);
    EXPECT_EQ(memory.bytes()[kResponse + 8], std::byte{0xAB});
}

TEST(InvocationProtocolCodecTest, EncodeMatchesWireLayout) {
    auto frame = protocol::encodeResponse(false, common::toBytes("abc"));
    ASSERT_EQ(frame.size(), protocol::kResponseHeaderSize + 3);
    EXPECT_EQ(common::getU32LE(frame.data()), 0u);
    EXPECT_EQ(common::getU32LE(frame.data() + 4), 3u);
    EXPECT_EQ(common::toString(ByteSpan(frame).subspan(8)), "abc");
}

TEST(InvocationProtocolCodecTest, DecodeRejectsMalformedFrames) {
    auto shortFrame = common::toBytes("abc");
    EXPECT_EQ(protocol::decodeResponse(shortFrame).error().code, ErrorCode::ProtocolError);

    auto badStatus = protocol::encodeResponse(true, {});
    common::putU32LE(badStatus.data(), 7);
    EXPECT_EQ(protocol::decodeResponse(badStatus).error().code, ErrorCode::ProtocolError);

    auto truncated = protocol::encodeResponse(true, common::toBytes("hello"));
    truncated.resize(truncated.size() - 2);
    EXPECT_EQ(protocol::decodeResponse(truncated).error().code, ErrorCode::ProtocolError);
}

TEST(InvocationProtocolCodecTest, GuestArgsAreReinterpretedUnsigned) {
    auto req = protocol::InvokeRequest::fromGuestArgs(-1, 3, 0, 0x7fffffff, 0, -16);
    EXPECT_EQ(req.methodNamePtr, 0xFFFFFFFFu);
    EXPECT_EQ(req.paramsPtr, 0x7FFFFFFFu);
    EXPECT_EQ(req.responsePtr, 0xFFFFFFF0u);
}
