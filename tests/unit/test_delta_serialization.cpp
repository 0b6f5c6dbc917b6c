#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "DeltaSerialization.h"

using namespace BlockSync;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::string text(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

}

TEST(DeltaSerializationTest, SignatureWireShape) {
    SignatureSet sigs{{0, 0x11E60398u, "abc123"}};
    EXPECT_EQ(text(DeltaSerialization::serializeSignature(sigs)),
              "[{\"index\":0,\"strong\":\"abc123\",\"weak\":300286872}]");
}

TEST(DeltaSerializationTest, SignatureRoundTrip) {
    SignatureSet sigs{{0, 1u, "aa"}, {1, 0xFFFFFFFFu, "bb"}};
    auto decoded = DeltaSerialization::deserializeSignature(DeltaSerialization::serializeSignature(sigs));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(*decoded, sigs);
}

TEST(DeltaSerializationTest, EmptySignatureIsEmptyArray) {
    EXPECT_EQ(text(DeltaSerialization::serializeSignature(SignatureSet{})), "[]");
    auto decoded = DeltaSerialization::deserializeSignature(bytes("[]"));
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded->empty());
}

TEST(DeltaSerializationTest, DeltaWireShape) {
    DeltaOps ops{CopyOp{3}, LiteralOp{bytes("hello")}};
    EXPECT_EQ(text(DeltaSerialization::serializeDelta(ops)), "[{\"c\":3},{\"l\":\"aGVsbG8=\"}]");
}

TEST(DeltaSerializationTest, DeltaDecodesBinaryLiterals) {
    std::vector<uint8_t> binary;
    for (int i = 0; i < 256; ++i) {
        binary.push_back(static_cast<uint8_t>(i));
    }
    DeltaOps ops{LiteralOp{binary}, CopyOp{0}, LiteralOp{{}}};

    auto decoded = DeltaSerialization::deserializeDelta(DeltaSerialization::serializeDelta(ops));
    ASSERT_TRUE(decoded.ok()) << decoded.error().message;
    EXPECT_EQ(*decoded, ops);
}

TEST(DeltaSerializationTest, MalformedSignaturePayloads) {
    const char* cases[] = {
        "",
        "not json",
        "{\"index\":0}",
        "[1,2,3]",
        "[{\"index\":0,\"weak\":1}]",
        "[{\"index\":-1,\"weak\":1,\"strong\":\"aa\"}]",
        "[{\"index\":0,\"weak\":\"1\",\"strong\":\"aa\"}]",
        "[{\"index\":0,\"weak\":1,\"strong\":5}]",
        "[] trailing",
    };
    for (const char* payload : cases) {
        auto decoded = DeltaSerialization::deserializeSignature(bytes(payload));
        ASSERT_TRUE(decoded.isError()) << "accepted: " << payload;
        EXPECT_EQ(decoded.error().code, bsync::ErrorCode::MalformedPayload);
        EXPECT_EQ(decoded.error().kind(), bsync::ErrorKind::ProtocolError);
    }
}

TEST(DeltaSerializationTest, MalformedDeltaPayloads) {
    const char* cases[] = {
        "{}",
        "[{}]",
        "[{\"c\":1,\"l\":\"aGk=\"}]",
        "[{\"c\":\"1\"}]",
        "[{\"c\":1.5}]",
        "[{\"l\":42}]",
        "[{\"l\":\"not base64!\"}]",
        "[{\"l\":\"aGk\"}]",
        "[{\"l\":\"a=Gk\"}]",
        "[\"c\"]",
    };
    for (const char* payload : cases) {
        auto decoded = DeltaSerialization::deserializeDelta(bytes(payload));
        ASSERT_TRUE(decoded.isError()) << "accepted: " << payload;
        EXPECT_EQ(decoded.error().code, bsync::ErrorCode::MalformedPayload);
    }
}

TEST(DeltaSerializationTest, Base64KnownValues) {
    EXPECT_EQ(DeltaSerialization::base64Encode(bytes("")), "");
    EXPECT_EQ(DeltaSerialization::base64Encode(bytes("f")), "Zg==");
    EXPECT_EQ(DeltaSerialization::base64Encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(DeltaSerialization::base64Encode(bytes("foo")), "Zm9v");

    auto decoded = DeltaSerialization::base64Decode("Zm9vYg==");
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(text(*decoded), "foob");
}
