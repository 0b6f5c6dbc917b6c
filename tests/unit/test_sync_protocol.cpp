#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "SyncProtocol.h"

using namespace BlockSync;
using bsync::Error;
using bsync::ErrorCode;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}

TEST(SyncProtocolTest, RequestLayoutIsBigEndian) {
    Request request{Command::Delta, 0x01020304u, "a.txt", bytes("[]")};
    std::vector<uint8_t> expected = {
        0xD1,
        0x01, 0x02, 0x03, 0x04,
        0x00, 0x00, 0x00, 0x05, 'a', '.', 't', 'x', 't',
        0x00, 0x00, 0x00, 0x02, '[', ']',
    };
    EXPECT_EQ(encodeRequest(request), expected);
}

TEST(SyncProtocolTest, RequestRoundTrip) {
    Request request{Command::Patch, 42, "dir/file.bin", bytes("[{\"c\":0}]")};
    auto decoded = decodeRequest(encodeRequest(request));
    ASSERT_TRUE(decoded.ok()) << decoded.error().message;
    EXPECT_EQ(decoded->command, Command::Patch);
    EXPECT_EQ(decoded->requestId, 42u);
    EXPECT_EQ(decoded->path, "dir/file.bin");
    EXPECT_EQ(decoded->payload, request.payload);
}

TEST(SyncProtocolTest, EmptyPayloadAllowed) {
    Request request{Command::BlockChecksum, 7, "x", {}};
    auto decoded = decodeRequest(encodeRequest(request));
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded->payload.empty());
}

TEST(SyncProtocolTest, TruncatedRequestRejected) {
    auto frame = encodeRequest(Request{Command::Delta, 1, "file", bytes("payload")});
    for (size_t len = 0; len < frame.size(); ++len) {
        std::vector<uint8_t> truncated(frame.begin(), frame.begin() + len);
        auto decoded = decodeRequest(truncated);
        ASSERT_TRUE(decoded.isError()) << "accepted length " << len;
        EXPECT_EQ(decoded.error().code, ErrorCode::MalformedFrame);
    }
}

TEST(SyncProtocolTest, TrailingBytesRejected) {
    auto frame = encodeRequest(Request{Command::Delta, 1, "file", bytes("payload")});
    frame.push_back(0);
    auto decoded = decodeRequest(frame);
    ASSERT_TRUE(decoded.isError());
    EXPECT_EQ(decoded.error().kind(), bsync::ErrorKind::ProtocolError);
}

TEST(SyncProtocolTest, UnknownCommandByteRejected) {
    auto frame = encodeRequest(Request{Command::Delta, 1, "file", {}});
    frame[0] = 3;
    EXPECT_FALSE(commandFromByte(3).has_value());
    EXPECT_TRUE(decodeRequest(frame).isError());
    EXPECT_EQ(peekRequestId(frame), 1u);
}

TEST(SyncProtocolTest, OversizedLengthFieldRejected) {
    std::vector<uint8_t> frame = {0xD0, 0, 0, 0, 1, 0xFF, 0xFF, 0xFF, 0xFF, 'a'};
    auto decoded = decodeRequest(frame);
    ASSERT_TRUE(decoded.isError());
    EXPECT_EQ(decoded.error().code, ErrorCode::MalformedFrame);
}

TEST(SyncProtocolTest, PeekRequestIdOnShortFrame) {
    EXPECT_EQ(peekRequestId({}), 0u);
    EXPECT_EQ(peekRequestId({0xD0, 0, 0}), 0u);
}

TEST(SyncProtocolTest, DataResponseRoundTrip) {
    auto decoded = decodeResponse(encodeDataResponse(Command::BlockChecksum, 9, bytes("[]")));
    ASSERT_TRUE(decoded.ok());
    EXPECT_FALSE(decoded->isStatus());
    EXPECT_EQ(decoded->type, static_cast<uint8_t>(Command::BlockChecksum));
    EXPECT_EQ(decoded->requestId, 9u);
    EXPECT_EQ(decoded->payload, bytes("[]"));
}

TEST(SyncProtocolTest, StatusResponseLayout) {
    auto frame = encodeStatusResponse(5, StatusCode::InvalidDelta, "bad");
    std::vector<uint8_t> expected = {
        101,
        0, 0, 0, 5,
        0, 0, 0, 64,
        0, 0, 0, 3, 'b', 'a', 'd',
        0, 0, 0, 0,
    };
    EXPECT_EQ(frame, expected);

    auto decoded = decodeResponse(frame);
    ASSERT_TRUE(decoded.ok());
    EXPECT_TRUE(decoded->isStatus());
    EXPECT_EQ(decoded->status, StatusCode::InvalidDelta);
    EXPECT_EQ(decoded->message, "bad");
}

TEST(SyncProtocolTest, UnknownResponseTypeRejected) {
    std::vector<uint8_t> frame = {102, 0, 0, 0, 1, 0, 0, 0, 0};
    auto decoded = decodeResponse(frame);
    ASSERT_TRUE(decoded.isError());
    EXPECT_EQ(decoded.error().code, ErrorCode::UnexpectedResponse);
}

TEST(SyncProtocolTest, StatusCodeForErrorKinds) {
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::FileNotFound}), StatusCode::NoSuchFile);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::DirectoryNotFound}), StatusCode::NoSuchFile);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::FileAccessDenied}), StatusCode::PermissionDenied);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::FileWriteError}), StatusCode::Failure);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::MalformedPayload}), StatusCode::BadMessage);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::PathOutsideRoot}), StatusCode::BadMessage);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::InvalidPath}), StatusCode::BadMessage);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::FrameTooLarge}), StatusCode::Failure);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::BlockIndexOutOfRange}), StatusCode::InvalidDelta);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::InvalidArgument}), StatusCode::BadMessage);
    EXPECT_EQ(statusCodeFor(Error{ErrorCode::InternalError}), StatusCode::Failure);
}

TEST(SyncProtocolTest, StatusMessageNamesKind) {
    EXPECT_EQ(statusMessageFor(Error{ErrorCode::BlockIndexOutOfRange, "index 7"}), "AlgorithmError: index 7");
    EXPECT_EQ(statusMessageFor(Error{ErrorCode::FileNotFound, "x"}), "IOError: x");
    EXPECT_EQ(statusMessageFor(Error{ErrorCode::InvalidPath, "Empty path"}), "ProtocolError: Empty path");
}

TEST(SyncProtocolTest, ErrorFromStatus) {
    EXPECT_EQ(errorFromStatus(StatusCode::NoSuchFile, "m").code, ErrorCode::FileNotFound);
    EXPECT_EQ(errorFromStatus(StatusCode::PermissionDenied, "m").code, ErrorCode::FileAccessDenied);
    EXPECT_EQ(errorFromStatus(StatusCode::BadMessage, "m").code, ErrorCode::ProtocolError);
    EXPECT_EQ(errorFromStatus(StatusCode::InvalidDelta, "m").code, ErrorCode::DeltaApplyFailed);

    auto unsupported = errorFromStatus(StatusCode::OpUnsupported, "nope");
    EXPECT_EQ(unsupported.code, ErrorCode::RemoteFailure);
    EXPECT_NE(unsupported.message.find("OP_UNSUPPORTED"), std::string::npos);
}

TEST(SyncProtocolTest, Names) {
    EXPECT_STREQ(commandName(Command::BlockChecksum), "BLOCKCHK");
    EXPECT_STREQ(commandName(Command::Delta), "DELTA");
    EXPECT_STREQ(commandName(Command::Patch), "PATCH");
    EXPECT_STREQ(statusCodeName(StatusCode::BadMessage), "BAD_MESSAGE");
}
