/**
 * @file test_protocol_handler.cpp
 * @brief Request dispatch over in-memory sessions
 *
 * Covers:
 * - BLOCKCHK, DELTA and PATCH against a served root
 * - Status responses for malformed and rejected requests
 * - A failing request leaving the connection usable
 * - SyncClient flows without a network in between
 */

#include <gtest/gtest.h>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>

#include "ConnectionHandler.h"
#include "DeltaSerialization.h"
#include "DeltaSyncProtocolHandler.h"
#include "MetricsCollector.h"
#include "PatchEngine.h"
#include "SignatureEngine.h"
#include "SyncClient.h"
#include "SyncProtocol.h"

namespace fs = std::filesystem;
using namespace BlockSync;

namespace {

// Replays queued request frames and records what the handler sends back.
class ScriptedSession : public ISession {
public:
    void push(std::vector<uint8_t> frame) { incoming_.push_back(std::move(frame)); }

    bool sendFrame(const std::vector<uint8_t>& frame) override {
        sent.push_back(frame);
        return true;
    }

    std::optional<std::vector<uint8_t>> recvFrame() override {
        if (closed_ || incoming_.empty()) {
            return std::nullopt;
        }
        auto frame = std::move(incoming_.front());
        incoming_.pop_front();
        return frame;
    }

    void close() override { closed_ = true; }
    std::string peerName() const override { return "scripted"; }

    std::vector<std::vector<uint8_t>> sent;

private:
    std::deque<std::vector<uint8_t>> incoming_;
    bool closed_ = false;
};

// Hands every request straight to a dispatcher and queues its answer.
class LoopbackSession : public ISession {
public:
    explicit LoopbackSession(DeltaSyncProtocolHandler& dispatcher) : dispatcher_(dispatcher) {}

    bool sendFrame(const std::vector<uint8_t>& frame) override {
        auto response = dispatcher_.handleFrame(frame);
        if (response) {
            responses_.push_back(std::move(*response));
        }
        return true;
    }

    std::optional<std::vector<uint8_t>> recvFrame() override {
        if (responses_.empty()) {
            return std::nullopt;
        }
        auto frame = std::move(responses_.front());
        responses_.pop_front();
        return frame;
    }

    void close() override {}
    std::string peerName() const override { return "loopback"; }

private:
    DeltaSyncProtocolHandler& dispatcher_;
    std::deque<std::vector<uint8_t>> responses_;
};

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

}

class ProtocolHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / ("blocksync_handler_" + std::to_string(::getpid()));
        rootDir_ = testDir_ / "root";
        localDir_ = testDir_ / "local";
        fs::create_directories(rootDir_);
        fs::create_directories(localDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    void createFile(const fs::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    std::string readFile(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    Response responseAt(ScriptedSession& session, size_t index) {
        EXPECT_GT(session.sent.size(), index);
        if (session.sent.size() <= index) {
            return Response{};
        }
        auto decoded = decodeResponse(session.sent[index]);
        EXPECT_TRUE(decoded.ok());
        return decoded.ok() ? *decoded : Response{};
    }

    std::shared_ptr<ScriptedSession> serve(const std::vector<std::vector<uint8_t>>& frames, uint32_t blockSize = 16) {
        auto session = std::make_shared<ScriptedSession>();
        for (const auto& frame : frames) {
            session->push(frame);
        }
        ConnectionHandler handler(session, DeltaSyncProtocolHandler(rootDir_, blockSize));
        handler.run();
        EXPECT_EQ(handler.framesHandled(), frames.size());
        return session;
    }

    fs::path testDir_;
    fs::path rootDir_;
    fs::path localDir_;
};

TEST_F(ProtocolHandlerTest, BlockChecksumReturnsSignature) {
    std::string content = "0123456789abcdef0123456789abcdef++";
    createFile(rootDir_ / "f.txt", content);

    auto session = serve({encodeRequest(Request{Command::BlockChecksum, 1, "f.txt", {}})});
    auto response = responseAt(*session, 0);
    ASSERT_FALSE(response.isStatus());
    EXPECT_EQ(response.requestId, 1u);

    auto sigs = DeltaSerialization::deserializeSignature(response.payload);
    ASSERT_TRUE(sigs.ok());
    ASSERT_EQ(sigs->size(), 3u);
    EXPECT_EQ((*sigs)[0].weak, (*sigs)[1].weak);
    EXPECT_EQ((*sigs)[0].strong, (*sigs)[1].strong);
}

TEST_F(ProtocolHandlerTest, DeltaReconstructsServerFile) {
    std::string serverContent = "AAAAAAAAAAAAAAAABBBBBBBBBBBBBBBBnew tail";
    std::string clientContent = "AAAAAAAAAAAAAAAAxxxxxxxxxxxxxxxx";
    createFile(rootDir_ / "f.txt", serverContent);

    std::istringstream client(clientContent);
    auto sigs = SignatureEngine::calculateSignature(client, 16);
    ASSERT_TRUE(sigs.ok());

    auto session = serve({encodeRequest(Request{Command::Delta, 5, "f.txt",
                                                DeltaSerialization::serializeSignature(*sigs)})});
    auto response = responseAt(*session, 0);
    ASSERT_FALSE(response.isStatus());
    auto ops = DeltaSerialization::deserializeDelta(response.payload);
    ASSERT_TRUE(ops.ok());

    std::istringstream base(clientContent);
    std::ostringstream out;
    ASSERT_TRUE(PatchEngine::applyDelta(base, *ops, 16, out).ok());
    EXPECT_EQ(out.str(), serverContent);
}

TEST_F(ProtocolHandlerTest, PatchUpdatesFileInPlace) {
    createFile(rootDir_ / "f.txt", "AAAAAAAAAAAAAAAABBBBBBBBBBBBBBBB");
    DeltaOps ops{CopyOp{1}, LiteralOp{bytes("-")}, CopyOp{0}};

    auto session = serve({encodeRequest(Request{Command::Patch, 9, "/f.txt", DeltaSerialization::serializeDelta(ops)})});
    auto response = responseAt(*session, 0);
    ASSERT_TRUE(response.isStatus());
    EXPECT_EQ(response.status, StatusCode::Ok);
    EXPECT_EQ(response.requestId, 9u);
    EXPECT_EQ(readFile(rootDir_ / "f.txt"), "BBBBBBBBBBBBBBBB-AAAAAAAAAAAAAAAA");
}

TEST_F(ProtocolHandlerTest, MalformedDeltaDoesNotBreakConnection) {
    createFile(rootDir_ / "f.txt", "content");

    auto session = serve({
        encodeRequest(Request{Command::Delta, 1, "f.txt", bytes("{not json")}),
        encodeRequest(Request{Command::BlockChecksum, 2, "f.txt", {}}),
    });
    ASSERT_EQ(session->sent.size(), 2u);

    auto first = responseAt(*session, 0);
    ASSERT_TRUE(first.isStatus());
    EXPECT_EQ(first.requestId, 1u);
    EXPECT_EQ(first.status, StatusCode::BadMessage);
    EXPECT_EQ(first.message.rfind("ProtocolError: ", 0), 0u);

    auto second = responseAt(*session, 1);
    EXPECT_FALSE(second.isStatus());
    EXPECT_EQ(second.requestId, 2u);
}

TEST_F(ProtocolHandlerTest, RejectedRequestsAnswerWithStatus) {
    createFile(testDir_ / "outside.txt", "secret");
    createFile(rootDir_ / "f.txt", "0123456789");

    auto session = serve({
        encodeRequest(Request{Command::BlockChecksum, 1, "../outside.txt", {}}),
        encodeRequest(Request{Command::BlockChecksum, 2, "missing.txt", {}}),
        encodeRequest(Request{Command::Patch, 3, "f.txt", DeltaSerialization::serializeDelta(DeltaOps{CopyOp{4}})}),
        encodeRequest(Request{Command::Patch, 4, "missing.txt", DeltaSerialization::serializeDelta(DeltaOps{})}),
        encodeRequest(Request{Command::BlockChecksum, 5, "", {}}),
    });
    ASSERT_EQ(session->sent.size(), 5u);

    EXPECT_EQ(responseAt(*session, 0).status, StatusCode::BadMessage);
    EXPECT_EQ(responseAt(*session, 1).status, StatusCode::NoSuchFile);
    EXPECT_EQ(responseAt(*session, 2).status, StatusCode::InvalidDelta);
    EXPECT_EQ(responseAt(*session, 3).status, StatusCode::NoSuchFile);
    auto emptyPath = responseAt(*session, 4);
    EXPECT_EQ(emptyPath.status, StatusCode::BadMessage);
    EXPECT_EQ(emptyPath.message, "ProtocolError: Empty path");

    EXPECT_EQ(readFile(rootDir_ / "f.txt"), "0123456789");
    EXPECT_FALSE(fs::exists(rootDir_ / "missing.txt"));
}

TEST_F(ProtocolHandlerTest, TruncatedAndEmptyFrames) {
    auto truncated = encodeRequest(Request{Command::Delta, 77, "f.txt", bytes("[]")});
    truncated.pop_back();

    auto session = serve({truncated, {}});
    ASSERT_EQ(session->sent.size(), 2u);

    auto first = responseAt(*session, 0);
    EXPECT_EQ(first.requestId, 77u);
    EXPECT_EQ(first.status, StatusCode::BadMessage);

    auto second = responseAt(*session, 1);
    EXPECT_EQ(second.requestId, 0u);
    EXPECT_EQ(second.status, StatusCode::BadMessage);
}

TEST_F(ProtocolHandlerTest, OversizedResponseBecomesFailureStatus) {
    createFile(rootDir_ / "big.bin", std::string(4096, 'x'));
    createFile(rootDir_ / "small.txt", "abc");
    DeltaSyncProtocolHandler dispatcher(rootDir_, 16, nullptr, 512);

    auto frame = dispatcher.handleFrame(encodeRequest(Request{Command::Delta, 21, "big.bin", bytes("[]")}));
    ASSERT_TRUE(frame.has_value());
    EXPECT_LE(frame->size(), 512u);

    auto response = decodeResponse(*frame);
    ASSERT_TRUE(response.ok());
    ASSERT_TRUE(response->isStatus());
    EXPECT_EQ(response->requestId, 21u);
    EXPECT_EQ(response->status, StatusCode::Failure);
    EXPECT_NE(response->message.find("frame limit of 512 bytes"), std::string::npos);

    auto next = dispatcher.handleFrame(encodeRequest(Request{Command::BlockChecksum, 22, "small.txt", {}}));
    ASSERT_TRUE(next.has_value());
    auto nextResponse = decodeResponse(*next);
    ASSERT_TRUE(nextResponse.ok());
    EXPECT_FALSE(nextResponse->isStatus());
    EXPECT_EQ(nextResponse->requestId, 22u);
}

TEST_F(ProtocolHandlerTest, UnknownCommandGoesToFileTransfer) {
    WireWriter writer;
    writer.putU8(3);  // SSH_FXP_OPEN
    writer.putU32(12);
    writer.putString("f.txt");

    auto session = serve({writer.take()});
    auto response = responseAt(*session, 0);
    ASSERT_TRUE(response.isStatus());
    EXPECT_EQ(response.requestId, 12u);
    EXPECT_EQ(response.status, StatusCode::OpUnsupported);
}

TEST_F(ProtocolHandlerTest, ForwardedRequestsReachCustomFileTransfer) {
    class Recorder : public IFileTransferAPI {
    public:
        std::optional<std::vector<uint8_t>> handleRequest(const std::vector<uint8_t>& frame) override {
            frames.push_back(frame);
            return std::nullopt;
        }
        std::vector<std::vector<uint8_t>> frames;
    };

    auto recorder = std::make_shared<Recorder>();
    DeltaSyncProtocolHandler dispatcher(rootDir_, 16, recorder);

    std::vector<uint8_t> frame = {4, 0, 0, 0, 1};
    EXPECT_FALSE(dispatcher.handleFrame(frame).has_value());
    ASSERT_EQ(recorder->frames.size(), 1u);
    EXPECT_EQ(recorder->frames[0], frame);
}

TEST_F(ProtocolHandlerTest, RequestsAreCounted) {
    createFile(rootDir_ / "f.txt", "0123456789");
    auto& metrics = MetricsCollector::instance();
    metrics.reset();

    serve({
        encodeRequest(Request{Command::BlockChecksum, 1, "f.txt", {}}),
        encodeRequest(Request{Command::Delta, 2, "f.txt", bytes("[]")}),
        encodeRequest(Request{Command::Patch, 3, "f.txt", bytes("bad")}),
        std::vector<uint8_t>{3, 0, 0, 0, 4},
    });

    auto protocol = metrics.getProtocolMetrics();
    EXPECT_EQ(protocol.blockChecksumRequests, 1u);
    EXPECT_EQ(protocol.deltaRequests, 1u);
    EXPECT_EQ(protocol.patchRequests, 1u);
    EXPECT_EQ(protocol.fallbackRequests, 1u);
    EXPECT_EQ(protocol.requestsFailed, 1u);

    auto network = metrics.getNetworkMetrics();
    EXPECT_EQ(network.connectionsClosed, 1u);
    EXPECT_GT(network.bytesReceived, 0u);
    EXPECT_GT(network.bytesSent, 0u);

    auto delta = metrics.getDeltaMetrics();
    EXPECT_EQ(delta.deltasComputed, 1u);
    EXPECT_EQ(delta.literalBytes, 10u);
}

TEST_F(ProtocolHandlerTest, ClientPushAndPull) {
    std::string original(100, 'a');
    std::string edited = original.substr(0, 40) + "EDIT" + original.substr(40);
    createFile(rootDir_ / "doc.txt", original);
    createFile(localDir_ / "doc.txt", edited);

    DeltaSyncProtocolHandler dispatcher(rootDir_, 16);
    SyncClient client(std::make_shared<LoopbackSession>(dispatcher), 16);

    auto pushed = client.push((localDir_ / "doc.txt").string(), "doc.txt");
    ASSERT_TRUE(pushed.ok()) << pushed.error().message;
    EXPECT_GT(pushed->copiedBlocks, 0u);
    EXPECT_EQ(readFile(rootDir_ / "doc.txt"), edited);

    createFile(rootDir_ / "other.txt", "server side content");
    auto pulled = client.pull("other.txt", (localDir_ / "fresh.txt").string());
    ASSERT_TRUE(pulled.ok()) << pulled.error().message;
    EXPECT_EQ(readFile(localDir_ / "fresh.txt"), "server side content");
}

TEST_F(ProtocolHandlerTest, ClientSurfacesRemoteErrors) {
    DeltaSyncProtocolHandler dispatcher(rootDir_, 16);
    SyncClient client(std::make_shared<LoopbackSession>(dispatcher), 16);

    auto missing = client.blockChecksums("missing.txt");
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.error().code, bsync::ErrorCode::FileNotFound);

    auto escape = client.blockChecksums("../etc/passwd");
    ASSERT_TRUE(escape.isError());
    EXPECT_EQ(escape.error().code, bsync::ErrorCode::ProtocolError);

    createFile(localDir_ / "new.txt", "content");
    auto pushed = client.push((localDir_ / "new.txt").string(), "new.txt");
    ASSERT_TRUE(pushed.isError());
    EXPECT_EQ(pushed.error().code, bsync::ErrorCode::FileNotFound);
}
