#include "SyncClient.h"
#include "DeltaEngine.h"
#include "DeltaSerialization.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "PatchEngine.h"
#include "SignatureEngine.h"
#include <filesystem>
#include <sstream>

namespace BlockSync {

using bsync::Error;
using bsync::ErrorCode;

SyncClient::SyncClient(std::shared_ptr<ISession> session, uint32_t blockSize)
    : session_(std::move(session)), blockSize_(blockSize) {
}

bsync::Result<Response> SyncClient::roundTrip(Command command, const std::string& path,
                                              std::vector<uint8_t> payload) {
    const uint64_t frameSize = REQUEST_HEADER_SIZE + path.size() + payload.size();
    if (frameSize > bsync::config::MAX_FRAME_SIZE) {
        return Error{ErrorCode::FrameTooLarge,
                     std::string(commandName(command)) + " request of " + std::to_string(frameSize) +
                     " bytes exceeds the frame limit of " + std::to_string(bsync::config::MAX_FRAME_SIZE) + " bytes"};
    }

    Request request;
    request.command = command;
    request.requestId = nextRequestId_++;
    request.path = path;
    request.payload = std::move(payload);

    LOG_DEBUG_COMP_IF(std::string(commandName(command)) + " " + path + " (id " +
                      std::to_string(request.requestId) + ")", "SyncClient");

    if (!session_->sendFrame(encodeRequest(request))) {
        return Error{ErrorCode::SendFailed, std::string("Failed to send ") + commandName(command) + " request"};
    }

    auto frame = session_->recvFrame();
    if (!frame) {
        return Error{ErrorCode::ConnectionClosed, "Connection closed while waiting for response"};
    }

    auto response = decodeResponse(*frame);
    if (!response) {
        return response.error();
    }
    if (response->requestId != request.requestId) {
        return Error{ErrorCode::UnexpectedResponse,
                     "Response id " + std::to_string(response->requestId) + " does not match request id " +
                     std::to_string(request.requestId)};
    }
    if (response->isStatus()) {
        if (response->status != StatusCode::Ok) {
            return errorFromStatus(response->status, response->message);
        }
    } else if (response->type != static_cast<uint8_t>(command)) {
        return Error{ErrorCode::UnexpectedResponse,
                     "Response type " + std::to_string(response->type) + " to " + commandName(command) + " request"};
    }
    return response;
}

bsync::Result<SignatureSet> SyncClient::blockChecksums(const std::string& remotePath) {
    auto response = roundTrip(Command::BlockChecksum, remotePath, {});
    if (!response) {
        return response.error();
    }
    if (response->isStatus()) {
        return Error{ErrorCode::UnexpectedResponse, "Status response to BLOCKCHK request"};
    }
    return DeltaSerialization::deserializeSignature(response->payload);
}

bsync::Result<DeltaOps> SyncClient::delta(const std::string& remotePath, const SignatureSet& signatures) {
    auto response = roundTrip(Command::Delta, remotePath, DeltaSerialization::serializeSignature(signatures));
    if (!response) {
        return response.error();
    }
    if (response->isStatus()) {
        return Error{ErrorCode::UnexpectedResponse, "Status response to DELTA request"};
    }
    return DeltaSerialization::deserializeDelta(response->payload);
}

bsync::Result<void> SyncClient::patch(const std::string& remotePath, const DeltaOps& ops) {
    auto response = roundTrip(Command::Patch, remotePath, DeltaSerialization::serializeDelta(ops));
    if (!response) {
        return response.error();
    }
    if (!response->isStatus()) {
        return Error{ErrorCode::UnexpectedResponse, "Data response to PATCH request"};
    }
    return {};
}

bsync::Result<DeltaStats> SyncClient::push(const std::string& localPath, const std::string& remotePath) {
    auto& logger = Logger::instance();
    SCOPED_TIMER_COMP("push " + localPath, "SyncClient");

    auto signatures = blockChecksums(remotePath);
    if (!signatures) {
        logger.error("BLOCKCHK " + remotePath + " failed: " + signatures.error().message, "SyncClient");
        return signatures.error();
    }

    auto ops = DeltaEngine::calculateDelta(localPath, *signatures, blockSize_);
    if (!ops) {
        return ops.error();
    }

    if (auto r = patch(remotePath, *ops); !r) {
        logger.error("PATCH " + remotePath + " failed: " + r.error().message, "SyncClient");
        return r.error();
    }

    auto stats = summarize(*ops);
    logger.info("Pushed " + localPath + " to " + remotePath + ": " + std::to_string(stats.copiedBlocks) +
                " blocks reused, " + std::to_string(stats.literalBytes) + " literal bytes sent", "SyncClient");
    return stats;
}

bsync::Result<DeltaStats> SyncClient::pull(const std::string& remotePath, const std::string& localPath) {
    auto& logger = Logger::instance();
    SCOPED_TIMER_COMP("pull " + remotePath, "SyncClient");

    std::error_code ec;
    const bool haveLocal = std::filesystem::exists(localPath, ec);

    SignatureSet signatures;
    if (haveLocal) {
        auto local = SignatureEngine::calculateSignature(localPath, blockSize_);
        if (!local) {
            return local.error();
        }
        signatures = std::move(*local);
    } else {
        LOG_DEBUG_COMP_IF(localPath + " does not exist locally, requesting full copy", "SyncClient");
    }

    auto ops = delta(remotePath, signatures);
    if (!ops) {
        logger.error("DELTA " + remotePath + " failed: " + ops.error().message, "SyncClient");
        return ops.error();
    }

    bsync::Result<void> applied;
    if (haveLocal) {
        applied = PatchEngine::patchFile(localPath, *ops, blockSize_, localPath);
    } else {
        std::istringstream empty;
        applied = PatchEngine::patchStream(empty, *ops, blockSize_, localPath);
    }
    if (!applied) {
        return applied.error();
    }

    auto stats = summarize(*ops);
    logger.info("Pulled " + remotePath + " into " + localPath + ": " + std::to_string(stats.copiedBlocks) +
                " blocks reused, " + std::to_string(stats.literalBytes) + " literal bytes received", "SyncClient");
    return stats;
}

} // namespace BlockSync
