#include "DeltaSyncProtocolHandler.h"
#include "DeltaEngine.h"
#include "DeltaSerialization.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"
#include "PatchEngine.h"
#include "PathValidator.h"
#include "SignatureEngine.h"
#include "UnsupportedFileTransfer.h"

namespace BlockSync {

using bsync::Error;
using bsync::ErrorCode;

DeltaSyncProtocolHandler::DeltaSyncProtocolHandler(std::filesystem::path rootDirectory, uint32_t blockSize,
                                                   std::shared_ptr<IFileTransferAPI> fallback,
                                                   uint32_t maxFrameSize)
    : rootDirectory_(std::move(rootDirectory)), blockSize_(blockSize), fallback_(std::move(fallback)),
      maxFrameSize_(maxFrameSize) {
    if (!fallback_) {
        fallback_ = std::make_shared<UnsupportedFileTransfer>();
    }
    LOG_DEBUG_COMP_IF("DeltaSyncProtocolHandler initialized for: " + rootDirectory_.string(), "DeltaSyncProtocol");
}

std::optional<std::vector<uint8_t>> DeltaSyncProtocolHandler::handleFrame(const std::vector<uint8_t>& frame) {
    auto response = dispatch(frame);
    if (response && response->size() > maxFrameSize_) {
        MetricsCollector::instance().incrementRequestsFailed();
        const char* name = frame.empty() || !commandFromByte(frame[0])
            ? "forwarded request" : commandName(*commandFromByte(frame[0]));
        return failureResponse(peekRequestId(frame),
                               Error{ErrorCode::FrameTooLarge,
                                     "Response of " + std::to_string(response->size()) +
                                     " bytes exceeds the frame limit of " + std::to_string(maxFrameSize_) + " bytes"},
                               name);
    }
    return response;
}

std::optional<std::vector<uint8_t>> DeltaSyncProtocolHandler::dispatch(const std::vector<uint8_t>& frame) {
    auto& metrics = MetricsCollector::instance();

    if (frame.empty()) {
        metrics.incrementRequestsFailed();
        return failureResponse(0, Error{ErrorCode::MalformedFrame, "Empty frame"}, "request");
    }

    if (!commandFromByte(frame[0])) {
        metrics.incrementFallbackRequests();
        LOG_DEBUG_COMP_IF("Forwarding request type " + std::to_string(frame[0]) + " to file transfer",
                          "DeltaSyncProtocol");
        try {
            return fallback_->handleRequest(frame);
        } catch (const std::exception& e) {
            metrics.incrementRequestsFailed();
            return failureResponse(peekRequestId(frame),
                                   Error{ErrorCode::InternalError, std::string("File transfer failed: ") + e.what()},
                                   "forwarded request");
        }
    }

    auto request = decodeRequest(frame);
    if (!request) {
        metrics.incrementRequestsFailed();
        return failureResponse(peekRequestId(frame), request.error(), commandName(*commandFromByte(frame[0])));
    }

    const char* name = commandName(request->command);
    LOG_DEBUG_COMP_IF(std::string(name) + " " + request->path + " (id " + std::to_string(request->requestId) + ")",
                      "DeltaSyncProtocol");

    try {
        switch (request->command) {
            case Command::BlockChecksum: {
                metrics.incrementBlockChecksumRequests();
                auto payload = handleBlockChecksum(*request);
                if (!payload) {
                    metrics.incrementRequestsFailed();
                    return failureResponse(request->requestId, payload.error(), name);
                }
                return encodeDataResponse(request->command, request->requestId, *payload);
            }
            case Command::Delta: {
                metrics.incrementDeltaRequests();
                auto payload = handleDelta(*request);
                if (!payload) {
                    metrics.incrementRequestsFailed();
                    return failureResponse(request->requestId, payload.error(), name);
                }
                return encodeDataResponse(request->command, request->requestId, *payload);
            }
            case Command::Patch: {
                metrics.incrementPatchRequests();
                auto result = handlePatch(*request);
                if (!result) {
                    metrics.incrementRequestsFailed();
                    return failureResponse(request->requestId, result.error(), name);
                }
                return encodeStatusResponse(request->requestId, StatusCode::Ok, "Patched " + request->path);
            }
        }
    } catch (const std::exception& e) {
        metrics.incrementRequestsFailed();
        return failureResponse(request->requestId,
                               Error{ErrorCode::InternalError, std::string("Unexpected failure: ") + e.what()}, name);
    }

    metrics.incrementRequestsFailed();
    return failureResponse(request->requestId, Error{ErrorCode::InternalError, "Unhandled command"}, name);
}

bsync::Result<std::vector<uint8_t>> DeltaSyncProtocolHandler::handleBlockChecksum(const Request& request) {
    auto path = PathValidator::resolve(rootDirectory_, request.path);
    if (!path) {
        return path.error();
    }

    auto signature = SignatureEngine::calculateSignature(path->string(), blockSize_);
    if (!signature) {
        return signature.error();
    }

    return DeltaSerialization::serializeSignature(*signature);
}

bsync::Result<std::vector<uint8_t>> DeltaSyncProtocolHandler::handleDelta(const Request& request) {
    auto path = PathValidator::resolve(rootDirectory_, request.path);
    if (!path) {
        return path.error();
    }

    auto signature = DeltaSerialization::deserializeSignature(request.payload);
    if (!signature) {
        return signature.error();
    }

    auto ops = DeltaEngine::calculateDelta(path->string(), *signature, blockSize_);
    if (!ops) {
        return ops.error();
    }

    return DeltaSerialization::serializeDelta(*ops);
}

bsync::Result<void> DeltaSyncProtocolHandler::handlePatch(const Request& request) {
    auto path = PathValidator::resolve(rootDirectory_, request.path);
    if (!path) {
        return path.error();
    }

    auto ops = DeltaSerialization::deserializeDelta(request.payload);
    if (!ops) {
        return ops.error();
    }

    auto stats = summarize(*ops);
    auto result = PatchEngine::patchFile(path->string(), *ops, blockSize_, path->string());
    if (result) {
        Logger::instance().info("Patched " + request.path + " (" + std::to_string(stats.copiedBlocks) +
                                " blocks reused, " + std::to_string(stats.literalBytes) + " literal bytes)",
                                "DeltaSyncProtocol");
    }
    return result;
}

std::vector<uint8_t> DeltaSyncProtocolHandler::failureResponse(uint32_t requestId, const Error& error,
                                                               const char* what) {
    StatusCode code = statusCodeFor(error);
    Logger::instance().warn(std::string(what) + " (id " + std::to_string(requestId) + ") failed with " +
                            statusCodeName(code) + ": " + error.message, "DeltaSyncProtocol");
    return encodeStatusResponse(requestId, code, statusMessageFor(error));
}

} // namespace BlockSync
