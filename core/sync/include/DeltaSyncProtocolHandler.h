#pragma once

#include "Constants.h"
#include "IFileTransferAPI.h"
#include "Result.h"
#include "SyncProtocol.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace BlockSync {

/**
 * @brief Dispatches block-sync requests arriving on one connection
 *
 * Implements the three extension commands against files below a root
 * directory:
 * 1. BLOCKCHK: answer with the signature of a file
 * 2. DELTA: answer with the ops turning a peer's version into ours
 * 3. PATCH: apply a peer's ops to our file in place
 *
 * Any other command byte is forwarded unchanged to the file transfer
 * subsystem. A failing request is answered with a status frame and never
 * affects later requests on the same connection.
 */
class DeltaSyncProtocolHandler {
public:
    DeltaSyncProtocolHandler(std::filesystem::path rootDirectory, uint32_t blockSize,
                             std::shared_ptr<IFileTransferAPI> fallback = nullptr,
                             uint32_t maxFrameSize = bsync::config::MAX_FRAME_SIZE);

    /**
     * @brief Handle one request frame
     * @return Response frame, or nullopt if the fallback produced none
     *
     * A response larger than maxFrameSize is replaced by a FAILURE status
     * naming the limit.
     */
    std::optional<std::vector<uint8_t>> handleFrame(const std::vector<uint8_t>& frame);

    const std::filesystem::path& rootDirectory() const { return rootDirectory_; }
    uint32_t blockSize() const { return blockSize_; }

private:
    std::optional<std::vector<uint8_t>> dispatch(const std::vector<uint8_t>& frame);
    bsync::Result<std::vector<uint8_t>> handleBlockChecksum(const Request& request);
    bsync::Result<std::vector<uint8_t>> handleDelta(const Request& request);
    bsync::Result<void> handlePatch(const Request& request);

    std::vector<uint8_t> failureResponse(uint32_t requestId, const bsync::Error& error, const char* what);

    std::filesystem::path rootDirectory_;
    uint32_t blockSize_;
    std::shared_ptr<IFileTransferAPI> fallback_;
    uint32_t maxFrameSize_;
};

} // namespace BlockSync
