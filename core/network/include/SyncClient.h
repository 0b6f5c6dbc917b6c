#pragma once

#include "Constants.h"
#include "DeltaTypes.h"
#include "ISession.h"
#include "Result.h"
#include "SyncProtocol.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace BlockSync {

/**
 * @brief Client side of the block-sync protocol
 *
 * Issues one request at a time over a session and waits for its answer.
 * Status responses other than OK come back as errors; a response whose id
 * does not match the request is UnexpectedResponse.
 */
class SyncClient {
public:
    explicit SyncClient(std::shared_ptr<ISession> session,
                        uint32_t blockSize = bsync::config::DELTA_BLOCK_SIZE);

    bsync::Result<SignatureSet> blockChecksums(const std::string& remotePath);
    bsync::Result<DeltaOps> delta(const std::string& remotePath, const SignatureSet& signatures);
    bsync::Result<void> patch(const std::string& remotePath, const DeltaOps& ops);

    /**
     * @brief Bring the remote file up to date with a local one
     *
     * BLOCKCHK the remote, compute the delta of the local file against it
     * and PATCH the remote with the result. The remote file must exist.
     */
    bsync::Result<DeltaStats> push(const std::string& localPath, const std::string& remotePath);

    /**
     * @brief Bring a local file up to date with the remote one
     *
     * Send the local signature with DELTA and apply the answer locally. A
     * missing local file is created from the remote content.
     */
    bsync::Result<DeltaStats> pull(const std::string& remotePath, const std::string& localPath);

    uint32_t blockSize() const { return blockSize_; }

private:
    bsync::Result<Response> roundTrip(Command command, const std::string& path, std::vector<uint8_t> payload);

    std::shared_ptr<ISession> session_;
    uint32_t blockSize_;
    uint32_t nextRequestId_ = 1;
};

} // namespace BlockSync
