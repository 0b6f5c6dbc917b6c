#pragma once

#include "ISession.h"
#include "Result.h"
#include "UniqueFd.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace BlockSync {

/**
 * @brief ISession over a TCP socket
 *
 * Each frame travels as a 4-byte big-endian length followed by the bytes.
 * Frames announcing more than MAX_FRAME_SIZE bytes end the session;
 * sendFrame() refuses frames above the same limit without writing anything.
 */
class TCPSession : public ISession {
public:
    TCPSession(bsync::UniqueFd socket, std::string peerName);
    ~TCPSession() override;

    /**
     * @brief Connect to a server
     * @param host Host name or IPv4/IPv6 address
     */
    static bsync::Result<std::unique_ptr<TCPSession>> connect(const std::string& host, uint16_t port);

    bool sendFrame(const std::vector<uint8_t>& frame) override;
    std::optional<std::vector<uint8_t>> recvFrame() override;
    void close() override;
    std::string peerName() const override { return peerName_; }

private:
    bool sendAll(const uint8_t* data, size_t len);
    bool recvAll(uint8_t* data, size_t len);

    bsync::UniqueFd socket_;
    std::string peerName_;
    std::mutex sendMutex_;
};

} // namespace BlockSync
