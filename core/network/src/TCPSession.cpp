#include "TCPSession.h"
#include "Constants.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace BlockSync {

using bsync::Error;
using bsync::ErrorCode;

TCPSession::TCPSession(bsync::UniqueFd socket, std::string peerName)
    : socket_(std::move(socket)), peerName_(std::move(peerName)) {
}

TCPSession::~TCPSession() = default;

bsync::Result<std::unique_ptr<TCPSession>> TCPSession::connect(const std::string& host, uint16_t port) {
    auto& logger = Logger::instance();
    logger.debug("Connecting to " + host + ":" + std::to_string(port), "Connection");

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results);
    if (rc != 0) {
        return Error{ErrorCode::ConnectionFailed, "Cannot resolve " + host + ": " + gai_strerror(rc)};
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> guard(results, &freeaddrinfo);

    std::string lastError = "no usable address";
    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        bsync::UniqueFd sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock) {
            lastError = std::strerror(errno);
            continue;
        }
        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
            lastError = std::strerror(errno);
            continue;
        }
        logger.debug("TCP connection established to " + host, "Connection");
        return std::make_unique<TCPSession>(std::move(sock), host + ":" + std::to_string(port));
    }

    return Error{ErrorCode::ConnectionFailed,
                 "Failed to connect to " + host + ":" + std::to_string(port) + ": " + lastError};
}

bool TCPSession::sendAll(const uint8_t* data, size_t len) {
    size_t offset = 0;
    while (offset < len) {
        ssize_t sent = ::send(socket_.get(), data + offset, len - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::instance().warn("Failed to send to " + peerName_ + ": " + std::strerror(errno), "Connection");
            return false;
        }
        offset += static_cast<size_t>(sent);
    }
    return true;
}

bool TCPSession::recvAll(uint8_t* data, size_t len) {
    size_t offset = 0;
    while (offset < len) {
        ssize_t received = ::recv(socket_.get(), data + offset, len - offset, MSG_WAITALL);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::instance().warn("Error reading from " + peerName_ + ": " + std::strerror(errno), "Connection");
            return false;
        }
        if (received == 0) {
            return false;
        }
        offset += static_cast<size_t>(received);
    }
    return true;
}

bool TCPSession::sendFrame(const std::vector<uint8_t>& frame) {
    if (frame.size() > bsync::config::MAX_FRAME_SIZE) {
        Logger::instance().warn("Refusing to send frame of " + std::to_string(frame.size()) + " bytes to " +
                                peerName_ + ", limit is " + std::to_string(bsync::config::MAX_FRAME_SIZE),
                                "Connection");
        return false;
    }

    std::lock_guard<std::mutex> lock(sendMutex_);

    uint32_t len = htonl(static_cast<uint32_t>(frame.size()));
    if (!sendAll(reinterpret_cast<const uint8_t*>(&len), sizeof(len))) {
        return false;
    }
    return sendAll(frame.data(), frame.size());
}

std::optional<std::vector<uint8_t>> TCPSession::recvFrame() {
    uint32_t netLen;
    if (!recvAll(reinterpret_cast<uint8_t*>(&netLen), sizeof(netLen))) {
        return std::nullopt;
    }

    uint32_t len = ntohl(netLen);
    if (len > bsync::config::MAX_FRAME_SIZE) {
        Logger::instance().warn("Frame of " + std::to_string(len) + " bytes from " + peerName_ +
                                " exceeds the limit, closing", "Connection");
        return std::nullopt;
    }

    std::vector<uint8_t> data(len);
    if (len > 0 && !recvAll(data.data(), len)) {
        return std::nullopt;
    }
    LOG_DEBUG_COMP_IF("Received " + std::to_string(len) + " bytes from " + peerName_, "Connection");
    return data;
}

void TCPSession::close() {
    if (socket_) {
        ::shutdown(socket_.get(), SHUT_RDWR);
    }
}

} // namespace BlockSync
