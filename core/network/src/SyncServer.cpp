#include "SyncServer.h"
#include "ConnectionHandler.h"
#include "DeltaSyncProtocolHandler.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "TCPSession.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>

namespace BlockSync {

using bsync::Error;
using bsync::ErrorCode;

SyncServer::SyncServer(ServerOptions options, std::shared_ptr<IFileTransferAPI> fallback)
    : options_(std::move(options)), fallback_(std::move(fallback)) {
}

SyncServer::~SyncServer() {
    stop();
}

bsync::Result<void> SyncServer::start() {
    auto& logger = Logger::instance();

    if (running_) {
        return Error{ErrorCode::InternalError, "Server already running"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(options_.rootDirectory, ec)) {
        return Error{ErrorCode::DirectoryNotFound, "Root directory not found: " + options_.rootDirectory.string()};
    }
    if (options_.blockSize == 0 || options_.blockSize > bsync::config::MAX_BLOCK_SIZE) {
        return Error{ErrorCode::InvalidConfig, "Block size out of range: " + std::to_string(options_.blockSize)};
    }

    logger.info("Starting sync server on " + options_.listenAddress + ":" + std::to_string(options_.port),
                "SyncServer");

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    if (inet_pton(AF_INET, options_.listenAddress.c_str(), &addr.sin_addr) <= 0) {
        return Error{ErrorCode::InvalidConfig, "Invalid listen address: " + options_.listenAddress};
    }

    bsync::UniqueFd sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        return Error{ErrorCode::NetworkError, std::string("Failed to create server socket: ") + std::strerror(errno)};
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return Error{ErrorCode::NetworkError, std::string("Failed to set socket options: ") + std::strerror(errno)};
    }

    if (bind(sock.get(), reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        return Error{ErrorCode::NetworkError, "Failed to bind to port " + std::to_string(options_.port) + ": " +
                                              std::strerror(errno)};
    }

    if (listen(sock.get(), options_.backlog) < 0) {
        return Error{ErrorCode::NetworkError, std::string("Failed to listen: ") + std::strerror(errno)};
    }

    struct sockaddr_in bound;
    socklen_t boundLen = sizeof(bound);
    if (getsockname(sock.get(), reinterpret_cast<struct sockaddr*>(&bound), &boundLen) < 0) {
        return Error{ErrorCode::NetworkError, std::string("getsockname failed: ") + std::strerror(errno)};
    }
    boundPort_ = ntohs(bound.sin_port);

    listenSocket_ = std::move(sock);
    running_ = true;
    acceptThread_ = std::thread(&SyncServer::acceptLoop, this);

    logger.info("Serving " + options_.rootDirectory.string() + " on port " + std::to_string(boundPort_) +
                " (block size " + std::to_string(options_.blockSize) + ")", "SyncServer");
    return {};
}

void SyncServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    auto& logger = Logger::instance();
    logger.info("Stopping sync server", "SyncServer");

    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    listenSocket_.reset();

    std::list<Connection> remaining;
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        remaining.swap(connections_);
    }
    for (auto& conn : remaining) {
        conn.session->close();
    }
    for (auto& conn : remaining) {
        if (conn.thread.joinable()) {
            conn.thread.join();
        }
    }

    logger.info("Sync server stopped, closed " + std::to_string(remaining.size()) + " connections", "SyncServer");
}

size_t SyncServer::activeConnections() const {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    size_t count = 0;
    for (const auto& conn : connections_) {
        if (!*conn.finished) {
            ++count;
        }
    }
    return count;
}

void SyncServer::reapFinished() {
    std::list<Connection> done;
    {
        std::lock_guard<std::mutex> lock(connectionMutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (*it->finished) {
                auto next = std::next(it);
                done.splice(done.end(), connections_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : done) {
        if (conn.thread.joinable()) {
            conn.thread.join();
        }
    }
}

void SyncServer::acceptLoop() {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    while (running_) {
        reapFinished();

        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(listenSocket_.get(), &readfds);

        struct timeval tv;
        tv.tv_sec = bsync::config::ACCEPT_POLL_INTERVAL_SEC;
        tv.tv_usec = 0;

        int activity = select(listenSocket_.get() + 1, &readfds, nullptr, nullptr, &tv);
        if (activity < 0 && errno != EINTR) {
            logger.error(std::string("select failed: ") + std::strerror(errno), "SyncServer");
            break;
        }
        if (activity <= 0) continue;

        struct sockaddr_in clientAddr;
        socklen_t len = sizeof(clientAddr);
        bsync::UniqueFd client(accept(listenSocket_.get(), reinterpret_cast<struct sockaddr*>(&clientAddr), &len));
        if (!client) {
            logger.warn(std::string("accept failed: ") + std::strerror(errno), "SyncServer");
            continue;
        }

        char clientIpBuf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &(clientAddr.sin_addr), clientIpBuf, INET_ADDRSTRLEN);
        std::string peer = std::string(clientIpBuf) + ":" + std::to_string(ntohs(clientAddr.sin_port));

        logger.info("New connection from " + peer, "SyncServer");
        metrics.incrementConnectionsAccepted();

        auto session = std::make_shared<TCPSession>(std::move(client), peer);
        auto finished = std::make_shared<std::atomic<bool>>(false);
        DeltaSyncProtocolHandler dispatcher(options_.rootDirectory, options_.blockSize, fallback_);

        std::lock_guard<std::mutex> lock(connectionMutex_);
        Connection conn;
        conn.session = session;
        conn.finished = finished;
        conn.thread = std::thread([session, finished, dispatcher]() mutable {
            ConnectionHandler handler(session, std::move(dispatcher));
            handler.run();
            *finished = true;
        });
        connections_.push_back(std::move(conn));
    }
}

} // namespace BlockSync
