#pragma once

#include "Constants.h"
#include "IFileTransferAPI.h"
#include "ISession.h"
#include "Result.h"
#include "UniqueFd.h"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace BlockSync {

struct ServerOptions {
    std::string listenAddress = "127.0.0.1";
    uint16_t port = static_cast<uint16_t>(bsync::config::DEFAULT_TCP_PORT);  // 0 picks a free port
    std::filesystem::path rootDirectory;
    uint32_t blockSize = bsync::config::DELTA_BLOCK_SIZE;
    int backlog = bsync::config::TCP_BACKLOG;
};

/**
 * @brief TCP listener serving the block-sync protocol
 *
 * Accepts connections on a select()-polled loop and runs each one on its
 * own thread. Threads of finished connections are joined as the loop goes.
 */
class SyncServer {
public:
    explicit SyncServer(ServerOptions options, std::shared_ptr<IFileTransferAPI> fallback = nullptr);
    ~SyncServer();

    SyncServer(const SyncServer&) = delete;
    SyncServer& operator=(const SyncServer&) = delete;

    /**
     * @brief Bind, listen and start the accept loop
     *
     * DirectoryNotFound if the root is not a directory, NetworkError if the
     * socket cannot be set up.
     */
    bsync::Result<void> start();

    /**
     * @brief Stop accepting, shut down live sessions and join their threads
     */
    void stop();

    bool isRunning() const { return running_; }

    /// Port actually bound (differs from the option when it was 0)
    uint16_t port() const { return boundPort_; }

    size_t activeConnections() const;

private:
    struct Connection {
        std::shared_ptr<ISession> session;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void acceptLoop();
    void reapFinished();

    ServerOptions options_;
    std::shared_ptr<IFileTransferAPI> fallback_;

    bsync::UniqueFd listenSocket_;
    uint16_t boundPort_ = 0;
    std::atomic<bool> running_{false};
    std::thread acceptThread_;

    mutable std::mutex connectionMutex_;
    std::list<Connection> connections_;
};

} // namespace BlockSync
