#include "ConnectionHandler.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

namespace BlockSync {

ConnectionHandler::ConnectionHandler(std::shared_ptr<ISession> session, DeltaSyncProtocolHandler dispatcher)
    : session_(std::move(session)), dispatcher_(std::move(dispatcher)) {
}

void ConnectionHandler::run() {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();
    const std::string peer = session_->peerName();

    LOG_DEBUG_COMP_IF("Starting read loop for " + peer, "Connection");

    while (true) {
        auto frame = session_->recvFrame();
        if (!frame) {
            break;
        }
        metrics.addBytesReceived(frame->size() + sizeof(uint32_t));

        auto response = dispatcher_.handleFrame(*frame);
        ++framesHandled_;
        if (!response) {
            continue;
        }

        if (!session_->sendFrame(*response)) {
            logger.warn("Failed to send response to " + peer + ", closing", "Connection");
            break;
        }
        metrics.addBytesSent(response->size() + sizeof(uint32_t));
    }

    session_->close();
    metrics.incrementConnectionsClosed();
    logger.info("Connection closed from " + peer + " after " + std::to_string(framesHandled_) + " requests",
                "Connection");
}

} // namespace BlockSync
