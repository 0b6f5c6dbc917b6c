#pragma once

#include "DeltaSyncProtocolHandler.h"
#include "ISession.h"
#include <memory>

namespace BlockSync {

/**
 * @brief Serves one connection: frames are read, dispatched and answered in order
 *
 * run() returns when the peer disconnects, the session is closed from
 * another thread, or a response cannot be sent.
 */
class ConnectionHandler {
public:
    ConnectionHandler(std::shared_ptr<ISession> session, DeltaSyncProtocolHandler dispatcher);

    void run();

    /// Number of frames handled so far
    uint64_t framesHandled() const { return framesHandled_; }

private:
    std::shared_ptr<ISession> session_;
    DeltaSyncProtocolHandler dispatcher_;
    uint64_t framesHandled_ = 0;
};

} // namespace BlockSync
