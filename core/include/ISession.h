#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace BlockSync {

    /**
     * @brief Bidirectional message stream to one peer
     *
     * Frames are delivered whole and in order. Implementations must allow
     * close() to be called from another thread to unblock recvFrame().
     */
    class ISession {
    public:
        virtual ~ISession() = default;

        virtual bool sendFrame(const std::vector<uint8_t>& frame) = 0;

        /**
         * @brief Block until the next frame arrives
         * @return The frame, or nullopt once the stream is closed or broken
         */
        virtual std::optional<std::vector<uint8_t>> recvFrame() = 0;

        virtual void close() = 0;

        virtual std::string peerName() const = 0;
    };

}
