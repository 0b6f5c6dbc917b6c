#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace BlockSync {

    /**
     * @brief Ordinary file transfer subsystem sharing the stream with block sync
     *
     * Receives every frame whose command byte is not a block-sync command,
     * byte for byte as it arrived.
     */
    class IFileTransferAPI {
    public:
        virtual ~IFileTransferAPI() = default;

        /**
         * @brief Handle one request frame.
         * @return Response frame, or nullopt if the request has no reply.
         */
        virtual std::optional<std::vector<uint8_t>> handleRequest(const std::vector<uint8_t>& frame) = 0;
    };

}
