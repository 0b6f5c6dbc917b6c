#include "UnsupportedFileTransfer.h"
#include "SyncProtocol.h"
#include <string>

namespace BlockSync {

    std::optional<std::vector<uint8_t>> UnsupportedFileTransfer::handleRequest(const std::vector<uint8_t>& frame) {
        std::string message = frame.empty()
            ? std::string("Empty request")
            : "Unsupported request type " + std::to_string(frame[0]);
        return encodeStatusResponse(peekRequestId(frame), StatusCode::OpUnsupported, message);
    }

}
