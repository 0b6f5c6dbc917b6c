#pragma once

#include "IFileTransferAPI.h"

namespace BlockSync {

    /// Answers every forwarded request with OP_UNSUPPORTED.
    class UnsupportedFileTransfer : public IFileTransferAPI {
    public:
        std::optional<std::vector<uint8_t>> handleRequest(const std::vector<uint8_t>& frame) override;
    };

}
