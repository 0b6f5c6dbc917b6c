#pragma once

#include "DeltaTypes.h"
#include "Result.h"
#include <cstdint>
#include <string>
#include <vector>

namespace BlockSync {

    /**
     * @brief JSON wire form of signatures and deltas
     *
     * Signature set: [{"index": n, "weak": n, "strong": "hex"}, ...]
     * Delta:         [{"c": blockIndex} | {"l": "base64"}, ...]
     *
     * Deserializers return MalformedPayload for anything that is not exactly
     * one of these shapes.
     */
    class DeltaSerialization {
    public:
        static std::vector<uint8_t> serializeSignature(const SignatureSet& signatures);
        static bsync::Result<SignatureSet> deserializeSignature(const std::vector<uint8_t>& data);

        static std::vector<uint8_t> serializeDelta(const DeltaOps& ops);
        static bsync::Result<DeltaOps> deserializeDelta(const std::vector<uint8_t>& data);

        static std::string base64Encode(const std::vector<uint8_t>& data);
        static bsync::Result<std::vector<uint8_t>> base64Decode(const std::string& text);
    };

}
