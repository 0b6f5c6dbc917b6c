#pragma once

#include "DeltaTypes.h"
#include "Result.h"
#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <string>

namespace BlockSync {

    /**
     * @brief Reconstructs a file from a base and a delta
     */
    class PatchEngine {
    public:
        using ByteSink = std::function<bsync::Result<void>(const uint8_t*, size_t)>;

        /**
         * @brief Applies ops to a seekable base stream, emitting output through sink.
         * @return Number of bytes produced.
         *
         * Every Copy index is checked against the base block count before any
         * byte reaches the sink. The last base block may be short.
         */
        static bsync::Result<uint64_t> applyDelta(std::istream& base, const DeltaOps& ops,
                                                  uint32_t blockSize, const ByteSink& sink);

        static bsync::Result<uint64_t> applyDelta(std::istream& base, const DeltaOps& ops,
                                                  uint32_t blockSize, std::ostream& out);

        /**
         * @brief Writes the result of applying ops to base into targetPath atomically.
         *
         * Output goes to a temporary sibling of targetPath and is renamed over
         * it only after every op succeeded.
         */
        static bsync::Result<void> patchStream(std::istream& base, const DeltaOps& ops,
                                               uint32_t blockSize, const std::string& targetPath);

        /**
         * @brief Patches basePath into targetPath atomically.
         *
         * basePath and targetPath may be the same file. FileNotFound if the
         * base does not exist.
         */
        static bsync::Result<void> patchFile(const std::string& basePath, const DeltaOps& ops,
                                             uint32_t blockSize, const std::string& targetPath);
    };

}
