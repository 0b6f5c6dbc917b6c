#pragma once

#include "DeltaTypes.h"
#include "Result.h"
#include <istream>
#include <string>

namespace BlockSync {

    /**
     * @brief Rolling-checksum delta computation
     *
     * Expresses local content as Copy references to the blocks of a remote
     * file (known only by its signature) plus Literal runs of bytes the
     * remote does not have.
     */
    class DeltaEngine {
    public:
        /**
         * @brief Calculates the delta between local content and a remote signature.
         * @param in Local content, read sequentially once.
         * @param remoteSignature Signature of the remote version of the file.
         * @param blockSize Block size the signature was computed with.
         * @return DeltaOps in local-content order.
         *
         * A window of blockSize bytes slides over the input with an O(1)
         * Adler-32 update per byte. A weak hit is confirmed with SHA-256; the
         * lowest matching block index wins and the window then skips the whole
         * block. Near the end of input the window shrinks so that the remote's
         * short final block can still be matched.
         *
         * Empty content yields no ops. Content sharing nothing with the remote
         * yields exactly one Literal.
         */
        static bsync::Result<DeltaOps> calculateDelta(std::istream& in,
                                                      const SignatureSet& remoteSignature,
                                                      uint32_t blockSize);

        /**
         * @brief Calculates the delta of a file against a remote signature.
         * @param filePath Path to the local version of the file.
         *
         * FileNotFound if the file does not exist, FileReadError if it cannot
         * be read.
         */
        static bsync::Result<DeltaOps> calculateDelta(const std::string& filePath,
                                                      const SignatureSet& remoteSignature,
                                                      uint32_t blockSize);
    };

}
