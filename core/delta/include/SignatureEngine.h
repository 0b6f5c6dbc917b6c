#pragma once

#include "DeltaTypes.h"
#include "Result.h"
#include <istream>
#include <string>

namespace BlockSync {

    /**
     * @brief Computes the block signature of a file
     */
    class SignatureEngine {
    public:
        /**
         * @brief Generates the signature (list of checksums) for a stream.
         * @param in Stream positioned at the start of the content.
         * @param blockSize Size of each block; the last block may be shorter.
         * @return One BlockSignature per block, in order. Empty for empty content.
         *
         * FileReadError if the stream fails, InvalidArgument for a zero block size.
         */
        static bsync::Result<SignatureSet> calculateSignature(std::istream& in, uint32_t blockSize);

        /**
         * @brief Generates the signature for a file.
         * @param filePath Path to the file.
         * @param blockSize Size of each block.
         *
         * FileNotFound if the file does not exist, FileReadError if it cannot
         * be opened or read.
         */
        static bsync::Result<SignatureSet> calculateSignature(const std::string& filePath, uint32_t blockSize);
    };

}
