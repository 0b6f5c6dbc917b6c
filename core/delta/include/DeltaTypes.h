#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace BlockSync {

    /**
     * @brief Checksums of one fixed-size block of a file
     *
     * The block at @c index covers bytes [index * blockSize, index * blockSize + blockSize),
     * clipped to the file length for the final block.
     */
    struct BlockSignature {
        uint32_t index;
        uint32_t weak;       // Adler-32
        std::string strong;  // SHA-256, lowercase hex

        bool operator==(const BlockSignature& other) const {
            return index == other.index && weak == other.weak && strong == other.strong;
        }
        bool operator!=(const BlockSignature& other) const { return !(*this == other); }
    };

    /// Signatures of one file snapshot, ordered by index, no gaps.
    using SignatureSet = std::vector<BlockSignature>;

    // Reuse block blockIndex of the base file unchanged
    struct CopyOp {
        uint32_t blockIndex;

        bool operator==(const CopyOp& other) const { return blockIndex == other.blockIndex; }
    };

    // Insert bytes verbatim
    struct LiteralOp {
        std::vector<uint8_t> data;

        bool operator==(const LiteralOp& other) const { return data == other.data; }
    };

    using DeltaOp = std::variant<CopyOp, LiteralOp>;

    /// Delta instructions in target-file order.
    using DeltaOps = std::vector<DeltaOp>;

    struct DeltaStats {
        uint64_t copiedBlocks{0};
        uint64_t literalBytes{0};
    };

    inline DeltaStats summarize(const DeltaOps& ops) {
        DeltaStats stats;
        for (const auto& op : ops) {
            if (const auto* literal = std::get_if<LiteralOp>(&op)) {
                stats.literalBytes += literal->data.size();
            } else {
                stats.copiedBlocks++;
            }
        }
        return stats;
    }

}
