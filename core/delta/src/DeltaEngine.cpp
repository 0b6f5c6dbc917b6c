#include "DeltaEngine.h"
#include "Checksum.h"
#include "Constants.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <unordered_map>
#include <vector>

namespace BlockSync {

    using bsync::Error;
    using bsync::ErrorCode;

    bsync::Result<DeltaOps> DeltaEngine::calculateDelta(std::istream& in,
                                                       const SignatureSet& remoteSignature,
                                                       uint32_t blockSize) {
        if (blockSize == 0) {
            return Error{ErrorCode::InvalidArgument, "Block size must be positive"};
        }

        auto startTime = std::chrono::steady_clock::now();

        // Map Adler32 to candidate blocks, lowest index first
        std::unordered_map<uint32_t, std::vector<const BlockSignature*>> signatureMap;
        signatureMap.reserve(remoteSignature.size());
        for (const auto& sig : remoteSignature) {
            signatureMap[sig.weak].push_back(&sig);
        }
        for (auto& entry : signatureMap) {
            std::stable_sort(entry.second.begin(), entry.second.end(),
                             [](const BlockSignature* a, const BlockSignature* b) { return a->index < b->index; });
        }

        DeltaOps deltas;
        std::vector<uint8_t> literalBuffer;

        auto flushLiteral = [&deltas, &literalBuffer]() {
            if (!literalBuffer.empty()) {
                deltas.push_back(LiteralOp{std::move(literalBuffer)});
                literalBuffer.clear();
            }
        };

        // Sliding window over the input using a bounded buffer.
        const size_t capacity = static_cast<size_t>(blockSize) * bsync::config::DELTA_BUFFER_BLOCKS;
        std::vector<uint8_t> buffer(capacity);
        size_t bufStart = 0;  // index of first valid byte
        size_t bufSize = 0;   // number of valid bytes
        bool eof = false;

        auto fillBuffer = [&]() -> bool {
            if (eof) {
                return true;
            }
            // Compact if there is not enough room at the end for a full block
            if (bufStart > 0 && bufStart + bufSize + blockSize > capacity) {
                std::memmove(buffer.data(), buffer.data() + bufStart, bufSize);
                bufStart = 0;
            }
            size_t space = capacity - (bufStart + bufSize);
            if (space == 0) {
                return true;
            }
            in.read(reinterpret_cast<char*>(buffer.data() + bufStart + bufSize),
                    static_cast<std::streamsize>(space));
            size_t got = static_cast<size_t>(in.gcount());
            bufSize += got;
            if (got < space) {
                if (in.bad()) {
                    return false;
                }
                eof = true;
            }
            return true;
        };

        const Error readError{ErrorCode::FileReadError, "Read error during delta calculation"};

        RollingAdler32 rollingHash;
        bool hashInitialized = false;

        try {
            while (true) {
                if (bufSize < blockSize && !eof) {
                    if (!fillBuffer()) {
                        return readError;
                    }
                }
                if (bufSize == 0) {
                    break;
                }

                size_t windowSize = std::min<size_t>(bufSize, blockSize);
                const uint8_t* base = buffer.data() + bufStart;

                if (!hashInitialized) {
                    rollingHash.init(base, windowSize);
                    hashInitialized = true;
                }

                auto it = signatureMap.find(rollingHash.get());
                if (it != signatureMap.end()) {
                    std::string currentSHA = Checksum::sha256Hex(base, windowSize);
                    const BlockSignature* match = nullptr;
                    for (const auto* sig : it->second) {
                        if (sig->strong == currentSHA) {
                            match = sig;
                            break;
                        }
                    }
                    if (match) {
                        flushLiteral();
                        deltas.push_back(CopyOp{match->index});
                        bufStart += windowSize;
                        bufSize -= windowSize;
                        // Next window needs fresh computation
                        hashInitialized = false;
                        continue;
                    }
                }

                // No matching block: the leading byte becomes literal, advance by 1.
                // Rolling needs the byte after the window in the buffer.
                if (bufSize <= windowSize && !eof) {
                    if (!fillBuffer()) {
                        return readError;
                    }
                    base = buffer.data() + bufStart;
                }

                uint8_t oldByte = base[0];
                literalBuffer.push_back(oldByte);

                if (bufSize > windowSize) {
                    rollingHash.roll(oldByte, base[windowSize], windowSize);
                } else {
                    // End of input: the window shrinks
                    rollingHash.rollOut(oldByte, windowSize);
                    if (windowSize == 1) {
                        hashInitialized = false;
                    }
                }

                bufStart += 1;
                bufSize -= 1;
            }
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError, std::string("Delta calculation failed: ") + e.what()};
        }

        flushLiteral();

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime).count();
        auto stats = summarize(deltas);
        MetricsCollector::instance().recordDelta(stats.copiedBlocks, stats.literalBytes,
                                                 static_cast<uint64_t>(elapsed));

        return deltas;
    }

    bsync::Result<DeltaOps> DeltaEngine::calculateDelta(const std::string& filePath,
                                                       const SignatureSet& remoteSignature,
                                                       uint32_t blockSize) {
        auto& logger = Logger::instance();
        LOG_DEBUG_COMP_IF("Calculating delta for: " + filePath + " against " +
                          std::to_string(remoteSignature.size()) + " remote blocks", "DeltaEngine");

        std::error_code ec;
        if (!std::filesystem::exists(filePath, ec)) {
            logger.warn("File not found for delta calculation: " + filePath, "DeltaEngine");
            return Error{ErrorCode::FileNotFound, "No such file: " + filePath};
        }
        if (std::filesystem::is_directory(filePath, ec)) {
            return Error{ErrorCode::FileReadError, "Is a directory: " + filePath};
        }

        std::ifstream file(filePath, std::ios::binary);
        if (!file) {
            logger.error("Failed to open file for delta calculation: " + filePath, "DeltaEngine");
            return Error{ErrorCode::FileReadError, "Cannot open file: " + filePath};
        }

        auto result = calculateDelta(file, remoteSignature, blockSize);
        if (result) {
            auto stats = summarize(*result);
            LOG_DEBUG_COMP_IF("Delta for " + filePath + ": " + std::to_string(result->size()) + " ops, " +
                              std::to_string(stats.copiedBlocks) + " copied blocks, " +
                              std::to_string(stats.literalBytes) + " literal bytes", "DeltaEngine");
        } else {
            logger.error(result.error().message + ": " + filePath, "DeltaEngine");
        }
        return result;
    }

}
