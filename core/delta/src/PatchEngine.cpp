#include "PatchEngine.h"
#include "AtomicFileWriter.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace BlockSync {

    using bsync::Error;
    using bsync::ErrorCode;

    bsync::Result<uint64_t> PatchEngine::applyDelta(std::istream& base, const DeltaOps& ops,
                                                    uint32_t blockSize, const ByteSink& sink) {
        if (blockSize == 0) {
            return Error{ErrorCode::InvalidArgument, "Block size must be positive"};
        }

        base.clear();
        base.seekg(0, std::ios::end);
        std::streamoff endPos = base.tellg();
        if (endPos < 0) {
            return Error{ErrorCode::FileReadError, "Base is not seekable"};
        }
        const uint64_t baseLen = static_cast<uint64_t>(endPos);
        const uint64_t blockCount = (baseLen + blockSize - 1) / blockSize;

        for (const auto& op : ops) {
            if (const auto* copy = std::get_if<CopyOp>(&op)) {
                if (copy->blockIndex >= blockCount) {
                    return Error{ErrorCode::BlockIndexOutOfRange,
                                 "Copy references block " + std::to_string(copy->blockIndex) +
                                 ", base has " + std::to_string(blockCount) + " blocks"};
                }
            }
        }

        std::vector<uint8_t> buffer(blockSize);
        uint64_t produced = 0;

        for (const auto& op : ops) {
            if (const auto* copy = std::get_if<CopyOp>(&op)) {
                uint64_t offset = static_cast<uint64_t>(copy->blockIndex) * blockSize;
                size_t len = static_cast<size_t>(std::min<uint64_t>(blockSize, baseLen - offset));

                base.clear();
                base.seekg(static_cast<std::streamoff>(offset));
                base.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(len));
                if (static_cast<size_t>(base.gcount()) != len) {
                    return Error{ErrorCode::FileReadError,
                                 "Short read of base block " + std::to_string(copy->blockIndex)};
                }
                if (auto r = sink(buffer.data(), len); !r) {
                    return r.error();
                }
                produced += len;
            } else {
                const auto& literal = std::get<LiteralOp>(op);
                if (literal.data.empty()) {
                    continue;
                }
                if (auto r = sink(literal.data.data(), literal.data.size()); !r) {
                    return r.error();
                }
                produced += literal.data.size();
            }
        }

        return produced;
    }

    bsync::Result<uint64_t> PatchEngine::applyDelta(std::istream& base, const DeltaOps& ops,
                                                    uint32_t blockSize, std::ostream& out) {
        return applyDelta(base, ops, blockSize, [&out](const uint8_t* data, size_t len) -> bsync::Result<void> {
            out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
            if (!out) {
                return Error{ErrorCode::FileWriteError, "Output stream write failed"};
            }
            return {};
        });
    }

    bsync::Result<void> PatchEngine::patchStream(std::istream& base, const DeltaOps& ops,
                                                 uint32_t blockSize, const std::string& targetPath) {
        auto& logger = Logger::instance();

        AtomicFileWriter writer(targetPath);
        if (auto r = writer.open(); !r) {
            logger.error(r.error().message, "PatchEngine");
            return r;
        }

        auto result = applyDelta(base, ops, blockSize, [&writer](const uint8_t* data, size_t len) {
            return writer.write(data, len);
        });
        if (!result) {
            logger.error("Patch of " + targetPath + " failed: " + result.error().message, "PatchEngine");
            return result.error();
        }

        if (auto r = writer.commit(); !r) {
            logger.error(r.error().message, "PatchEngine");
            return r;
        }

        MetricsCollector::instance().incrementPatchesApplied();
        LOG_DEBUG_COMP_IF("Patched " + targetPath + " (" + std::to_string(*result) + " bytes)", "PatchEngine");
        return {};
    }

    bsync::Result<void> PatchEngine::patchFile(const std::string& basePath, const DeltaOps& ops,
                                               uint32_t blockSize, const std::string& targetPath) {
        auto& logger = Logger::instance();
        SCOPED_TIMER_COMP("patch " + targetPath, "PatchEngine");

        std::error_code ec;
        if (!std::filesystem::exists(basePath, ec)) {
            logger.warn("Base file not found for patch: " + basePath, "PatchEngine");
            return Error{ErrorCode::FileNotFound, "No such file: " + basePath};
        }
        if (std::filesystem::is_directory(basePath, ec)) {
            return Error{ErrorCode::FileReadError, "Is a directory: " + basePath};
        }

        // The base stays open until the rename; on Linux it keeps reading the old inode.
        std::ifstream base(basePath, std::ios::binary);
        if (!base) {
            logger.error("Failed to open base file: " + basePath, "PatchEngine");
            return Error{ErrorCode::FileReadError, "Cannot open file: " + basePath};
        }

        return patchStream(base, ops, blockSize, targetPath);
    }

}
