#include "SignatureEngine.h"
#include "Checksum.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"
#include <filesystem>
#include <fstream>
#include <vector>

namespace BlockSync {

    using bsync::Error;
    using bsync::ErrorCode;

    bsync::Result<SignatureSet> SignatureEngine::calculateSignature(std::istream& in, uint32_t blockSize) {
        if (blockSize == 0) {
            return Error{ErrorCode::InvalidArgument, "Block size must be positive"};
        }

        SignatureSet signatures;
        std::vector<uint8_t> buffer(blockSize);
        uint32_t index = 0;

        try {
            while (in) {
                in.read(reinterpret_cast<char*>(buffer.data()), blockSize);
                size_t bytesRead = static_cast<size_t>(in.gcount());

                if (bytesRead == 0) break;

                BlockSignature sig;
                sig.index = index++;
                sig.weak = Checksum::adler32(buffer.data(), bytesRead);
                sig.strong = Checksum::sha256Hex(buffer.data(), bytesRead);
                signatures.push_back(std::move(sig));
            }
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError, std::string("Signature calculation failed: ") + e.what()};
        }

        if (in.bad()) {
            return Error{ErrorCode::FileReadError, "Read error after " + std::to_string(index) + " blocks"};
        }

        MetricsCollector::instance().incrementSignaturesComputed();
        return signatures;
    }

    bsync::Result<SignatureSet> SignatureEngine::calculateSignature(const std::string& filePath, uint32_t blockSize) {
        auto& logger = Logger::instance();
        LOG_DEBUG_COMP_IF("Calculating signature for: " + filePath, "SignatureEngine");

        std::error_code ec;
        if (!std::filesystem::exists(filePath, ec)) {
            logger.warn("File not found for signature calculation: " + filePath, "SignatureEngine");
            return Error{ErrorCode::FileNotFound, "No such file: " + filePath};
        }

        if (std::filesystem::is_directory(filePath, ec)) {
            return Error{ErrorCode::FileReadError, "Is a directory: " + filePath};
        }

        std::ifstream file(filePath, std::ios::binary);
        if (!file) {
            logger.error("Failed to open file for signature calculation: " + filePath, "SignatureEngine");
            return Error{ErrorCode::FileReadError, "Cannot open file: " + filePath};
        }

        auto result = calculateSignature(file, blockSize);
        if (result) {
            LOG_DEBUG_COMP_IF("Signature of " + filePath + " has " + std::to_string(result->size()) +
                              " blocks of " + std::to_string(blockSize) + " bytes", "SignatureEngine");
        } else {
            logger.error(result.error().message + ": " + filePath, "SignatureEngine");
        }
        return result;
    }

}
