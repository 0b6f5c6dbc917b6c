#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "Constants.h"
#include "DeltaEngine.h"
#include "DeltaSerialization.h"
#include "Logger.h"
#include "PatchEngine.h"
#include "SignatureEngine.h"
#include "SyncClient.h"
#include "TCPSession.h"
#include "Version.h"

using namespace BlockSync;

namespace {

struct CliOptions {
    std::string host = "127.0.0.1";
    uint16_t port = static_cast<uint16_t>(bsync::config::DEFAULT_TCP_PORT);
    uint32_t blockSize = bsync::config::DELTA_BLOCK_SIZE;
    std::string command;
    std::vector<std::string> args;
};

void printUsage(const char* argv0) {
    std::cout << "BlockSync CLI " << Version::toString() << std::endl;
    std::cout << "\nUsage: " << argv0 << " [OPTIONS] <command> [args]" << std::endl;
    std::cout << "\nCommands:" << std::endl;
    std::cout << "  signature <remote>                 Print the block signature of a remote file" << std::endl;
    std::cout << "  push <local> <remote>              Update a remote file from a local one" << std::endl;
    std::cout << "  pull <remote> <local>              Update a local file from a remote one" << std::endl;
    std::cout << "  diff <base> <target> <out.json>    Write the delta turning base into target" << std::endl;
    std::cout << "  apply <base> <delta.json> <out>    Apply a delta file to base" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --host <HOST>          Server address (default: 127.0.0.1)" << std::endl;
    std::cout << "  --port <PORT>          Server port (default: " << bsync::config::DEFAULT_TCP_PORT << ")" << std::endl;
    std::cout << "  --block-size <BYTES>   Block size, must match the server (default: "
              << bsync::config::DELTA_BLOCK_SIZE << ")" << std::endl;
    std::cout << "  --verbose              Log debug output" << std::endl;
    std::cout << "  --help                 Show this help message" << std::endl;
}

size_t requiredArgs(const std::string& command) {
    if (command == "signature") return 1;
    if (command == "push" || command == "pull") return 2;
    if (command == "diff" || command == "apply") return 3;
    return 0;
}

int reportError(const bsync::Error& error) {
    std::cerr << "Error (" << bsync::errorKindToString(error.kind()) << "): " << error.message << std::endl;
    return 1;
}

bsync::Result<std::unique_ptr<SyncClient>> connectClient(const CliOptions& options) {
    auto session = TCPSession::connect(options.host, options.port);
    if (!session) {
        return session.error();
    }
    std::shared_ptr<ISession> shared(std::move(*session));
    return std::make_unique<SyncClient>(shared, options.blockSize);
}

int runSignature(const CliOptions& options) {
    auto client = connectClient(options);
    if (!client) return reportError(client.error());

    auto signatures = (*client)->blockChecksums(options.args[0]);
    if (!signatures) return reportError(signatures.error());

    auto json = DeltaSerialization::serializeSignature(*signatures);
    std::cout << std::string(json.begin(), json.end()) << std::endl;
    return 0;
}

int runPush(const CliOptions& options) {
    auto client = connectClient(options);
    if (!client) return reportError(client.error());

    auto stats = (*client)->push(options.args[0], options.args[1]);
    if (!stats) return reportError(stats.error());

    std::cout << "Pushed " << options.args[0] << " -> " << options.args[1] << ": "
              << stats->copiedBlocks << " blocks reused, " << stats->literalBytes << " literal bytes" << std::endl;
    return 0;
}

int runPull(const CliOptions& options) {
    auto client = connectClient(options);
    if (!client) return reportError(client.error());

    auto stats = (*client)->pull(options.args[0], options.args[1]);
    if (!stats) return reportError(stats.error());

    std::cout << "Pulled " << options.args[0] << " -> " << options.args[1] << ": "
              << stats->copiedBlocks << " blocks reused, " << stats->literalBytes << " literal bytes" << std::endl;
    return 0;
}

int runDiff(const CliOptions& options) {
    auto signatures = SignatureEngine::calculateSignature(options.args[0], options.blockSize);
    if (!signatures) return reportError(signatures.error());

    auto ops = DeltaEngine::calculateDelta(options.args[1], *signatures, options.blockSize);
    if (!ops) return reportError(ops.error());

    auto json = DeltaSerialization::serializeDelta(*ops);
    std::ofstream out(options.args[2], std::ios::binary);
    out.write(reinterpret_cast<const char*>(json.data()), static_cast<std::streamsize>(json.size()));
    if (!out) {
        return reportError(bsync::Error{bsync::ErrorCode::FileWriteError, "Cannot write " + options.args[2]});
    }

    auto stats = summarize(*ops);
    std::cout << ops->size() << " ops: " << stats.copiedBlocks << " copied blocks, "
              << stats.literalBytes << " literal bytes" << std::endl;
    return 0;
}

int runApply(const CliOptions& options) {
    std::ifstream in(options.args[1], std::ios::binary);
    if (!in) {
        return reportError(bsync::Error{bsync::ErrorCode::FileNotFound, "Cannot open " + options.args[1]});
    }
    std::vector<uint8_t> json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto ops = DeltaSerialization::deserializeDelta(json);
    if (!ops) return reportError(ops.error());

    auto result = PatchEngine::patchFile(options.args[0], *ops, options.blockSize, options.args[2]);
    if (!result) return reportError(result.error());

    std::cout << "Wrote " << options.args[2] << std::endl;
    return 0;
}

}

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::WARN);
    logger.setComponent("CLI");

    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--host" && i + 1 < argc) {
                options.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                int port = std::stoi(argv[++i]);
                if (port <= 0 || port > 65535) throw std::out_of_range("port");
                options.port = static_cast<uint16_t>(port);
            } else if (arg == "--block-size" && i + 1 < argc) {
                unsigned long size = std::stoul(argv[++i]);
                if (size == 0 || size > bsync::config::MAX_BLOCK_SIZE) throw std::out_of_range("block size");
                options.blockSize = static_cast<uint32_t>(size);
            } else if (arg == "--verbose") {
                logger.setLevel(LogLevel::DEBUG);
            } else if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (options.command.empty()) {
                options.command = arg;
            } else {
                options.args.push_back(arg);
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << std::endl;
            return 2;
        }
    }

    size_t needed = requiredArgs(options.command);
    if (needed == 0 || options.args.size() != needed) {
        printUsage(argv[0]);
        return 2;
    }

    if (options.command == "signature") return runSignature(options);
    if (options.command == "push") return runPush(options);
    if (options.command == "pull") return runPull(options);
    if (options.command == "diff") return runDiff(options);
    return runApply(options);
}
