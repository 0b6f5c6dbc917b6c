#include "PathValidator.h"
#include "Logger.h"
#include <algorithm>

namespace BlockSync {

namespace fs = std::filesystem;

bsync::Result<fs::path> PathValidator::resolve(const fs::path& rootPath, const std::string& requestPath) {
    using bsync::ErrorCode;
    using bsync::Error;

    if (requestPath.empty()) {
        return Error{ErrorCode::InvalidPath, "Empty path"};
    }
    if (containsForbiddenCharacters(requestPath)) {
        Logger::instance().warn("Rejected path with forbidden characters", "PathValidator");
        return Error{ErrorCode::PathOutsideRoot, "Path contains forbidden characters"};
    }

    try {
        fs::path root = fs::absolute(rootPath).lexically_normal();

        // "/a/b" and "a/b" both name root/a/b
        fs::path relative = fs::path(requestPath).relative_path().lexically_normal();
        if (relative.empty() || relative == ".") {
            return Error{ErrorCode::InvalidPath, "Path names the root directory: " + requestPath};
        }
        if (*relative.begin() == "..") {
            Logger::instance().warn("Rejected path escaping root: " + requestPath, "PathValidator");
            return Error{ErrorCode::PathOutsideRoot, "Path escapes root directory: " + requestPath};
        }

        fs::path full = (root / relative).lexically_normal();

        // Follow symlinks for the existing part of the path
        fs::path canonicalRoot = fs::weakly_canonical(root);
        fs::path canonicalFull = fs::weakly_canonical(full);
        if (!isStrictlyInside(canonicalRoot, canonicalFull)) {
            Logger::instance().warn("Rejected path resolving outside root: " + requestPath, "PathValidator");
            return Error{ErrorCode::PathOutsideRoot, "Path resolves outside root directory: " + requestPath};
        }

        return full;
    } catch (const fs::filesystem_error& e) {
        Logger::instance().error("Path validation error: " + std::string(e.what()), "PathValidator");
        return Error{ErrorCode::InvalidPath, "Cannot resolve path: " + requestPath};
    }
}

bool PathValidator::containsForbiddenCharacters(const std::string& path) {
    if (path.find('\0') != std::string::npos) {
        return true;
    }

    // Windows UNC paths and drive letters
    if (path.find("\\\\") == 0) {
        return true;
    }
    if (path.length() >= 2 && path[1] == ':') {
        return true;
    }

    return false;
}

bool PathValidator::isStrictlyInside(const fs::path& base, const fs::path& candidate) {
    auto candIt = candidate.begin();
    for (const auto& part : base) {
        // "dir/" iterates with a trailing empty element
        if (part.empty()) {
            continue;
        }
        if (candIt == candidate.end() || *candIt != part) {
            return false;
        }
        ++candIt;
    }
    for (; candIt != candidate.end(); ++candIt) {
        if (!candIt->empty()) {
            return true;
        }
    }
    return false;
}

} // namespace BlockSync
