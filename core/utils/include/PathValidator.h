#pragma once

#include "Result.h"
#include <string>
#include <filesystem>

namespace BlockSync {

/**
 * @brief Path validation utilities for security
 *
 * Resolves paths received from the network against a connection's root
 * directory and rejects anything that would land outside of it.
 */
class PathValidator {
public:
    /**
     * @brief Resolve a request path under the root directory
     * @param rootPath The root directory served to the connection
     * @param requestPath The path as sent by the peer. A leading '/' refers to
     *        the root itself, as on an SFTP server with a chroot-like view.
     * @return Absolute path inside rootPath, or PathOutsideRoot / InvalidPath
     *
     * Paths escaping the root through ".." segments or through symlinks are
     * rejected, never clamped.
     */
    static bsync::Result<std::filesystem::path> resolve(const std::filesystem::path& rootPath,
                                                        const std::string& requestPath);

    /**
     * @brief Checks if a path contains bytes no request path may carry
     */
    static bool containsForbiddenCharacters(const std::string& path);

private:
    static bool isStrictlyInside(const std::filesystem::path& base, const std::filesystem::path& candidate);
};

} // namespace BlockSync
