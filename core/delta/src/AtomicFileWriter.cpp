#include "AtomicFileWriter.h"
#include "Logger.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace BlockSync {

    using bsync::Error;
    using bsync::ErrorCode;

    namespace {

        void syncDirectory(const std::filesystem::path& dir) {
            bsync::UniqueFd dirFd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY));
            if (!dirFd) {
                return;
            }
            if (::fsync(dirFd.get()) < 0) {
                Logger::instance().warn("fsync of directory failed: " + dir.string() + " (" +
                                        std::strerror(errno) + ")", "PatchEngine");
            }
        }

    }

    AtomicFileWriter::AtomicFileWriter(std::filesystem::path targetPath)
        : targetPath_(std::move(targetPath)) {
    }

    AtomicFileWriter::~AtomicFileWriter() {
        if (!committed_) {
            discard();
        }
    }

    bsync::Result<void> AtomicFileWriter::open() {
        if (fd_) {
            return Error{ErrorCode::InternalError, "Temporary file already open"};
        }

        std::filesystem::path dir = targetPath_.parent_path();
        if (dir.empty()) {
            dir = ".";
        }
        std::string pattern = (dir / ("." + targetPath_.filename().string() + ".XXXXXX.tmp")).string();
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');

        int fd = ::mkstemps(buf.data(), 4);
        if (fd < 0) {
            int err = errno;
            return Error{err == ENOENT ? ErrorCode::DirectoryNotFound : ErrorCode::FileWriteError,
                         "Cannot create temporary file in " + dir.string() + ": " + std::strerror(err)};
        }
        fd_.reset(fd);
        tempPath_ = buf.data();
        bytesWritten_ = 0;
        committed_ = false;

        mode_t mode = 0644;
        struct stat st;
        if (::stat(targetPath_.c_str(), &st) == 0) {
            mode = st.st_mode & 07777;
        }
        if (::fchmod(fd_.get(), mode) < 0) {
            Logger::instance().warn("Cannot set permissions on " + tempPath_.string() + ": " +
                                    std::strerror(errno), "PatchEngine");
        }

        return {};
    }

    bsync::Result<void> AtomicFileWriter::write(const uint8_t* data, size_t len) {
        if (!fd_) {
            return Error{ErrorCode::InternalError, "Temporary file not open"};
        }

        size_t offset = 0;
        while (offset < len) {
            ssize_t written = ::write(fd_.get(), data + offset, len - offset);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Error{ErrorCode::FileWriteError,
                             "Write to " + tempPath_.string() + " failed: " + std::strerror(errno)};
            }
            offset += static_cast<size_t>(written);
        }
        bytesWritten_ += len;
        return {};
    }

    bsync::Result<void> AtomicFileWriter::commit() {
        if (!fd_) {
            return Error{ErrorCode::InternalError, "Temporary file not open"};
        }

        if (::fsync(fd_.get()) < 0) {
            return Error{ErrorCode::FileWriteError,
                         "fsync of " + tempPath_.string() + " failed: " + std::strerror(errno)};
        }
        int fd = fd_.release();
        if (::close(fd) < 0) {
            return Error{ErrorCode::FileWriteError,
                         "close of " + tempPath_.string() + " failed: " + std::strerror(errno)};
        }

        if (std::rename(tempPath_.c_str(), targetPath_.c_str()) < 0) {
            return Error{ErrorCode::RenameFailed,
                         "Rename onto " + targetPath_.string() + " failed: " + std::strerror(errno)};
        }
        committed_ = true;

        std::filesystem::path dir = targetPath_.parent_path();
        syncDirectory(dir.empty() ? std::filesystem::path(".") : dir);
        return {};
    }

    void AtomicFileWriter::discard() {
        fd_.reset();
        if (!tempPath_.empty()) {
            if (::unlink(tempPath_.c_str()) < 0 && errno != ENOENT) {
                Logger::instance().warn("Cannot remove temporary file " + tempPath_.string() + ": " +
                                        std::strerror(errno), "PatchEngine");
            }
            tempPath_.clear();
        }
    }

}
