#pragma once

/**
 * @file UniqueFd.h
 * @brief RAII wrapper for POSIX file descriptors
 *
 * Owns sockets and temporary files alike, closing them when going out of
 * scope so error paths cannot leak descriptors.
 */

#include <unistd.h>
#include <utility>

namespace bsync {

/**
 * @brief RAII wrapper for file descriptors
 *
 * Usage:
 * @code
 * UniqueFd sock(socket(AF_INET, SOCK_STREAM, 0));
 * if (!sock) { // handle error }
 * connect(sock.get(), ...);
 * // Descriptor automatically closed when sock goes out of scope
 *
 * // Or release ownership:
 * int fd = sock.release();  // Now caller owns the fd
 * @endcode
 */
class UniqueFd {
public:
    /// Create an empty guard (no descriptor)
    UniqueFd() noexcept : fd_(-1) {}

    /// Take ownership of a descriptor
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}

    /// Non-copyable
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    /// Move constructor
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    /// Move assignment
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    /// Destructor - closes descriptor if owned
    ~UniqueFd() {
        reset();
    }

    /// Get the raw file descriptor
    int get() const noexcept { return fd_; }

    /// Check if guard holds a valid descriptor
    explicit operator bool() const noexcept { return fd_ >= 0; }

    /// Check if guard holds a valid descriptor
    bool valid() const noexcept { return fd_ >= 0; }

    /// Release ownership and return the fd
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// Close current descriptor (if any) and take ownership of new one
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /// Swap with another guard
    void swap(UniqueFd& other) noexcept {
        std::swap(fd_, other.fd_);
    }

private:
    int fd_;
};

/// Swap two UniqueFds
inline void swap(UniqueFd& a, UniqueFd& b) noexcept {
    a.swap(b);
}

} // namespace bsync
