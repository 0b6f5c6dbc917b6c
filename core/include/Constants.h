#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for BlockSync
 *
 * Protocol numbers and defaults shared by the daemon, the client and the
 * engines live here so both peers agree on them.
 */

#include <cstddef>
#include <cstdint>

namespace bsync::config {

// =============================================================================
// Delta Sync Configuration
// =============================================================================

/// Block size for delta signature calculation (bytes). Not negotiated.
constexpr std::uint32_t DELTA_BLOCK_SIZE = 4096;

/// Largest block size accepted from configuration
constexpr std::uint32_t MAX_BLOCK_SIZE = 1024 * 1024;

/// Sliding window buffer holds this many blocks
constexpr std::size_t DELTA_BUFFER_BLOCKS = 4;

// =============================================================================
// Network Configuration
// =============================================================================

/// TCP server backlog size
constexpr int TCP_BACKLOG = 10;

/// Default TCP port for the sync daemon
constexpr int DEFAULT_TCP_PORT = 2222;

/// Accept loop poll interval (seconds)
constexpr int ACCEPT_POLL_INTERVAL_SEC = 1;

/// Largest frame a session accepts (bytes)
constexpr std::uint32_t MAX_FRAME_SIZE = 256 * 1024 * 1024;  // 256MB

// =============================================================================
// Logging
// =============================================================================

/// Maximum log file size (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 100;

} // namespace bsync::config
