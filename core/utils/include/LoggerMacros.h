/**
 * @file LoggerMacros.h
 * @brief Conditional logging macros
 *
 * These macros skip string construction when the level is disabled, which
 * matters on the per-request hot path of the sync protocol.
 *
 * Example:
 *   logger.debug("Window at " + std::to_string(offset));   // always builds the string
 *   LOG_DEBUG_COMP_IF("Window at " + std::to_string(offset), "DeltaEngine");  // only if enabled
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>

namespace BlockSync {

#define LOG_DEBUG_IF(msg) \
    do { \
        auto& logger__ = ::BlockSync::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg); \
        } \
    } while(0)

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::BlockSync::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::BlockSync::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::BlockSync::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::BlockSync::Logger::instance().error(msg, component)

// Scoped performance timer (logs elapsed time on destruction)
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_).count();
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

    long long elapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::BlockSync::ScopedTimer timer__(name, component)

} // namespace BlockSync
