#pragma once

#include "Constants.h"
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace BlockSync {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Parse a level name from configuration ("debug", "info", ...)
     * @return The level, or nullopt for an unknown name
     */
    std::optional<LogLevel> parseLogLevel(const std::string& name);

    /**
     * @brief Process-wide logger shared by connection threads
     *
     * Lines look like "[2026-01-01 12:00:00] [INFO] [SyncServer] message" and go
     * to the console and, once setLogFile() was called, to a file that is
     * rotated when it outgrows setMaxFileSize().
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setComponent(const std::string& component);  // used when a call passes none
        void setConsoleOutput(bool enabled);

        bool isEnabled(LogLevel level) const { return level >= currentLevel_.load(std::memory_order_relaxed); }
        bool isDebugEnabled() const { return isEnabled(LogLevel::DEBUG); }
        bool isInfoEnabled() const { return isEnabled(LogLevel::INFO); }
        LogLevel getLevel() const { return currentLevel_.load(std::memory_order_relaxed); }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "BlockSync";
        bool consoleOutput_ = true;
        size_t maxFileSizeMB_ = bsync::config::MAX_LOG_FILE_SIZE_MB;
        size_t currentFileSize_ = 0;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        void rotateLogFile();
        void checkAndRotate();
        size_t getFileSize();
    };

}
