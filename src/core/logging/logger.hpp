#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace chatflow::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Process-wide logger
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Tags every line; set by the application that owns a single session.
        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        std::string session_id() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return session_id_;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            // stdout belongs to the CLI's session updates
            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define CHATFLOW_LOG_DEBUG(msg) ::chatflow::core::logging::Logger::get().log(::chatflow::core::logging::LogLevel::DEBUG, msg)
    #define CHATFLOW_LOG_INFO(msg)  ::chatflow::core::logging::Logger::get().log(::chatflow::core::logging::LogLevel::INFO, msg)
    #define CHATFLOW_LOG_WARN(msg)  ::chatflow::core::logging::Logger::get().log(::chatflow::core::logging::LogLevel::WARN, msg)
    #define CHATFLOW_LOG_ERROR(msg) ::chatflow::core::logging::Logger::get().log(::chatflow::core::logging::LogLevel::ERROR, msg)

} // namespace chatflow::core::logging
