/**
 * @file logger.h
 * @brief Stream-style logging with severity levels
 */

#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <mutex>

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-chunk reads, cache hits
    INFO,     ///< Initialization progress
    WARNING,  ///< Recoverable oddities in on-disk data
    ERROR     ///< Failures reported back to the caller
};

/**
 * @brief Thread-safe logger with severity levels and formatting
 *
 * Rendering workers share one WorldIndex and may log concurrently, so every
 * message is assembled in its own LogStream and written under a single mutex.
 *
 * Usage:
 * @code
 * Logger::info() << "Discovered " << count << " region files";
 * Logger::warning() << "Chunk record out of range in " << path;
 * Logger::error() << "No regions found under " << worldRoot;
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Log stream that outputs when destroyed
     */
    class LogStream {
    public:
        LogStream(LogLevel level) : m_level(level) {}

        ~LogStream() {
            if (m_level < s_minLevel) {
                return;
            }

            std::lock_guard<std::mutex> lock(s_mutex);

            std::ostream* out = s_output;
            if (out == nullptr) {
                out = (m_level >= LogLevel::ERROR) ? &std::cerr : &std::cout;
            }

            // Colors only make sense on a terminal, never on a redirected stream
            if (s_useColors && s_output == nullptr) {
                switch (m_level) {
                    case LogLevel::DEBUG:   *out << "\033[36m[DEBUG]\033[0m "; break;
                    case LogLevel::INFO:    *out << "\033[32m[INFO]\033[0m "; break;
                    case LogLevel::WARNING: *out << "\033[33m[WARNING]\033[0m "; break;
                    case LogLevel::ERROR:   *out << "\033[31m[ERROR]\033[0m "; break;
                }
            } else {
                *out << "[" << levelName(m_level) << "] ";
            }

            *out << m_stream.str() << std::endl;
        }

        template<typename T>
        LogStream& operator<<(const T& value) {
            if (m_level >= s_minLevel) {
                m_stream << value;
            }
            return *this;
        }

    private:
        LogLevel m_level;
        std::ostringstream m_stream;
    };

    static LogStream debug() { return LogStream(LogLevel::DEBUG); }
    static LogStream info() { return LogStream(LogLevel::INFO); }
    static LogStream warning() { return LogStream(LogLevel::WARNING); }
    static LogStream error() { return LogStream(LogLevel::ERROR); }

    // ========== Configuration ==========

    /**
     * @brief Sets the minimum log level
     *
     * Messages below this level are dropped before formatting.
     */
    static void setMinLevel(LogLevel level) { s_minLevel = level; }

    static LogLevel getMinLevel() { return s_minLevel; }

    /**
     * @brief Enables or disables ANSI color prefixes on console output
     */
    static void setUseColors(bool enable) { s_useColors = enable; }

    /**
     * @brief Redirects every level to one stream
     *
     * Passing nullptr restores the default (stdout, errors on stderr).
     * The stream must outlive all logging done while it is installed.
     */
    static void setOutput(std::ostream* output) {
        std::lock_guard<std::mutex> lock(s_mutex);
        s_output = output;
    }

    /**
     * @brief Parses a level name as written in configuration files
     *
     * Accepts debug, info, warning/warn and error in any case.
     *
     * @param name Level name
     * @param level Receives the parsed level on success
     * @return False if the name is not recognized (level is left untouched)
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

    static const char* levelName(LogLevel level);

private:
    static LogLevel s_minLevel;
    static bool s_useColors;
    static std::ostream* s_output;
    static std::mutex s_mutex;
};
