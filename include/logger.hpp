/*
* @license
* (C) zachbabanov
*
*/

#ifndef FRAMECAST_LOGGER_HPP
#define FRAMECAST_LOGGER_HPP

#pragma once

#include <fstream>
#include <iterator>
#include <string>
#include <atomic>
#include <mutex>

#include <fmt/core.h>

namespace framecast::log {

/**
 * @brief Log level enumeration
 */
    enum class Level {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

/**
 * @brief Categories to attach to each log line.
 */
    enum class Category {
        GENERAL,
        VIDEO,
        REGISTRY,
        ASSEMBLY,
        NETWORK
    };

/**
 * @brief Thread-safe singleton logger using fmt for formatting.
 *
 * Usage:
 *   Logger::instance().log(Level::INFO, Category::GENERAL, "message", __FILE__, __LINE__);
 *   LOG_GEN_INFO("Hello {}", name);
 */
    class Logger {
    public:
        static Logger &instance();

        /// Set global minimal log level (messages below will be ignored)
        void set_level(Level l);
        Level level() const;

        /// Open file to duplicate logs into
        bool open_logfile(const std::string &path);

        /// Close log file
        void close_logfile();

        /// Core logging call: prints a ready message
        void log(Level lvl, Category cat, const std::string &msg, const char *file = nullptr, int line = 0);

        /**
         * @brief logf - convenience template that formats a message using fmt.
         *
         * Formatting is skipped entirely when the level is filtered out, so hot paths
         * (per-chunk TRACE lines) cost one atomic load.
         */
        template<typename... Args>
        void logf(Level lvl, Category cat, const char *file, int line, const char *fmt_str, Args&&... args) {
            if (lvl < min_level_.load()) return;
            std::string msg;
            try {
                if (fmt_str && fmt_str[0] != '\0') {
                    fmt::format_to(std::back_inserter(msg), fmt::runtime(fmt_str), std::forward<Args>(args)...);
                }
            } catch (const std::exception &e) {
                // formatting error: keep the raw format string so the line is not lost
                msg = std::string("[format_error:") + e.what() + "] " + (fmt_str ? fmt_str : "");
            }
            log(lvl, cat, msg, file, line);
        }

    private:
        Logger();
        ~Logger();

        std::mutex mtx_;
        std::ofstream file_;
        std::atomic<Level> min_level_;

        std::string timestamp_now();

        // non-copyable
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
    };

    /// Parse "trace|debug|info|warn|error"; returns false for unknown names.
    bool parse_level(const std::string &s, Level &out);

// Convenience macros for easy calls (automatically add file:line)
#define LOG_GEN_TRACE(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::TRACE, framecast::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_DEBUG(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::DEBUG, framecast::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_INFO(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::INFO,  framecast::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_WARN(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::WARN,  framecast::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_ERROR(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::ERROR, framecast::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_VIDEO_TRACE(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::TRACE, framecast::log::Category::VIDEO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_DEBUG(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::DEBUG, framecast::log::Category::VIDEO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_INFO(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::INFO,  framecast::log::Category::VIDEO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_WARN(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::WARN,  framecast::log::Category::VIDEO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_VIDEO_ERROR(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::ERROR, framecast::log::Category::VIDEO, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_REG_TRACE(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::TRACE, framecast::log::Category::REGISTRY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_REG_DEBUG(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::DEBUG, framecast::log::Category::REGISTRY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_REG_INFO(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::INFO,  framecast::log::Category::REGISTRY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_REG_WARN(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::WARN,  framecast::log::Category::REGISTRY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_REG_ERROR(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::ERROR, framecast::log::Category::REGISTRY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_ASM_TRACE(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::TRACE, framecast::log::Category::ASSEMBLY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ASM_DEBUG(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::DEBUG, framecast::log::Category::ASSEMBLY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ASM_INFO(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::INFO,  framecast::log::Category::ASSEMBLY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ASM_WARN(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::WARN,  framecast::log::Category::ASSEMBLY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ASM_ERROR(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::ERROR, framecast::log::Category::ASSEMBLY, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_NET_TRACE(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::TRACE, framecast::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_DEBUG(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::DEBUG, framecast::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_INFO(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::INFO,  framecast::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_WARN(fmt, ...)  framecast::log::Logger::instance().logf(framecast::log::Level::WARN,  framecast::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_ERROR(fmt, ...) framecast::log::Logger::instance().logf(framecast::log::Level::ERROR, framecast::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

} // namespace framecast::log

#endif // FRAMECAST_LOGGER_HPP
