/**
 * @file logger.hpp
 * @brief Console logging for the engine and tools
 */

#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <unistd.h>

namespace Meisai {

/**
 * @brief Process-wide, thread-safe console logger.
 *
 * Errors and warnings go to stderr, everything else to stdout. ANSI colour
 * is applied only when the stream is a terminal, so redirected logs stay clean.
 */
class Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error,
        Bulk
    };

    /**
     * @brief Suppress every level ranked below @p level.
     *
     * Bulk ranks with Info; the rest rank in declaration order.
     */
    static void set_level(Level level) { threshold().store(rank(level)); }

    static void log(Level level, const std::string& message) {
        if (rank(level) < threshold().load()) return;

        const bool to_err = level == Level::Error || level == Level::Warning;
        std::ostream& out = to_err ? std::cerr : std::cout;
        const bool tty = isatty(to_err ? STDERR_FILENO : STDOUT_FILENO) != 0;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);
        if (tty) out << colour(level);
        out << tag(level) << message;
        if (tty) out << "\033[0m";
        out << std::endl;
    }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }
    static void bulk(const std::string& msg)    { log(Level::Bulk, msg); }

private:
    static int rank(Level level) {
        return level == Level::Bulk ? 0 : static_cast<int>(level);
    }

    static const char* tag(Level level) {
        switch (level) {
            case Level::Info:    return "[info] ";
            case Level::Step:    return "[step] ";
            case Level::Success: return "[ ok ] ";
            case Level::Warning: return "[warn] ";
            case Level::Error:   return "[fail] ";
            case Level::Bulk:    return "[bulk] ";
        }
        return "";
    }

    static const char* colour(Level level) {
        switch (level) {
            case Level::Info:    return "\033[0;36m";
            case Level::Step:    return "\033[1;33m";
            case Level::Success: return "\033[0;32m";
            case Level::Warning: return "\033[1;33m";
            case Level::Error:   return "\033[0;31m";
            case Level::Bulk:    return "\033[0;35m";
        }
        return "";
    }

    static std::atomic<int>& threshold() {
        static std::atomic<int> level{0};
        return level;
    }
};

} // namespace Meisai
