#pragma once

#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace NewsCube {

/**
 * @brief Thread-safe console logger for the pipeline stages.
 *
 * Messages below the configured minimum level are dropped.
 */
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info,
        Step,
        Batch,
        Success,
        Warning,
        Error,
        Off
    };

    static void log(Level level, const std::string& message) {
        if (level < min_level() || level == Level::Off) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;37m"; prefix = "... ";     break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== ";     break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> ";     break; // Yellow
            case Level::Batch:   color = "\033[0;35m"; prefix = "[BATCH] "; break; // Magenta
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";       break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";       break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";       break; // Red
            case Level::Off:     return;
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void batch(const std::string& msg)   { log(Level::Batch, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

    static void set_level(Level level) { threshold().store(level); }
    static Level min_level() { return threshold().load(); }

    /**
     * @brief Parse a level name ("debug", "info", "warn", "error", "off").
     * @throws std::invalid_argument on an unknown name
     */
    static Level parse_level(const std::string& name);

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }
};

inline Logger::Level Logger::parse_level(const std::string& name) {
    std::string n;
    for (char c : name) n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (n == "debug") return Level::Debug;
    if (n == "info") return Level::Info;
    if (n == "step") return Level::Step;
    if (n == "warn" || n == "warning") return Level::Warning;
    if (n == "error") return Level::Error;
    if (n == "off" || n == "quiet") return Level::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace NewsCube
