#pragma once

#include <iostream>
#include <string>

namespace svcgen {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info, success
    Verbose, // + pipeline stages
    Debug    // + commands, workspace locations
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * Console logger with termcolor highlighting.
 *
 * Errors and warnings go to the error stream, everything else to the output
 * stream. Both default to the process streams; tests pass string streams.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto,
                    std::ostream& out = std::cout,
                    std::ostream& err = std::cerr);

    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// "  - message" at min_level
    void bullet(const std::string& message, LogLevel min_level = LogLevel::Normal);

    void set_level(LogLevel level) { level_ = level; }
    [[nodiscard]] LogLevel get_level() const { return level_; }

    [[nodiscard]] bool enabled(LogLevel level) const {
        return static_cast<int>(level_) >= static_cast<int>(level);
    }

private:
    LogLevel level_;
    std::ostream& out_;
    std::ostream& err_;
};

}  // namespace svcgen
