#include <svcgen/logger.hh>

#include <termcolor/termcolor.hpp>

namespace svcgen {

Logger::Logger(LogLevel level, ColorMode color, std::ostream& out, std::ostream& err)
    : level_(level)
    , out_(out)
    , err_(err)
{
    switch (color) {
        case ColorMode::Always:
            out_ << termcolor::colorize;
            err_ << termcolor::colorize;
            break;
        case ColorMode::Never:
            out_ << termcolor::nocolorize;
            err_ << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            break;
    }
}

void Logger::error(const std::string& message) {
    err_ << termcolor::bold << termcolor::red
         << "error: " << termcolor::reset
         << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!enabled(LogLevel::Normal)) return;

    err_ << termcolor::bold << termcolor::yellow
         << "warning: " << termcolor::reset
         << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!enabled(LogLevel::Normal)) return;

    out_ << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!enabled(LogLevel::Normal)) return;

    out_ << termcolor::bold << termcolor::green
         << "ok: " << termcolor::reset
         << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!enabled(LogLevel::Verbose)) return;

    out_ << termcolor::cyan << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!enabled(LogLevel::Debug)) return;

    out_ << termcolor::magenta
         << "[debug] " << termcolor::reset
         << message << "\n";
}

void Logger::bullet(const std::string& message, LogLevel min_level) {
    if (!enabled(min_level)) return;

    out_ << "  - " << message << "\n";
}

}  // namespace svcgen
