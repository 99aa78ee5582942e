#include "cli_options.hh"

#include <svcgen/version.hh>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace svcgen::cli {

using generators::GeneratorKind;

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Value of "-oDIR", "-o DIR", "--output=DIR" or "--output DIR".
static std::optional<std::string> take_value(int argc, const char* const* argv, int& i,
                                             const char* short_flag, const char* long_flag) {
    const char* arg = argv[i];
    std::string value;
    bool matched = false;

    if (short_flag != nullptr && starts_with(arg, short_flag)) {
        value = arg + std::strlen(short_flag);
        matched = true;
    } else if (long_flag != nullptr && std::strcmp(arg, long_flag) == 0) {
        matched = true;
    } else if (long_flag != nullptr && starts_with(arg, long_flag) &&
               arg[std::strlen(long_flag)] == '=') {
        value = arg + std::strlen(long_flag) + 1;
        if (value.empty()) {
            throw std::runtime_error(std::string("Option ") + long_flag + " requires argument");
        }
        return value;
    }

    if (!matched) {
        return std::nullopt;
    }
    if (value.empty() && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + (short_flag ? short_flag : long_flag) +
                                 " requires argument");
    }
    return value;
}

static bool is_command(const std::string& arg) {
    return arg == "server" || arg == "client" || arg == "openapi";
}

// ============================================================================
// Main Parser
// ============================================================================

CliOptions parse_command_line(int argc, const char* const* argv) {
    CliOptions opts;
    std::vector<std::string> commands;
    bool have_design = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            opts.action = Action::PrintHelp;
            return opts;
        }

        if (std::strcmp(arg, "--version") == 0) {
            opts.action = Action::PrintVersion;
            return opts;
        }

        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--scaffold") == 0) {
            opts.scaffold = true;
            continue;
        }

        if (std::strcmp(arg, "--debug") == 0) {
            opts.debug = true;
            continue;
        }

        if (auto value = take_value(argc, argv, i, "-o", "--output")) {
            opts.output_dir = *value;
            continue;
        }

        if (auto value = take_value(argc, argv, i, "-I", nullptr)) {
            opts.include_dirs.emplace_back(*value);
            continue;
        }

        if (auto value = take_value(argc, argv, i, "-L", nullptr)) {
            opts.library_dirs.emplace_back(*value);
            continue;
        }

        if (auto value = take_value(argc, argv, i, nullptr, "--cxx")) {
            opts.compiler = *value;
            continue;
        }

        if (auto value = take_value(argc, argv, i, nullptr, "--cxxflag")) {
            opts.cxxflags.push_back(*value);
            continue;
        }

        if (starts_with(arg, "--color=")) {
            std::string mode = arg + std::strlen("--color=");
            if (mode == "auto") {
                opts.color = ColorMode::Auto;
            } else if (mode == "always") {
                opts.color = ColorMode::Always;
            } else if (mode == "never") {
                opts.color = ColorMode::Never;
            } else {
                throw std::runtime_error("Invalid color mode: " + mode + " (expected: auto, always, never)");
            }
            continue;
        }

        if (arg[0] == '-' && arg[1] != '\0') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Positional: "version", commands, then the design
        const std::string positional = arg;
        if (!have_design && commands.empty() && positional == "version") {
            opts.action = Action::PrintVersion;
            return opts;
        }
        if (!have_design && is_command(positional)) {
            commands.push_back(positional);
            continue;
        }
        if (have_design) {
            throw std::runtime_error("Unexpected argument: " + positional);
        }
        opts.design = positional;
        have_design = true;
    }

    if (!have_design) {
        throw std::runtime_error("No design file specified (run with --help for usage)");
    }
    if (opts.verbose && opts.quiet) {
        throw std::runtime_error("Options -v and -q are mutually exclusive");
    }

    if (commands.empty()) {
        commands = {"client", "openapi", "server"};
    }
    std::sort(commands.begin(), commands.end());
    commands.erase(std::unique(commands.begin(), commands.end()), commands.end());
    for (const auto& c : commands) {
        opts.generators.push_back(generators::parse_generator_kind(c));
    }

    return opts;
}

LogLevel log_level(const CliOptions& opts) {
    if (opts.debug) return LogLevel::Debug;
    if (opts.verbose) return LogLevel::Verbose;
    if (opts.quiet) return LogLevel::Quiet;
    return LogLevel::Normal;
}

// ============================================================================
// Help
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [COMMAND...] DESIGN [OPTIONS]\n"
              << "       " << program_name << " version\n\n"
              << "Generate service code from the design DESIGN (a C++ source using SVCGEN_DESIGN).\n\n"
              << "Commands (default: all of them):\n"
              << "  server                  Service interfaces and HTTP server transport\n"
              << "  client                  HTTP client transport\n"
              << "  openapi                 OpenAPI document\n\n"
              << "Options:\n"
              << "  -o, --output DIR        Output directory (default: current directory)\n"
              << "  -s, --scaffold          Also generate service implementation stubs\n"
              << "      --debug             Keep the generator workspace and log commands\n"
              << "  -I DIR                  Include directory for the generator build and design lookup\n"
              << "  -L DIR                  Library directory for the generator build\n"
              << "      --cxx PATH          C++ compiler (default: svcgen.yaml, $CXX, c++)\n"
              << "      --cxxflag FLAG      Extra compiler flag (repeatable)\n"
              << "  -v, --verbose           Report pipeline stages\n"
              << "  -q, --quiet             Errors only\n"
              << "      --color=MODE        auto, always or never\n"
              << "  -h, --help              Show this message\n"
              << "      --version           Show the svcgen version\n";
}

void print_version() {
    std::cout << "svcgen " << version() << "\n";
}

}  // namespace svcgen::cli
