#pragma once

#include <svcgen/generators/generators.hh>
#include <svcgen/logger.hh>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace svcgen::cli {

enum class Action {
    Generate,
    PrintHelp,
    PrintVersion
};

/// svcgen command line
struct CliOptions {
    Action action = Action::Generate;

    // ========================================================================
    // Generation
    // ========================================================================

    std::vector<generators::GeneratorKind> generators;  // Sorted by name, no duplicates
    std::filesystem::path design;
    std::filesystem::path output_dir = ".";              // -o, --output
    bool scaffold = false;                               // -s, --scaffold
    bool debug = false;                                  // --debug (keep workspace)

    // ========================================================================
    // Toolchain
    // ========================================================================

    std::optional<std::string> compiler;                 // --cxx
    std::vector<std::string> cxxflags;                   // --cxxflag
    std::vector<std::filesystem::path> include_dirs;     // -I
    std::vector<std::filesystem::path> library_dirs;     // -L

    // ========================================================================
    // Diagnostics
    // ========================================================================

    bool verbose = false;                                // -v, --verbose
    bool quiet = false;                                  // -q, --quiet
    ColorMode color = ColorMode::Auto;                   // --color=
};

/// Parse command-line arguments.
/// Throws std::runtime_error on invalid arguments
CliOptions parse_command_line(int argc, const char* const* argv);

/// Log level implied by -v/-q/--debug.
LogLevel log_level(const CliOptions& opts);

void print_help(const char* program_name);
void print_version();

}  // namespace svcgen::cli
