//
// Build-and-Execute Orchestrator
//
// Turns a design into generated files in two stages: the generator driver
// for the design is written into a fresh workspace and compiled with the
// host C++ compiler against libsvcgen, then the driver is run on the output
// directory and its output is relayed to the caller.
//
//   Start -> DescriptionResolved -> WorkspaceStaged -> DriverWritten
//         -> Compiled -> Executed -> Done
//
// Any stage can end the run in Failed. The workspace is removed when the run
// ends unless the request asks for debugging.
//

#pragma once

#include <svcgen/generators/generators.hh>
#include <svcgen/logger.hh>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace svcgen::pipeline {

// ============================================================================
// Errors
// ============================================================================

/// The design source does not exist or cannot be read.
class description_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// "failed to compile generator: <compiler output>"
class compile_error : public std::runtime_error {
public:
    explicit compile_error(const std::string& output)
        : std::runtime_error("failed to compile generator: " + output), output_(output) {}

    [[nodiscard]] const std::string& output() const { return output_; }

private:
    std::string output_;
};

/// "generator failed: <status>\n<driver output>"
class execution_error : public std::runtime_error {
public:
    execution_error(const std::string& status, const std::string& output)
        : std::runtime_error("generator failed: " + status + "\n" + output), output_(output) {}

    [[nodiscard]] const std::string& output() const { return output_; }

private:
    std::string output_;
};

// ============================================================================
// Types
// ============================================================================

enum class Stage {
    Start,
    DescriptionResolved,
    WorkspaceStaged,
    DriverWritten,
    Compiled,
    Executed,
    Done,
    Failed
};

const char* stage_name(Stage stage);

struct GenerateRequest {
    std::vector<generators::GeneratorKind> generators;
    std::filesystem::path design;
    std::filesystem::path output_dir;
    bool scaffold = false;
    bool debug = false;     ///< Keep the workspace
};

struct OrchestratorOptions {
    std::optional<std::string> compiler;            ///< Overrides every other source
    std::vector<std::string> cxxflags;
    std::vector<std::filesystem::path> include_dirs;
    std::vector<std::filesystem::path> library_dirs;
    std::filesystem::path working_dir;              ///< Empty for the current directory
};

/// Compiler invocation settings after merging options, svcgen.yaml and defaults.
struct Toolchain {
    std::string compiler;
    std::vector<std::string> cxxflags;
    std::vector<std::filesystem::path> include_dirs;
    std::vector<std::filesystem::path> library_dirs;
    std::vector<std::string> link_flags;    ///< After -lsvcgen: what libsvcgen itself links
};

/// Name of the compiled driver inside the workspace.
inline constexpr const char* driver_binary_name = "svcgen-driver";

// ============================================================================
// Orchestrator
// ============================================================================

class Orchestrator {
public:
    Orchestrator(OrchestratorOptions options, Logger& logger);

    /**
     * Run the pipeline.
     *
     * @return Standard output of the driver (the written paths)
     * @throws description_error, pipeline::workspace_error, compile_error,
     *         execution_error, codegen errors from writing the driver
     */
    std::string generate(const GenerateRequest& request);

    /// Last stage reached; Failed once a run threw.
    [[nodiscard]] Stage stage() const { return stage_; }

    /// Compiler selection: options, then svcgen.yaml of the project holding
    /// output_dir, then $CXX, then "c++". Directories: options, svcgen.yaml,
    /// then the installation defaults.
    /// @throws config_error if svcgen.yaml is malformed
    [[nodiscard]] Toolchain resolve_toolchain(const std::filesystem::path& output_dir) const;

    /// argv compiling the driver source in the workspace.
    [[nodiscard]] static std::vector<std::string> compile_command(const Toolchain& toolchain);

    /// Design source as an absolute path: as given (relative to the working
    /// directory), then relative to each include directory.
    /// @throws description_error
    [[nodiscard]] std::filesystem::path resolve_description(const std::filesystem::path& design,
                                                            const Toolchain& toolchain) const;

private:
    OrchestratorOptions options_;
    Logger& logger_;
    Stage stage_ = Stage::Start;

    [[nodiscard]] std::filesystem::path working_dir() const;
    void advance(Stage stage);
    std::string run(const GenerateRequest& request);
};

}  // namespace svcgen::pipeline
