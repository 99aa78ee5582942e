//
// Orchestrator implementation
//

#include <svcgen/pipeline/orchestrator.hh>
#include <svcgen/codegen/writer.hh>
#include <svcgen/pipeline/driver.hh>
#include <svcgen/pipeline/process.hh>
#include <svcgen/pipeline/workspace.hh>
#include <svcgen/project.hh>
#include <svcgen/version.hh>

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace svcgen::pipeline {

namespace fs = std::filesystem;

const char* stage_name(Stage stage) {
    switch (stage) {
        case Stage::Start:               return "start";
        case Stage::DescriptionResolved: return "description resolved";
        case Stage::WorkspaceStaged:     return "workspace staged";
        case Stage::DriverWritten:       return "driver written";
        case Stage::Compiled:            return "compiled";
        case Stage::Executed:            return "executed";
        case Stage::Done:                return "done";
        case Stage::Failed:              return "failed";
    }
    return "unknown";
}

Orchestrator::Orchestrator(OrchestratorOptions options, Logger& logger)
    : options_(std::move(options))
    , logger_(logger)
{
}

fs::path Orchestrator::working_dir() const {
    return options_.working_dir.empty() ? fs::current_path() : fs::absolute(options_.working_dir);
}

void Orchestrator::advance(Stage stage) {
    stage_ = stage;
    logger_.verbose(std::string("stage: ") + stage_name(stage));
}

// ============================================================================
// Toolchain
// ============================================================================

Toolchain Orchestrator::resolve_toolchain(const fs::path& output_dir) const {
    Toolchain tc;
    tc.cxxflags = options_.cxxflags;
    tc.include_dirs = options_.include_dirs;
    tc.library_dirs = options_.library_dirs;

    std::optional<ProjectConfig> config;
    if (auto root = find_project_root(working_dir() / output_dir)) {
        config = load_project_config(*root);
    }

    if (options_.compiler) {
        tc.compiler = *options_.compiler;
    } else if (config && config->compiler) {
        tc.compiler = *config->compiler;
    } else if (const char* cxx = std::getenv("CXX"); cxx != nullptr && *cxx != '\0') {
        tc.compiler = cxx;
    } else {
        tc.compiler = "c++";
    }

    if (config) {
        tc.cxxflags.insert(tc.cxxflags.begin(), config->cxxflags.begin(), config->cxxflags.end());
        tc.include_dirs.insert(tc.include_dirs.end(), config->include_dirs.begin(), config->include_dirs.end());
        tc.library_dirs.insert(tc.library_dirs.end(), config->library_dirs.begin(), config->library_dirs.end());
    }
    tc.include_dirs.emplace_back(SVCGEN_DEFAULT_INCLUDE_DIR);
    tc.library_dirs.emplace_back(SVCGEN_DEFAULT_LIBRARY_DIR);

    const fs::path libclang(SVCGEN_LIBCLANG_LIBRARY);
    tc.link_flags = {libclang.string(), "-Wl,-rpath," + libclang.parent_path().string()};

    for (auto& dir : tc.include_dirs) {
        dir = fs::absolute(working_dir() / dir).lexically_normal();
    }
    for (auto& dir : tc.library_dirs) {
        dir = fs::absolute(working_dir() / dir).lexically_normal();
    }
    return tc;
}

std::vector<std::string> Orchestrator::compile_command(const Toolchain& toolchain) {
    std::vector<std::string> argv = {toolchain.compiler, "-std=c++20"};
    argv.insert(argv.end(), toolchain.cxxflags.begin(), toolchain.cxxflags.end());
    for (const auto& dir : toolchain.include_dirs) {
        argv.push_back("-I" + dir.string());
    }
    argv.push_back(driver_source_name);
    argv.push_back("-o");
    argv.push_back(driver_binary_name);
    for (const auto& dir : toolchain.library_dirs) {
        argv.push_back("-L" + dir.string());
    }
    argv.push_back("-lsvcgen");
    argv.insert(argv.end(), toolchain.link_flags.begin(), toolchain.link_flags.end());
    return argv;
}

fs::path Orchestrator::resolve_description(const fs::path& design, const Toolchain& toolchain) const {
    std::vector<fs::path> candidates;
    candidates.push_back(design.is_absolute() ? design : working_dir() / design);
    if (!design.is_absolute()) {
        for (const auto& dir : toolchain.include_dirs) {
            candidates.push_back(dir / design);
        }
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            continue;
        }
        std::ifstream readable(candidate);
        if (!readable) {
            throw description_error("cannot read design " + candidate.string());
        }
        fs::path resolved = fs::weakly_canonical(candidate, ec);
        return ec ? fs::absolute(candidate).lexically_normal() : resolved;
    }
    throw description_error("design " + design.string() + " not found");
}

// ============================================================================
// Pipeline
// ============================================================================

std::string Orchestrator::generate(const GenerateRequest& request) {
    stage_ = Stage::Start;
    try {
        return run(request);
    } catch (const std::exception& e) {
        logger_.debug(std::string("run failed after stage '") + stage_name(stage_) + "': " + e.what());
        stage_ = Stage::Failed;
        throw;
    }
}

std::string Orchestrator::run(const GenerateRequest& request) {
    const fs::path output_dir = fs::absolute(working_dir() / request.output_dir).lexically_normal();
    const Toolchain toolchain = resolve_toolchain(output_dir);

    DriverSpec spec;
    spec.generators = request.generators;
    spec.design = resolve_description(request.design, toolchain);
    spec.scaffold = request.scaffold;
    spec.include_dirs = toolchain.include_dirs;
    advance(Stage::DescriptionResolved);
    logger_.debug("design: " + spec.design.string());

    Workspace workspace(working_dir());
    if (request.debug) {
        workspace.keep();
        logger_.debug("workspace retained at " + workspace.path().string());
    }
    advance(Stage::WorkspaceStaged);

    codegen::NamespaceContext driver_context;
    driver_context.project_root = workspace.path();
    driver_context.namespace_name = "svcgen_driver";
    codegen::Writer writer(workspace.path(), driver_context);
    writer.set_include_dirs(toolchain.include_dirs);
    writer.write(*driver_file(spec));
    advance(Stage::DriverWritten);

    ProcessOptions compile;
    compile.argv = compile_command(toolchain);
    compile.working_dir = workspace.path();
    compile.merge_output = true;
    logger_.debug(format_command(compile.argv));
    ProcessResult compiled = run_process(compile);
    if (!compiled.success()) {
        throw compile_error(compiled.started ? compiled.stdout_text : compiled.error);
    }
    advance(Stage::Compiled);

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        throw execution_error("cannot create " + output_dir.string(), ec.message());
    }

    ProcessOptions execute;
    execute.argv = {
        (workspace.path() / driver_binary_name).string(),
        "--output=" + output_dir.string(),
        std::string("--version=") + version(),
    };
    execute.working_dir = working_dir();
    logger_.debug(format_command(execute.argv));
    ProcessResult executed = run_process(execute);
    if (!executed.success()) {
        throw execution_error(executed.describe_status(), executed.stderr_text + executed.stdout_text);
    }
    advance(Stage::Executed);

    advance(Stage::Done);
    return executed.stdout_text;
}

}  // namespace svcgen::pipeline
