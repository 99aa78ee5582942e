#include <iostream>

#include <svcgen/pipeline/orchestrator.hh>

#include "cli_options.hh"

int main(int argc, char* argv[]) {
    using namespace svcgen;

    cli::CliOptions opts;
    try {
        opts = cli::parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        Logger logger;
        logger.error(e.what());
        return 1;
    }

    switch (opts.action) {
        case cli::Action::PrintHelp:
            cli::print_help(argv[0]);
            return 0;
        case cli::Action::PrintVersion:
            cli::print_version();
            return 0;
        case cli::Action::Generate:
            break;
    }

    Logger logger(cli::log_level(opts), opts.color);

    try {
        pipeline::OrchestratorOptions options;
        options.compiler = opts.compiler;
        options.cxxflags = opts.cxxflags;
        options.include_dirs = opts.include_dirs;
        options.library_dirs = opts.library_dirs;

        pipeline::GenerateRequest request;
        request.generators = opts.generators;
        request.design = opts.design;
        request.output_dir = opts.output_dir;
        request.scaffold = opts.scaffold;
        request.debug = opts.debug;

        pipeline::Orchestrator orchestrator(options, logger);
        std::cout << orchestrator.generate(request);
        return 0;
    } catch (const std::exception& e) {
        logger.error(e.what());
        return 1;
    }
}
