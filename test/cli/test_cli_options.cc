//
// Unit tests for svcgen command-line parsing
//

#include <doctest/doctest.h>

#include "cli_options.hh"

#include <initializer_list>
#include <stdexcept>
#include <vector>

using namespace svcgen;
using namespace svcgen::cli;
using generators::GeneratorKind;

namespace {

CliOptions parse(std::initializer_list<const char*> args) {
    std::vector<const char*> argv = {"svcgen"};
    argv.insert(argv.end(), args.begin(), args.end());
    return parse_command_line(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST_SUITE("CLI - Options") {

    TEST_CASE("Design only runs every generator") {
        auto opts = parse({"design/account_design.cc"});

        CHECK(opts.action == Action::Generate);
        CHECK(opts.design == "design/account_design.cc");
        CHECK(opts.output_dir == ".");
        CHECK(opts.generators == std::vector<GeneratorKind>{
            GeneratorKind::Client, GeneratorKind::OpenAPI, GeneratorKind::Server});
        CHECK_FALSE(opts.scaffold);
        CHECK(log_level(opts) == LogLevel::Normal);
    }

    TEST_CASE("Commands are sorted and deduplicated") {
        auto opts = parse({"server", "openapi", "server", "design.cc"});
        CHECK(opts.generators == std::vector<GeneratorKind>{GeneratorKind::OpenAPI, GeneratorKind::Server});
    }

    TEST_CASE("Output directory spellings") {
        CHECK(parse({"-o", "gen", "d.cc"}).output_dir == "gen");
        CHECK(parse({"-ogen", "d.cc"}).output_dir == "gen");
        CHECK(parse({"--output", "gen", "d.cc"}).output_dir == "gen");
        CHECK(parse({"d.cc", "--output=gen"}).output_dir == "gen");

        CHECK_THROWS_AS(parse({"d.cc", "-o"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"d.cc", "--output="}), std::runtime_error);
    }

    TEST_CASE("Toolchain options") {
        auto opts = parse({"--cxx", "clang++", "--cxxflag=-O0", "--cxxflag", "-g",
                           "-I", "inc", "-Ithird_party", "-L", "lib", "d.cc"});

        REQUIRE(opts.compiler.has_value());
        CHECK(*opts.compiler == "clang++");
        CHECK(opts.cxxflags == std::vector<std::string>{"-O0", "-g"});
        CHECK(opts.include_dirs == std::vector<std::filesystem::path>{"inc", "third_party"});
        CHECK(opts.library_dirs == std::vector<std::filesystem::path>{"lib"});
    }

    TEST_CASE("Flags") {
        auto opts = parse({"-s", "--debug", "--color=never", "d.cc"});
        CHECK(opts.scaffold);
        CHECK(opts.debug);
        CHECK(opts.color == ColorMode::Never);
        CHECK(log_level(opts) == LogLevel::Debug);

        CHECK(log_level(parse({"-v", "d.cc"})) == LogLevel::Verbose);
        CHECK(log_level(parse({"--quiet", "d.cc"})) == LogLevel::Quiet);
    }

    TEST_CASE("Help and version") {
        CHECK(parse({"--help"}).action == Action::PrintHelp);
        CHECK(parse({"-h", "--bogus"}).action == Action::PrintHelp);
        CHECK(parse({"--version"}).action == Action::PrintVersion);
        CHECK(parse({"version"}).action == Action::PrintVersion);
    }

    TEST_CASE("Invalid command lines") {
        CHECK_THROWS_WITH_AS(parse({}), "No design file specified (run with --help for usage)",
                             std::runtime_error);
        CHECK_THROWS_WITH_AS(parse({"server"}), "No design file specified (run with --help for usage)",
                             std::runtime_error);
        CHECK_THROWS_WITH_AS(parse({"a.cc", "b.cc"}), "Unexpected argument: b.cc", std::runtime_error);
        CHECK_THROWS_WITH_AS(parse({"--frobnicate", "a.cc"}), "Unknown option: --frobnicate",
                             std::runtime_error);
        CHECK_THROWS_AS(parse({"-v", "-q", "a.cc"}), std::runtime_error);
        CHECK_THROWS_AS(parse({"--color=purple", "a.cc"}), std::runtime_error);
    }

    TEST_CASE("Commands after the design are designs") {
        CHECK_THROWS_WITH_AS(parse({"a.cc", "server"}), "Unexpected argument: server", std::runtime_error);
    }
}
