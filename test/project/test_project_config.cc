//
// Unit tests for svcgen.yaml loading and namespace resolution
//

#include <doctest/doctest.h>
#include <svcgen/codegen/namespace_context.hh>
#include <svcgen/project.hh>

#include "test_support.hh"

#include <sstream>
#include <string>

namespace fs = std::filesystem;

using namespace svcgen;
using svcgen::test::TempDir;
using svcgen::test::write_file;

namespace {

ProjectConfig parse(const std::string& yaml, const fs::path& root = "/work/cellar") {
    std::istringstream input(yaml);
    return parse_project_config(input, root);
}

}  // namespace

TEST_SUITE("Project - Config") {

    TEST_CASE("Every key") {
        auto config = parse(
            "namespace: cellar\n"
            "compiler: clang++\n"
            "cxxflags: [-O0, -g]\n"
            "include_dirs: [third_party/include, /opt/include]\n"
            "library_dirs:\n"
            "  - build/lib\n");

        CHECK(config.root == fs::path("/work/cellar"));
        CHECK(config.namespace_name == "cellar");
        REQUIRE(config.compiler.has_value());
        CHECK(*config.compiler == "clang++");
        CHECK(config.cxxflags == std::vector<std::string>{"-O0", "-g"});
        CHECK(config.include_dirs == std::vector<fs::path>{"/work/cellar/third_party/include", "/opt/include"});
        CHECK(config.library_dirs == std::vector<fs::path>{"/work/cellar/build/lib"});
    }

    TEST_CASE("Defaults") {
        SUBCASE("Unset keys") {
            auto config = parse("cxxflags: []\n");
            CHECK(config.namespace_name == "cellar");
            CHECK_FALSE(config.compiler.has_value());
            CHECK(config.cxxflags.empty());
        }

        SUBCASE("Namespace from the directory name") {
            auto config = parse("compiler: g++\n", "/work/my-api");
            CHECK(config.namespace_name == "my_api");
        }
    }

    TEST_CASE("Malformed configuration") {
        CHECK_THROWS_AS(parse("- a\n- b\n"), config_error);
        CHECK_THROWS_AS(parse("cxxflags: -O0\n"), config_error);
        CHECK_THROWS_AS(parse("cxxflags: [1, 2]\n"), config_error);
        CHECK_THROWS_AS(parse("compiler: [a]\n"), config_error);
        CHECK_THROWS_AS(parse("namespace: \"\"\n"), config_error);
    }

    TEST_CASE("Namespace must be usable in C++") {
        CHECK(parse("namespace: \"cellar::api\"\n").namespace_name == "cellar::api");
        CHECK_THROWS_WITH_AS(parse("namespace: my-app\n"),
                             "'namespace' must be a C++ namespace name, got 'my-app'", config_error);
        CHECK_THROWS_AS(parse("namespace: \"cellar::\"\n"), config_error);
        CHECK_THROWS_AS(parse("namespace: \"::cellar\"\n"), config_error);
        CHECK_THROWS_AS(parse("namespace: \"a:::b\"\n"), config_error);
        CHECK_THROWS_AS(parse("namespace: 2fa\n"), config_error);

        CHECK(is_namespace_name("a::b_2::c"));
        CHECK_FALSE(is_namespace_name(""));
        CHECK_FALSE(is_namespace_name("a b"));
    }

    TEST_CASE("Identifiers") {
        CHECK(to_identifier("cellar") == "cellar");
        CHECK(to_identifier("my-api") == "my_api");
        CHECK(to_identifier("v1.2") == "v1_2");
        CHECK(to_identifier("2fa") == "_2fa");
        CHECK(to_identifier("") == "_");
    }

    TEST_CASE("Project root lookup") {
        TempDir tmp;
        const fs::path root = fs::canonical(tmp.path());

        CHECK_FALSE(find_project_root(tmp.path() / "a" / "b").has_value());

        write_file(tmp.path() / "svcgen.yaml", "namespace: cellar\n");
        fs::create_directories(tmp.path() / "a" / "b");

        CHECK(find_project_root(tmp.path()) == root);
        CHECK(find_project_root(tmp.path() / "a" / "b") == root);
        // The start directory does not need to exist
        CHECK(find_project_root(tmp.path() / "gen" / "services") == root);

        write_file(tmp.path() / "a" / "svcgen.yaml", "namespace: inner\n");
        CHECK(find_project_root(tmp.path() / "a" / "b") == root / "a");
    }

    TEST_CASE("Loading from disk") {
        TempDir tmp;
        CHECK_THROWS_AS(load_project_config(tmp.path()), config_error);

        write_file(tmp.path() / "svcgen.yaml", "namespace: [oops]\n");
        CHECK_THROWS_WITH_AS(load_project_config(tmp.path()),
                             doctest::Contains("svcgen.yaml: 'namespace' must be a string"), config_error);
    }
}

TEST_SUITE("Project - Namespace context") {

    TEST_CASE("Resolved from the directory below the root") {
        TempDir tmp;
        write_file(tmp.path() / "svcgen.yaml", "namespace: cellar\n");

        auto top = codegen::resolve_namespace_context(tmp.path());
        CHECK(top.project_root == fs::canonical(tmp.path()));
        CHECK(top.include_prefix.empty());
        CHECK(top.namespace_name == "cellar");

        auto nested = codegen::resolve_namespace_context(tmp.path() / "api" / "v-2");
        CHECK(nested.include_prefix == "api/v-2");
        CHECK(nested.namespace_name == "cellar::api::v_2");
        CHECK(nested.qualify("gen::services") == "cellar::api::v_2::gen::services");
    }

    TEST_CASE("Outside any project") {
        TempDir tmp;
        CHECK_THROWS_AS(codegen::resolve_namespace_context(tmp.path()), codegen::namespace_resolution_error);
    }

    TEST_CASE("Malformed configuration") {
        TempDir tmp;
        write_file(tmp.path() / "svcgen.yaml", "namespace: [x]\n");
        CHECK_THROWS_AS(codegen::resolve_namespace_context(tmp.path()), codegen::namespace_resolution_error);
    }
}
