//
// Unit tests for the generator driver source
//

#include <doctest/doctest.h>
#include <svcgen/codegen/writer.hh>
#include <svcgen/pipeline/driver.hh>

#include "test_support.hh"

#include <string>

using namespace svcgen;
using namespace svcgen::pipeline;
using generators::GeneratorKind;
using svcgen::test::TempDir;

namespace {

std::string render_driver(const DriverSpec& spec, const std::filesystem::path& dir) {
    codegen::Writer writer(dir, codegen::NamespaceContext{dir, "", "svcgen_driver"});
    return svcgen::test::read_file(writer.write(*driver_file(spec)));
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_SUITE("Pipeline - Driver") {

    TEST_CASE("Generators to run") {
        DriverSpec spec;
        spec.generators = {GeneratorKind::OpenAPI, GeneratorKind::Server};
        CHECK(driver_generators(spec) == spec.generators);

        spec.scaffold = true;
        CHECK(driver_generators(spec) ==
              std::vector<GeneratorKind>{GeneratorKind::OpenAPI, GeneratorKind::Server, GeneratorKind::Scaffold});

        spec.generators.push_back(GeneratorKind::Scaffold);
        CHECK(driver_generators(spec).size() == 3);
    }

    TEST_CASE("Driver source") {
        TempDir tmp;
        DriverSpec spec;
        spec.generators = {GeneratorKind::Server, GeneratorKind::OpenAPI};
        spec.design = "/work/design/account_design.cc";

        const std::string code = render_driver(spec, tmp.path());

        CHECK(driver_file(spec)->output_path({}) == "main.cc");
        CHECK(code.rfind("// Code generated by svcgen v", 0) == 0);

        SUBCASE("Includes the design") {
            CHECK(contains(code, "\n#include \"/work/design/account_design.cc\"\n"));
            CHECK(contains(code, "#include <svcgen/generators/generators.hh>\n"));
        }

        SUBCASE("Only used imports remain") {
            CHECK(contains(code, "namespace codegen = ::svcgen::codegen;\n"));
            CHECK(contains(code, "namespace eval = ::svcgen::eval;\n"));
            CHECK(contains(code, "namespace fs = ::std::filesystem;\n"));
            CHECK_FALSE(contains(code, "namespace dsl ="));
        }

        SUBCASE("Checks its flags") {
            CHECK(contains(code, "int main(int argc, char** argv) {\n"));
            CHECK(contains(code, "        if (arg.rfind(\"--output=\", 0) == 0) {\n"
                                 "            output = arg.substr(9);\n"
                                 "        } else if (arg.rfind(\"--version=\", 0) == 0) {\n"));
            CHECK(contains(code, "return fail(\"missing --output flag\");"));
            CHECK(contains(code, "return fail(\"missing --version flag\");"));
            CHECK(contains(code, "    if (version != ::svcgen::version()) {\n"));
            CHECK(contains(code, "        std::string message = \"svcgen was run with version \" + version;\n"
                                 "        message += \" but the compiled generator is running \";\n"
                                 "        message += ::svcgen::version();\n"
                                 "        return fail(message);\n"));
        }

        SUBCASE("Runs the generators in order") {
            const auto server = code.find("        for (auto& file : generators::server(roots)) {\n"
                                          "            files.push_back(std::move(file));\n"
                                          "        }\n");
            const auto openapi = code.find("for (auto& file : generators::openapi(roots)) {");
            REQUIRE(server != std::string::npos);
            REQUIRE(openapi != std::string::npos);
            CHECK(server < openapi);
            CHECK_FALSE(contains(code, "generators::client(roots)"));
            CHECK_FALSE(contains(code, "generators::scaffold(roots)"));
        }

        SUBCASE("Writes, then prints sorted paths") {
            CHECK(contains(code, "        codegen::Writer writer(output);\n"));
            CHECK(contains(code, "        std::sort(outputs.begin(), outputs.end());\n"));
            CHECK(contains(code, "    } catch (const std::exception& e) {\n"
                                 "        return fail(e.what());\n"
                                 "    }\n"
                                 "    return 0;\n"
                                 "}\n"));
        }

        SUBCASE("Failure helper") {
            CHECK(contains(code, "namespace {\n"
                                 "int fail(const std::string& message) {\n"
                                 "    std::cerr << message << std::endl;\n"
                                 "    return 1;\n"
                                 "}\n"
                                 "}  // namespace\n"
                                 "\n"
                                 "int main("));
        }
    }

    TEST_CASE("Include directories reach the writer") {
        TempDir tmp;
        DriverSpec spec;
        spec.generators = {GeneratorKind::Server};
        spec.design = "/work/design.cc";

        CHECK_FALSE(contains(render_driver(spec, tmp.path()), "set_include_dirs"));

        TempDir other;
        spec.include_dirs = {"/opt/svcgen/include", "/work/inc"};
        CHECK(contains(render_driver(spec, other.path()),
                       "        codegen::Writer writer(output);\n"
                       "        writer.set_include_dirs({\"/opt/svcgen/include\", \"/work/inc\"});\n"));
    }

    TEST_CASE("Scaffold runs last") {
        TempDir tmp;
        DriverSpec spec;
        spec.generators = {GeneratorKind::Client};
        spec.design = "/work/design.cc";
        spec.scaffold = true;

        const std::string code = render_driver(spec, tmp.path());
        const auto client = code.find("generators::client(roots)");
        const auto scaffold = code.find("generators::scaffold(roots)");
        REQUIRE(client != std::string::npos);
        REQUIRE(scaffold != std::string::npos);
        CHECK(client < scaffold);
    }

    TEST_CASE("Driver source is stable") {
        TempDir a;
        TempDir b;
        DriverSpec spec;
        spec.generators = {GeneratorKind::Client, GeneratorKind::OpenAPI, GeneratorKind::Server};
        spec.design = "/work/design.cc";

        CHECK(render_driver(spec, a.path()) == render_driver(spec, b.path()));
    }
}
