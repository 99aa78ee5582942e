//
// Unit tests for templates, sections and the common file sections
//

#include <doctest/doctest.h>
#include <svcgen/codegen/file.hh>
#include <svcgen/codegen/section.hh>
#include <svcgen/version.hh>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace svcgen::codegen;

namespace {

std::string render(const Section& section) {
    std::ostringstream out;
    section.write(out);
    return out.str();
}

}  // namespace

TEST_SUITE("Codegen - Sections") {

    TEST_CASE("Template renders bound data") {
        auto tmpl = make_template<std::string>("greeting",
            [](CppCodeWriter& w, const std::string& name) {
                w.write_line("// hello " + name);
            });

        Section world(tmpl, std::string("world"));
        Section moon(tmpl, std::string("moon"));

        CHECK(world.template_name() == "greeting");
        CHECK(render(world) == "// hello world\n");
        CHECK(render(moon) == "// hello moon\n");
        // Sections can be rendered more than once
        CHECK(render(world) == "// hello world\n");
    }

    TEST_CASE("Template failures name the template") {
        auto tmpl = make_template<int>("broken",
            [](CppCodeWriter&, const int& value) {
                throw std::out_of_range("value " + std::to_string(value) + " is out of range");
            });

        Section section(tmpl, 7);
        try {
            render(section);
            FAIL("expected render_error");
        } catch (const render_error& e) {
            CHECK(std::string(e.what()) == "template broken: value 7 is out of range");
            CHECK(e.template_name() == "broken");
        }
    }

    TEST_CASE("Nested render errors are not wrapped twice") {
        auto inner = make_template<int>("inner",
            [](CppCodeWriter&, const int&) { throw std::runtime_error("boom"); });
        auto outer = make_template<int>("outer",
            [inner](CppCodeWriter&, const int& value) {
                std::ostringstream sink;
                inner->execute(sink, value);
            });

        CHECK_THROWS_WITH_AS(render(Section(outer, 1)), "template inner: boom", render_error);
    }

    TEST_CASE("Header section") {
        FileHeader header;
        header.title = "account service interface";
        header.namespace_name = "cellar::gen::services";
        header.pragma_once = true;
        header.system_includes = {"string"};
        header.includes = {"svcgen/rest.hh"};
        header.imports = {ImportSpec{"rest", "::svcgen::rest"}};

        const std::string expected =
            "// Code generated by svcgen v" + std::string(svcgen::version()) + ", DO NOT EDIT.\n"
            "//\n"
            "// account service interface\n"
            "\n"
            "#pragma once\n"
            "\n"
            "#include <string>\n"
            "\n"
            "#include \"svcgen/rest.hh\"\n"
            "\n"
            "namespace cellar::gen::services {\n"
            "\n"
            "namespace rest = ::svcgen::rest;\n"
            "\n";
        CHECK(render(header_section(header)) == expected);
    }

    TEST_CASE("Footer section") {
        CHECK(render(footer_section("cellar::gen")) == "\n}  // namespace cellar::gen\n");
        CHECK(render(footer_section("")) == "");
    }
}

TEST_SUITE("Codegen - Files") {

    TEST_CASE("Import code") {
        CHECK(ImportSpec{"fs", "::std::filesystem"}.code() == "namespace fs = ::std::filesystem;");
        CHECK(ImportSpec{std::nullopt, "::svcgen::rest::Request"}.code() == "using ::svcgen::rest::Request;");
        CHECK(ImportSpec{"", "::a::B"}.code() == "using ::a::B;");
    }

    TEST_CASE("Unique paths") {
        PathSet reserved;
        CHECK(unique_path("gen/openapi.yaml", reserved) == "gen/openapi.yaml");

        reserved.insert("gen/openapi.yaml");
        CHECK(unique_path("gen/openapi.yaml", reserved) == "gen/openapi_1.yaml");

        reserved.insert("gen/openapi_1.yaml");
        CHECK(unique_path("gen/openapi.yaml", reserved) == "gen/openapi_2.yaml");

        SUBCASE("Spelling does not matter") {
            CHECK(unique_path("gen/./openapi.yaml", reserved) == "gen/openapi_2.yaml");
            CHECK(unique_path("gen/x/../openapi.yaml", reserved) == "gen/openapi_2.yaml");
            CHECK(unique_path("gen/./other.yaml", reserved) == "gen/./other.yaml");
        }

        SUBCASE("Exhausted") {
            PathSet full{"x.txt"};
            for (int n = 1; n < 100; ++n) {
                full.insert("x_" + std::to_string(n) + ".txt");
            }
            CHECK_THROWS_AS((void)unique_path("x.txt", full), path_collision_error);
        }
    }

    TEST_CASE("Namespace context") {
        NamespaceContext root{"/p", "", "cellar"};
        CHECK(root.include_path("gen/services/account.hh") == "gen/services/account.hh");
        CHECK(root.qualify("gen::services") == "cellar::gen::services");
        CHECK(root.qualify("") == "cellar");

        NamespaceContext nested{"/p", "api/v1", "cellar::api::v1"};
        CHECK(nested.include_path("gen/services/account.hh") == "api/v1/gen/services/account.hh");
        CHECK(nested.qualify("gen") == "cellar::api::v1::gen");
    }
}
