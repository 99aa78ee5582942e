//
// Unit tests for the source formatter: canonical layout, import pruning and
// diagnostics for malformed input
//

#include <doctest/doctest.h>
#include <svcgen/codegen/source_formatter.hh>

#include "test_support.hh"

#include <string>

using namespace svcgen::codegen;
using svcgen::test::TempDir;
using svcgen::test::write_file;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_SUITE("Codegen - SourceFormatter") {

    // ========================================================================
    // Layout
    // ========================================================================

    TEST_CASE("Canonical layout") {
        SUBCASE("Operators and bodies") {
            CHECK(SourceFormatter().format("int f(int a,int b){return a+b;}\n") ==
                  "int f(int a, int b) {\n"
                  "    return a + b;\n"
                  "}\n");
        }

        SUBCASE("Namespace bodies are not indented") {
            const std::string input =
                "namespace a {\n"
                "   struct  X {\n"
                " int y;   // trailing   \n"
                "\n"
                "};\n"
                "}  // namespace a\n";

            CHECK(SourceFormatter().format(input) ==
                  "namespace a {\n"
                  "struct X {\n"
                  "    int y;  // trailing\n"
                  "};\n"
                  "}  // namespace a\n");
        }

        SUBCASE("Access specifiers sit at class level") {
            const std::string input =
                "class C {\n"
                "public:\n"
                "        void f();\n"
                "  private:\n"
                "int x_;\n"
                "};\n";

            CHECK(SourceFormatter().format(input) ==
                  "class C {\n"
                  "public:\n"
                  "    void f();\n"
                  "\n"
                  "private:\n"
                  "    int x_;\n"
                  "};\n");
        }
    }

    TEST_CASE("Includes are sorted and deduplicated") {
        const std::string input =
            "#include <vector>\n"
            "#include <string>\n"
            "#include <vector>\n"
            "\n"
            "int x;\n";

        CHECK(SourceFormatter().format(input) ==
              "#include <string>\n"
              "#include <vector>\n"
              "\n"
              "int x;\n");
    }

    TEST_CASE("Blank lines are collapsed and trimmed") {
        CHECK(SourceFormatter().format("\n\n\nint a;\n\n\n\nint b;\n\n\n") == "int a;\n\nint b;\n");
    }

    TEST_CASE("Empty input is a single newline") {
        CHECK(SourceFormatter().format("") == "\n");
        CHECK(SourceFormatter().format("\n\n  \n") == "\n");
    }

    TEST_CASE("Text that is not code is preserved") {
        SUBCASE("Preprocessor lines start in column 0") {
            CHECK(SourceFormatter().format("void f() {\n  #ifdef X\ng();\n  #endif\n}\n") ==
                  "void f() {\n"
                  "#ifdef X\n"
                  "    g();\n"
                  "#endif\n"
                  "}\n");
        }

        SUBCASE("Raw string") {
            CHECK(SourceFormatter().format("auto s = R\"(a  {  b)\";\n") == "auto s = R\"(a  {  b)\";\n");
        }
    }

    TEST_CASE("Formatting is idempotent") {
        const std::string input =
            "// Code generated by svcgen v0.1.0, DO NOT EDIT.\n"
            "#pragma once\n"
            "#include <utility>\n"
            "#include <functional>\n"
            "namespace svcgen::rest {\n"
            "struct Request {}; struct Response { int status = 200; };\n"
            "using Handler = std::function<Response(const Request&)>;\n"
            "struct ServeMux { void handle(const char*, const char*, Handler); };\n"
            "}\n"
            "namespace cellar::gen::transport {\n"
            "namespace rest = ::svcgen::rest;\n"
            "using ::svcgen::rest::Handler;\n"
            "using ::svcgen::rest::ServeMux;\n"
            "    /// Handlers\n"
            "struct AccountHttpHandlers { Handler show; };\n"
            "inline void mount(ServeMux& mux, Handler h) {\n"
            "  mux.handle(\"GET\", \"/accounts/{id}\",\n"
            "std::move(h));\n"
            "  if (h) { return; } else {\n"
            "return;\n"
            "}\n"
            "}\n"
            "}  // namespace cellar::gen::transport\n";

        SourceFormatter formatter("account_http.hh");
        const std::string once = formatter.format(input);
        CHECK(formatter.format(once) == once);
        CHECK(once.back() == '\n');
        CHECK_FALSE(contains(once, "\n\n\n"));
        CHECK_FALSE(contains(once, "namespace rest ="));
        CHECK(contains(once, "using ::svcgen::rest::ServeMux;\n"));
    }

    // ========================================================================
    // Imports
    // ========================================================================

    TEST_CASE("Unused imports are removed") {
        const std::string input =
            "namespace svcgen::rest {\n"
            "struct Request {};\n"
            "struct Handler {};\n"
            "}  // namespace svcgen::rest\n"
            "\n"
            "namespace a {\n"
            "namespace rest = ::svcgen::rest;\n"
            "using ::svcgen::rest::Request;\n"
            "using ::svcgen::rest::Handler;\n"
            "\n"
            "Request f();\n"
            "}  // namespace a\n";

        const std::string code = SourceFormatter().format(input);
        CHECK(contains(code,
                       "namespace a {\n"
                       "using ::svcgen::rest::Request;\n"
                       "\n"
                       "Request f();\n"
                       "}  // namespace a\n"));
        CHECK_FALSE(contains(code, "namespace rest ="));
        CHECK_FALSE(contains(code, "using ::svcgen::rest::Handler;"));
        CHECK(contains(code, "struct Handler {};"));
    }

    TEST_CASE("Aliases count only when qualifying a name") {
        const std::string decls =
            "namespace lib::fs {\n"
            "struct path {};\n"
            "}  // namespace lib::fs\n";

        const std::string unused = SourceFormatter().format(
            decls + "namespace fs = ::lib::fs;\nint fs_count = 0;\nvoid f(int fs);\n");
        CHECK_FALSE(contains(unused, "namespace fs ="));
        CHECK(contains(unused, "int fs_count = 0;\nvoid f(int fs);\n"));

        const std::string used = SourceFormatter().format(decls + "namespace fs = ::lib::fs;\nfs::path p;\n");
        CHECK(contains(used, "namespace fs = ::lib::fs;\nfs::path p;\n"));
    }

    TEST_CASE("Member access is not a use of a using-declaration") {
        const std::string decls =
            "namespace lib {\n"
            "int size(int);\n"
            "}  // namespace lib\n"
            "struct V {\n"
            "    int size() const;\n"
            "};\n";

        const std::string member = SourceFormatter().format(decls + "using ::lib::size;\nV v;\nint n = v.size();\n");
        CHECK_FALSE(contains(member, "using ::lib::size;"));

        const std::string call = SourceFormatter().format(decls + "using ::lib::size;\nint n = size(1);\n");
        CHECK(contains(call, "using ::lib::size;\nint n = size(1);\n"));
    }

    TEST_CASE("Imports used only by removed imports go too") {
        const std::string input =
            "namespace svcgen::rest::detail {}\n"
            "namespace r = ::svcgen::rest;\n"
            "namespace q = r::detail;\n"
            "int x;\n";

        const std::string code = SourceFormatter().format(input);
        CHECK_FALSE(contains(code, "namespace r ="));
        CHECK_FALSE(contains(code, "namespace q ="));
        CHECK(contains(code, "int x;\n"));
    }

    TEST_CASE("Only namespace-scope declarations are imports") {
        const std::string input =
            "namespace lib::io {}\n"
            "namespace lib::rest {\n"
            "struct Response {};\n"
            "}  // namespace lib::rest\n"
            "struct Base {\n"
            "    void f();\n"
            "};\n"
            "namespace io = ::lib::io;\n"
            "using ::lib::rest::Response;\n"
            "using namespace lib;\n"
            "using Alias = ::lib::rest::Response;\n"
            "struct S : Base {\n"
            "    using Base::f;\n"
            "};\n"
            "void g() {\n"
            "    using ::lib::rest::Response;\n"
            "}\n";

        auto imports = SourceFormatter().imports(input);
        REQUIRE(imports.size() == 2);
        CHECK(imports[0].alias == std::optional<std::string>("io"));
        CHECK(imports[0].path == "::lib::io");
        CHECK_FALSE(imports[1].alias.has_value());
        CHECK(imports[1].path == "::lib::rest::Response");
        CHECK(imports[1].code() == "using ::lib::rest::Response;");
    }

    // ========================================================================
    // Diagnostics
    // ========================================================================

    TEST_CASE("Malformed sources are rejected with a location") {
        SUBCASE("Statement where an expression belongs") {
            const std::string content =
                "namespace x {\n"
                "int f() { return return; }\n"
                "}\n";
            try {
                (void)SourceFormatter("gen/broken.hh").format(content);
                FAIL("expected format_error");
            } catch (const format_error& e) {
                CHECK(e.line() == 2);
                CHECK(e.column() == 18);
                CHECK(e.diagnostic() == "gen/broken.hh:2:18: expected expression");
                CHECK(contains(e.what(), "========\nContent:\n" + content));
            }
        }

        SUBCASE("Missing semicolon between members") {
            try {
                (void)SourceFormatter("s.hh").format("struct S { int a int b; };\n");
                FAIL("expected format_error");
            } catch (const format_error& e) {
                CHECK(e.line() == 1);
                CHECK(e.diagnostic().rfind("s.hh:1:", 0) == 0);
            }
        }

        SUBCASE("Mismatched bracket") {
            CHECK_THROWS_AS((void)SourceFormatter("x.cc").format("void f() { (]; }\n"), format_error);
        }

        SUBCASE("Unexpected closer") {
            CHECK_THROWS_AS((void)SourceFormatter().format("}\n"), format_error);
        }

        SUBCASE("Unterminated comment") {
            CHECK_THROWS_WITH_AS((void)SourceFormatter().format("int a;\n/* open"),
                                 doctest::Contains("<source>:2:1: unterminated /* comment"), format_error);
        }
    }

    TEST_CASE("Only syntax errors of the file itself are rejected") {
        SUBCASE("Unknown names") {
            CHECK(SourceFormatter().format("int f() { return undeclared_name; }\n") ==
                  "int f() {\n"
                  "    return undeclared_name;\n"
                  "}\n");
        }

        SUBCASE("Missing header") {
            CHECK(SourceFormatter().format("#include \"does/not/exist.hh\"\nint x;\n") ==
                  "#include \"does/not/exist.hh\"\nint x;\n");
        }

        SUBCASE("Broken header found in an include directory") {
            TempDir tmp;
            write_file(tmp.path() / "dep" / "broken.hh", "int x = ;\n");
            SourceFormatter formatter("main.cc", {tmp.path()});
            CHECK(formatter.format("#include \"dep/broken.hh\"\nint y;\n") ==
                  "#include \"dep/broken.hh\"\nint y;\n");
        }
    }

    TEST_CASE("Formattable extensions") {
        CHECK(is_formattable("gen/services/account.hh"));
        CHECK(is_formattable("main.cc"));
        CHECK(is_formattable("x.cpp"));
        CHECK(is_formattable("x.h"));
        CHECK_FALSE(is_formattable("gen/openapi.yaml"));
        CHECK_FALSE(is_formattable("README.md"));
    }
}
