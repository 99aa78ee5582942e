//
// Generator driver source
//

#include <svcgen/pipeline/driver.hh>

#include <algorithm>

namespace svcgen::pipeline {

using codegen::CppCodeWriter;
using codegen::NamespaceContext;
using codegen::Section;
using generators::GeneratorKind;

namespace {

struct driver_data {
    std::vector<GeneratorKind> generators;
    std::vector<std::filesystem::path> include_dirs;
};

const auto helpers_template = codegen::make_template<driver_data>("driver-helpers",
    [](CppCodeWriter& w, const driver_data&) {
        auto anon = w.write_namespace("");
        auto fn = w.write_function("int", "fail", "const std::string& message");
        w.write_line("std::cerr << message << std::endl;");
        w.write_line("return 1;");
    });

const auto main_template = codegen::make_template<driver_data>("driver-main",
    [](CppCodeWriter& w, const driver_data& d) {
        w.write_blank_line();
        auto main_fn = w.write_function("int", "main", "int argc, char** argv");
        w.write_line("std::string output;");
        w.write_line("std::string version;");
        {
            auto loop = w.open_block("for (int i = 1; i < argc; ++i)");
            w.write_line("const std::string arg = argv[i];");
            auto branch = w.write_if("arg.rfind(\"--output=\", 0) == 0");
            w.write_line("output = arg.substr(9);");
            auto version_branch = branch.write_else_if("arg.rfind(\"--version=\", 0) == 0");
            w.write_line("version = arg.substr(10);");
            auto other = version_branch.write_else();
            w.write_line("return fail(\"unknown argument \" + arg);");
        }
        {
            auto check = w.write_if("output.empty()");
            w.write_line("return fail(\"missing --output flag\");");
        }
        {
            auto check = w.write_if("version.empty()");
            w.write_line("return fail(\"missing --version flag\");");
        }
        {
            auto check = w.write_if("version != ::svcgen::version()");
            w.write_line("std::string message = \"svcgen was run with version \" + version;");
            w.write_line("message += \" but the compiled generator is running \";");
            w.write_line("message += ::svcgen::version();");
            w.write_line("return fail(message);");
        }
        w.write_blank_line();

        auto attempt = w.write_try();
        w.write_line("eval::Context& context = eval::Context::instance();");
        w.write_line("context.run_dsl();");
        w.write_line("const std::vector<const design::root*> roots = context.roots();");
        w.write_blank_line();
        w.write_line("generators::file_list files;");
        for (GeneratorKind kind : d.generators) {
            auto each = w.write_for("auto& file", "generators::" + std::string(generators::generator_name(kind)) + "(roots)");
            w.write_line("files.push_back(std::move(file));");
        }
        w.write_blank_line();
        w.write_line("codegen::Writer writer(output);");
        if (!d.include_dirs.empty()) {
            std::string dirs;
            for (const auto& dir : d.include_dirs) {
                dirs += (dirs.empty() ? "" : ", ") + codegen::string_literal(dir.string());
            }
            w.write_line("writer.set_include_dirs({" + dirs + "});");
        }
        w.write_line("std::vector<std::string> outputs;");
        {
            auto each = w.write_for("const auto& file", "files");
            w.write_line("const fs::path path = writer.write(*file);");
            auto written = w.write_if("!path.empty()");
            w.write_line("outputs.push_back(path.string());");
        }
        w.write_line("std::sort(outputs.begin(), outputs.end());");
        {
            auto each = w.write_for("const auto& path", "outputs");
            w.write_line("std::cout << path << \"\\n\";");
        }
        auto failure = attempt.write_catch("const std::exception&");
        w.write_line("return fail(e.what());");
        failure.close();
        w.write_line("return 0;");
    });

}  // namespace

std::vector<GeneratorKind> driver_generators(const DriverSpec& spec) {
    std::vector<GeneratorKind> kinds = spec.generators;
    if (spec.scaffold && std::find(kinds.begin(), kinds.end(), GeneratorKind::Scaffold) == kinds.end()) {
        kinds.push_back(GeneratorKind::Scaffold);
    }
    return kinds;
}

namespace {

class DriverFile : public codegen::File {
public:
    DriverFile(std::vector<GeneratorKind> kinds, std::vector<std::filesystem::path> include_dirs,
               std::filesystem::path design)
        : data_{std::move(kinds), std::move(include_dirs)}, design_(std::move(design)) {}

    [[nodiscard]] std::vector<Section> sections(const NamespaceContext&) const override {
        codegen::FileHeader header;
        header.title = "svcgen generator driver";
        header.system_includes = {
            "algorithm", "exception", "filesystem", "iostream", "string", "utility", "vector",
            "svcgen/codegen/writer.hh", "svcgen/design/model.hh", "svcgen/eval/context.hh",
            "svcgen/generators/generators.hh", "svcgen/version.hh",
        };
        header.includes = {design_.generic_string()};
        header.imports = {
            {std::string("codegen"), "::svcgen::codegen"},
            {std::string("design"), "::svcgen::design"},
            {std::string("dsl"), "::svcgen::dsl"},
            {std::string("eval"), "::svcgen::eval"},
            {std::string("fs"), "::std::filesystem"},
            {std::string("generators"), "::svcgen::generators"},
        };

        std::vector<Section> sections;
        sections.push_back(codegen::header_section(header));
        sections.emplace_back(helpers_template, data_);
        sections.emplace_back(main_template, data_);
        return sections;
    }

    [[nodiscard]] std::string output_path(const codegen::PathSet&) const override {
        return driver_source_name;
    }

private:
    driver_data data_;
    std::filesystem::path design_;
};

}  // namespace

std::unique_ptr<codegen::File> driver_file(const DriverSpec& spec) {
    return std::make_unique<DriverFile>(driver_generators(spec), spec.include_dirs, spec.design);
}

}  // namespace svcgen::pipeline
