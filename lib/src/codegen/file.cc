#include <svcgen/codegen/file.hh>
#include <svcgen/version.hh>

#include <filesystem>

namespace svcgen::codegen {

std::string unique_path(const std::string& natural, const PathSet& reserved) {
    // Reserved paths are kept in normal form
    const std::filesystem::path p = std::filesystem::path(natural).lexically_normal();
    if (reserved.find(p.generic_string()) == reserved.end()) {
        return natural;
    }

    const std::string stem = p.stem().string();
    const std::string ext = p.extension().string();
    for (int n = 1; n < 100; ++n) {
        std::filesystem::path candidate = p.parent_path() / (stem + "_" + std::to_string(n) + ext);
        std::string generic = candidate.generic_string();
        if (reserved.find(generic) == reserved.end()) {
            return generic;
        }
    }
    throw path_collision_error("no free output path for " + natural);
}

std::string ImportSpec::code() const {
    if (alias && !alias->empty()) {
        return "namespace " + *alias + " = " + path + ";";
    }
    return "using " + path + ";";
}

namespace {

const auto header_template = make_template<FileHeader>("header",
    [](CppCodeWriter& w, const FileHeader& h) {
        if (h.editable) {
            w.write_comment("Generated by svcgen v" + std::string(version()) + ". Edit as needed.");
        } else {
            w.write_comment("Code generated by svcgen v" + std::string(version()) + ", DO NOT EDIT.");
        }
        w.write_line("//");
        w.write_comment(h.title);
        w.write_blank_line();
        if (h.pragma_once) {
            w.write_pragma_once();
            w.write_blank_line();
        }
        if (!h.system_includes.empty()) {
            for (const auto& inc : h.system_includes) {
                w.write_include(inc, true);
            }
            w.write_blank_line();
        }
        if (!h.includes.empty()) {
            for (const auto& inc : h.includes) {
                w.write_include(inc);
            }
            w.write_blank_line();
        }
        if (!h.namespace_name.empty()) {
            w.write_line("namespace " + h.namespace_name + " {");
            w.write_blank_line();
        }
        if (!h.imports.empty()) {
            for (const auto& imp : h.imports) {
                w.write_line(imp.code());
            }
            w.write_blank_line();
        }
    });

const auto footer_template = make_template<std::string>("footer",
    [](CppCodeWriter& w, const std::string& ns) {
        if (!ns.empty()) {
            w.write_blank_line();
            w.write_line("}  // namespace " + ns);
        }
    });

}  // namespace

Section header_section(FileHeader header) {
    return Section(header_template, std::move(header));
}

Section footer_section(std::string namespace_name) {
    return Section(footer_template, std::move(namespace_name));
}

}  // namespace svcgen::codegen
