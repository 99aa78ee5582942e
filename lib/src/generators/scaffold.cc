#include <svcgen/generators/generators.hh>

#include "generated_file.hh"

namespace svcgen::generators {

using codegen::CppCodeWriter;
using codegen::NamespaceContext;
using codegen::Section;

namespace {

struct stub_data {
    design::service_def service;
};

const auto stub_template = codegen::make_template<stub_data>("service-stub",
    [](CppCodeWriter& w, const stub_data& d) {
        const std::string svc = d.service.name;
        const std::string iface = "services::" + design::pascal_case(svc) + "Service";
        const std::string impl = design::pascal_case(svc) + "ServiceImpl";

        w.write_doc_comment({impl + " implements the " + svc + " service."});
        {
            auto cls = w.write_class(impl, "public " + iface);
            w.write_access("public");
            bool first = true;
            for (const auto& m : d.service.methods) {
                if (!first) {
                    w.write_blank_line();
                }
                first = false;
                w.write_doc_comment(doc_lines(m.description, m.name + " implements " + m.verb + " " + m.path + "."));
                auto fn = w.write_function("Response", cpp_identifier(m.name), "const Request& request");
                w.write_line("(void)request;");
                w.write_line("return Response{501, {}, " + codegen::string_literal(svc + "." + m.name + " is not implemented") + "};");
            }
        }

        w.write_blank_line();
        w.write_doc_comment({"new_" + svc + "_service returns the " + svc + " service implementation."});
        auto fn = w.write_function("std::unique_ptr<" + iface + ">", "new_" + svc + "_service", "");
        w.write_line("return std::make_unique<" + impl + ">();");
    });

std::unique_ptr<codegen::File> stub_file(const design::service_def& service) {
    auto file = std::make_unique<GeneratedFile>(service.name + "_service.cc",
        [service](const NamespaceContext& ns) {
            codegen::FileHeader header;
            header.title = service.name + " service implementation";
            header.namespace_name = ns.namespace_name;
            header.editable = true;
            header.system_includes = {"memory", "svcgen/rest.hh"};
            header.includes = {ns.include_path(service_header_path(service))};
            header.imports = {
                {std::string("rest"), "::svcgen::rest"},
                {std::string("services"), absolute_namespace(ns, "gen::services")},
                {std::nullopt, "::svcgen::rest::Request"},
                {std::nullopt, "::svcgen::rest::Response"},
            };

            std::vector<Section> sections;
            sections.push_back(codegen::header_section(header));
            sections.emplace_back(stub_template, stub_data{service});
            sections.push_back(codegen::footer_section(header.namespace_name));
            return sections;
        });
    file->keep_existing();
    return file;
}

}  // namespace

file_list scaffold(const std::vector<const design::root*>& roots) {
    file_list files;
    for (const auto& service : collect_services("scaffold", roots)) {
        files.push_back(stub_file(service));
    }
    return files;
}

}  // namespace svcgen::generators
