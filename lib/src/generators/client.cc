#include <svcgen/generators/generators.hh>

#include "generated_file.hh"

namespace svcgen::generators {

using codegen::CppCodeWriter;
using codegen::NamespaceContext;
using codegen::Section;

namespace {

struct client_data {
    design::service_def service;
};

/// Argument names of a method; "request" is taken by the request itself.
std::string argument_list(const design::method_def& m) {
    std::string args;
    for (const auto& p : m.path_params) {
        args += "const std::string& " + cpp_identifier(p) + ", ";
    }
    return args + "Request request = {}";
}

const auto client_template = codegen::make_template<client_data>("http-client",
    [](CppCodeWriter& w, const client_data& d) {
        const std::string svc = d.service.name;
        const std::string type = design::pascal_case(svc) + "HttpClient";

        w.write_doc_comment({type + " calls the " + svc + " service endpoints over HTTP."});
        auto cls = w.write_class(type);
        w.write_access("public");
        w.write_line(type + "(std::string host, Doer& doer) : host_(std::move(host)), doer_(doer) {}");

        for (const auto& m : d.service.methods) {
            w.write_blank_line();
            w.write_doc_comment(doc_lines(m.description, m.name + " sends " + m.verb + " " + m.path + "."));
            auto fn = w.write_function("Response", cpp_identifier(m.name), argument_list(m));
            w.write_line("request.method = " + codegen::string_literal(m.verb) + ";");
            w.write_line("request.host = host_;");
            w.write_line("request.path = " + path_expression(m) + ";");
            w.write_line("return doer_.execute(request);");
        }

        w.write_blank_line();
        w.write_access("private");
        w.write_line("std::string host_;");
        w.write_line("Doer& doer_;");
    });

void check_arguments(const design::service_def& service) {
    for (const auto& m : service.methods) {
        for (const auto& p : m.path_params) {
            if (p == "request") {
                throw generator_error("client", "method \"" + service.name + "." + m.name +
                                      "\" uses the reserved parameter name \"request\"");
            }
        }
    }
}

std::unique_ptr<codegen::File> client_file(const design::service_def& service) {
    return std::make_unique<GeneratedFile>("gen/transport/" + service.name + "_http_client.hh",
        [service](const NamespaceContext& ns) {
            codegen::FileHeader header;
            header.title = service.name + " HTTP client transport";
            header.namespace_name = ns.qualify("gen::transport");
            header.pragma_once = true;
            header.system_includes = {"string", "svcgen/rest.hh", "utility"};
            header.imports = {
                {std::string("rest"), "::svcgen::rest"},
                {std::nullopt, "::svcgen::rest::Doer"},
                {std::nullopt, "::svcgen::rest::Handler"},
                {std::nullopt, "::svcgen::rest::Request"},
                {std::nullopt, "::svcgen::rest::Response"},
                {std::nullopt, "::svcgen::rest::escape_path"},
            };

            std::vector<Section> sections;
            sections.push_back(codegen::header_section(header));
            sections.emplace_back(client_template, client_data{service});
            sections.push_back(codegen::footer_section(header.namespace_name));
            return sections;
        });
}

}  // namespace

file_list client(const std::vector<const design::root*>& roots) {
    file_list files;
    for (const auto& service : collect_services("client", roots)) {
        check_arguments(service);
        files.push_back(client_file(service));
    }
    return files;
}

}  // namespace svcgen::generators
