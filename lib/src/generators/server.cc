//
// Server generator
//
// Per service: the abstract service interface and the HTTP handlers that
// adapt it to a rest::ServeMux.
//

#include <svcgen/generators/generators.hh>

#include "generated_file.hh"

#include <map>

namespace svcgen::generators {

using codegen::CppCodeWriter;
using codegen::FileHeader;
using codegen::ImportSpec;
using codegen::NamespaceContext;
using codegen::Section;

namespace {

constexpr const char* generator = "server";

struct service_data {
    design::service_def service;
};

// ============================================================================
// Templates
// ============================================================================

const auto interface_template = codegen::make_template<service_data>("service-interface",
    [](CppCodeWriter& w, const service_data& d) {
        const std::string type = design::pascal_case(d.service.name) + "Service";
        w.write_doc_comment(doc_lines(d.service.description,
                                      type + " is the " + d.service.name + " service interface."));
        auto cls = w.write_class(type);
        w.write_access("public");
        w.write_line("virtual ~" + type + "() = default;");
        for (const auto& m : d.service.methods) {
            w.write_blank_line();
            w.write_doc_comment(doc_lines(m.description,
                                          m.name + " implements " + m.verb + " " + m.path + "."));
            w.write_line("virtual Response " + cpp_identifier(m.name) + "(const Request& request) = 0;");
        }
    });

const auto handlers_template = codegen::make_template<service_data>("http-server",
    [](CppCodeWriter& w, const service_data& d) {
        const std::string svc = d.service.name;
        const std::string handlers = design::pascal_case(svc) + "HttpHandlers";
        const std::string iface = "services::" + design::pascal_case(svc) + "Service";

        w.write_doc_comment({handlers + " lists the " + svc + " service endpoint HTTP handlers."});
        {
            auto st = w.write_struct(handlers);
            for (const auto& m : d.service.methods) {
                w.write_line("Handler " + cpp_identifier(m.name) + ";");
            }
        }

        for (const auto& m : d.service.methods) {
            w.write_blank_line();
            w.write_doc_comment({"mount_" + m.name + "_" + svc + "_http_handler configures the mux to serve the",
                                 "\"" + svc + "\" service \"" + m.name + "\" endpoint."});
            auto fn = w.write_function("inline void", "mount_" + m.name + "_" + svc + "_http_handler",
                                       "ServeMux& mux, Handler h");
            w.write_line("mux.handle(" + codegen::string_literal(m.verb) + ", " + codegen::string_literal(m.path) +
                         ", std::move(h));");
        }

        w.write_blank_line();
        w.write_doc_comment({"new_" + svc + "_http_handlers instantiates HTTP handlers for all the " + svc,
                             "service endpoints."});
        {
            auto fn = w.write_function("inline " + handlers, "new_" + svc + "_http_handlers",
                                       iface + "& service");
            w.write_line(handlers + " handlers;");
            for (const auto& m : d.service.methods) {
                const std::string member = cpp_identifier(m.name);
                auto lambda = w.open_block("handlers." + member + " = [&service](const Request& request)", "};");
                w.write_line("Response response = service." + member + "(request);");
                {
                    auto when = w.write_if("response.status == 0");
                    w.write_line("response.status = " + std::to_string(m.status) + ";");
                }
                w.write_line("return response;");
            }
            w.write_line("return handlers;");
        }

        w.write_blank_line();
        w.write_doc_comment({"mount_" + svc + "_http_handlers configures the mux to serve the " + svc + " endpoints."});
        auto fn = w.write_function("inline void", "mount_" + svc + "_http_handlers",
                                   "ServeMux& mux, const " + handlers + "& h");
        for (const auto& m : d.service.methods) {
            w.write_line("mount_" + m.name + "_" + svc + "_http_handler(mux, h." + cpp_identifier(m.name) + ");");
        }
    });

// ============================================================================
// Files
// ============================================================================

std::vector<ImportSpec> rest_imports() {
    return {
        {std::string("rest"), "::svcgen::rest"},
        {std::nullopt, "::svcgen::rest::Handler"},
        {std::nullopt, "::svcgen::rest::Request"},
        {std::nullopt, "::svcgen::rest::Response"},
        {std::nullopt, "::svcgen::rest::ServeMux"},
    };
}

std::unique_ptr<codegen::File> interface_file(const design::service_def& service) {
    return std::make_unique<GeneratedFile>(service_header_path(service),
        [service](const NamespaceContext& ns) {
            FileHeader header;
            header.title = service.name + " service interface";
            header.namespace_name = ns.qualify("gen::services");
            header.pragma_once = true;
            header.system_includes = {"svcgen/rest.hh"};
            header.imports = rest_imports();

            std::vector<Section> sections;
            sections.push_back(codegen::header_section(header));
            sections.emplace_back(interface_template,
                                  service_data{service});
            sections.push_back(codegen::footer_section(header.namespace_name));
            return sections;
        });
}

std::unique_ptr<codegen::File> handlers_file(const design::service_def& service) {
    return std::make_unique<GeneratedFile>("gen/transport/" + service.name + "_http_server.hh",
        [service](const NamespaceContext& ns) {
            FileHeader header;
            header.title = service.name + " HTTP server transport";
            header.namespace_name = ns.qualify("gen::transport");
            header.pragma_once = true;
            header.system_includes = {"svcgen/rest.hh", "utility"};
            header.includes = {ns.include_path(service_header_path(service))};
            header.imports = rest_imports();
            header.imports.push_back({std::string("services"), absolute_namespace(ns, "gen::services")});

            std::vector<Section> sections;
            sections.push_back(codegen::header_section(header));
            sections.emplace_back(handlers_template,
                                  service_data{service});
            sections.push_back(codegen::footer_section(header.namespace_name));
            return sections;
        });
}

/// Two methods answering the same verb and path cannot be mounted on one mux.
void check_routes(const std::vector<design::service_def>& services) {
    std::map<std::string, std::string> owners;
    for (const auto& service : services) {
        for (const auto& m : service.methods) {
            const std::string route = m.verb + " " + design::route_pattern(m.path);
            const std::string owner = "\"" + service.name + "\" method \"" + m.name + "\"";
            auto [it, inserted] = owners.emplace(route, owner);
            if (!inserted) {
                throw generator_error(generator, "route " + m.verb + " " + m.path + " of service " + owner +
                                      " conflicts with service " + it->second);
            }
        }
    }
}

}  // namespace

file_list server(const std::vector<const design::root*>& roots) {
    const auto services = collect_services(generator, roots);
    check_routes(services);

    file_list files;
    for (const auto& service : services) {
        files.push_back(interface_file(service));
        files.push_back(handlers_file(service));
    }
    return files;
}

}  // namespace svcgen::generators
