//
// OpenAPI generator
//
// One OpenAPI 3 document per design root. The document is assembled as a
// fkYAML node tree and serialized, so keys come out in a stable order.
//

#include <svcgen/generators/generators.hh>
#include <svcgen/version.hh>

#include "generated_file.hh"

#include <fkYAML/node.hpp>

#include <algorithm>
#include <cctype>

namespace svcgen::generators {

using codegen::CppCodeWriter;
using codegen::NamespaceContext;
using codegen::Section;

namespace {

constexpr const char* generator = "openapi";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        default:  return "Success";
    }
}

fkyaml::node path_parameter(const std::string& name) {
    fkyaml::node param = fkyaml::node::mapping();
    param["name"] = std::string(name);
    param["in"] = std::string("path");
    param["required"] = true;
    fkyaml::node schema = fkyaml::node::mapping();
    schema["type"] = std::string("string");
    param["schema"] = schema;
    return param;
}

fkyaml::node operation(const design::service_def& service, const design::method_def& m) {
    fkyaml::node op = fkyaml::node::mapping();
    op["operationId"] = service.name + "#" + m.name;

    fkyaml::node tags = fkyaml::node::sequence();
    tags.get_value_ref<fkyaml::node::sequence_type&>().emplace_back(service.name);
    op["tags"] = tags;

    if (!m.description.empty()) {
        op["description"] = m.description;
    }

    if (!m.path_params.empty()) {
        fkyaml::node params = fkyaml::node::sequence();
        auto& list = params.get_value_ref<fkyaml::node::sequence_type&>();
        for (const auto& p : m.path_params) {
            list.push_back(path_parameter(p));
        }
        op["parameters"] = params;
    }

    fkyaml::node response = fkyaml::node::mapping();
    response["description"] = status_text(m.status);
    fkyaml::node responses = fkyaml::node::mapping();
    responses[std::to_string(m.status)] = response;
    op["responses"] = responses;
    return op;
}

std::string render_document(const design::root& root) {
    fkyaml::node info = fkyaml::node::mapping();
    info["title"] = root.api.title.empty() ? root.api.name : root.api.title;
    info["version"] = root.api.version.empty() ? std::string("0.0.0") : root.api.version;
    if (!root.api.description.empty()) {
        info["description"] = root.api.description;
    }

    fkyaml::node paths = fkyaml::node::mapping();
    for (const auto& service : root.services) {
        for (const auto& m : service.methods) {
            if (!paths.contains(m.path)) {
                paths[m.path] = fkyaml::node::mapping();
            }
            paths[m.path][lower(m.verb)] = operation(service, m);
        }
    }

    fkyaml::node doc = fkyaml::node::mapping();
    doc["openapi"] = std::string("3.0.3");
    doc["info"] = info;
    doc["paths"] = paths;
    return fkyaml::node::serialize(doc);
}

struct document_data {
    std::string design;
    std::string yaml;
};

const auto document_template = codegen::make_template<document_data>("openapi",
    [](CppCodeWriter& w, const document_data& d) {
        w.write_line("# Code generated by svcgen v" + std::string(version()) + ", DO NOT EDIT.");
        w.write_line("#");
        w.write_line("# OpenAPI document of design " + d.design);
        w.write_raw(d.yaml);
        if (!d.yaml.empty() && d.yaml.back() != '\n') {
            w.write_raw("\n");
        }
    });

}  // namespace

file_list openapi(const std::vector<const design::root*>& roots) {
    file_list files;
    for (const auto* root : roots) {
        document_data data;
        data.design = root->design;
        try {
            data.yaml = render_document(*root);
        } catch (const fkyaml::exception& e) {
            throw generator_error(generator, "design \"" + root->design + "\": " + e.what());
        }

        auto file = std::make_unique<GeneratedFile>("gen/openapi.yaml",
            [data](const NamespaceContext&) {
                std::vector<Section> sections;
                sections.emplace_back(document_template, data);
                return sections;
            });
        file->suffix_on_collision();
        files.push_back(std::move(file));
    }
    return files;
}

}  // namespace svcgen::generators
