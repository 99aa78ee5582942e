//
// Shared pieces of the concrete generators
//

#pragma once

#include <svcgen/codegen/file.hh>
#include <svcgen/design/model.hh>

#include <functional>
#include <string>
#include <vector>

namespace svcgen::generators {

/// File with a fixed natural path whose sections are built on demand.
class GeneratedFile : public codegen::File {
public:
    using section_fn = std::function<std::vector<codegen::Section>(const codegen::NamespaceContext&)>;

    GeneratedFile(std::string path, section_fn fn)
        : path_(std::move(path)), fn_(std::move(fn)) {}

    [[nodiscard]] std::vector<codegen::Section> sections(const codegen::NamespaceContext& ns) const override {
        return fn_(ns);
    }

    [[nodiscard]] std::string output_path(const codegen::PathSet& reserved) const override {
        return suffix_on_collision_ ? codegen::unique_path(path_, reserved) : path_;
    }

    [[nodiscard]] bool overwrite() const override { return overwrite_; }

    GeneratedFile& keep_existing() { overwrite_ = false; return *this; }
    GeneratedFile& suffix_on_collision() { suffix_on_collision_ = true; return *this; }

private:
    std::string path_;
    section_fn fn_;
    bool overwrite_ = true;
    bool suffix_on_collision_ = false;
};

/// Services of all roots in order.
/// @throws generator_error if two roots define the same service
std::vector<design::service_def> collect_services(const std::string& generator,
                                                  const std::vector<const design::root*>& roots);

/// "::" + ns.qualify(nested)
std::string absolute_namespace(const codegen::NamespaceContext& ns, const std::string& nested);

/// Description lines for a doc comment, or fallback when empty.
std::vector<std::string> doc_lines(const std::string& description, const std::string& fallback);

/// name, with an underscore appended when it is a C++ keyword.
std::string cpp_identifier(const std::string& name);

/// Relative path of the generated service interface header.
std::string service_header_path(const design::service_def& service);

/// C++ expression building the request path of method from its parameters.
std::string path_expression(const design::method_def& method);

}  // namespace svcgen::generators
