#include <svcgen/generators/generators.hh>

#include "generated_file.hh"

#include <map>
#include <set>
#include <sstream>

namespace svcgen::generators {

// ============================================================================
// Generator kinds
// ============================================================================

const char* generator_name(GeneratorKind kind) {
    switch (kind) {
        case GeneratorKind::Server:   return "server";
        case GeneratorKind::Client:   return "client";
        case GeneratorKind::OpenAPI:  return "openapi";
        case GeneratorKind::Scaffold: return "scaffold";
    }
    throw std::invalid_argument("unknown generator kind");
}

GeneratorKind parse_generator_kind(const std::string& name) {
    static const std::map<std::string, GeneratorKind> kinds = {
        {"server",   GeneratorKind::Server},
        {"client",   GeneratorKind::Client},
        {"openapi",  GeneratorKind::OpenAPI},
        {"scaffold", GeneratorKind::Scaffold},
    };
    auto it = kinds.find(name);
    if (it == kinds.end()) {
        throw std::invalid_argument("unknown generator '" + name + "'");
    }
    return it->second;
}

std::string generator_function(GeneratorKind kind) {
    return std::string("::svcgen::generators::") + generator_name(kind);
}

file_list generate(GeneratorKind kind, const std::vector<const design::root*>& roots) {
    switch (kind) {
        case GeneratorKind::Server:   return server(roots);
        case GeneratorKind::Client:   return client(roots);
        case GeneratorKind::OpenAPI:  return openapi(roots);
        case GeneratorKind::Scaffold: return scaffold(roots);
    }
    throw std::invalid_argument("unknown generator kind");
}

// ============================================================================
// Shared helpers
// ============================================================================

std::vector<design::service_def> collect_services(const std::string& generator,
                                                  const std::vector<const design::root*>& roots) {
    std::vector<design::service_def> services;
    std::map<std::string, std::string> owners;
    for (const auto* root : roots) {
        for (const auto& service : root->services) {
            auto [it, inserted] = owners.emplace(service.name, root->design);
            if (!inserted) {
                throw generator_error(generator, "service \"" + service.name + "\" is defined by designs \"" +
                                      it->second + "\" and \"" + root->design + "\"");
            }
            services.push_back(service);
        }
    }
    return services;
}

std::string absolute_namespace(const codegen::NamespaceContext& ns, const std::string& nested) {
    return "::" + ns.qualify(nested);
}

std::vector<std::string> doc_lines(const std::string& description, const std::string& fallback) {
    std::vector<std::string> lines;
    std::istringstream in(description.empty() ? fallback : description);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string cpp_identifier(const std::string& name) {
    static const std::set<std::string> keywords = {
        "alignas", "alignof", "and", "and_eq", "asm", "auto",
        "bitand", "bitor", "bool", "break",
        "case", "catch", "char", "char8_t", "char16_t", "char32_t",
        "class", "compl", "concept", "const", "consteval", "constexpr",
        "constinit", "const_cast", "continue", "co_await", "co_return", "co_yield",
        "decltype", "default", "delete", "do", "double", "dynamic_cast",
        "else", "enum", "explicit", "export", "extern",
        "false", "float", "for", "friend", "goto",
        "if", "inline", "int", "long", "mutable",
        "namespace", "new", "noexcept", "not", "not_eq", "nullptr",
        "operator", "or", "or_eq", "private", "protected", "public",
        "register", "reinterpret_cast", "requires", "return",
        "short", "signed", "sizeof", "static", "static_assert", "static_cast",
        "struct", "switch", "template", "this", "thread_local", "throw", "true", "try",
        "typedef", "typeid", "typename", "union", "unsigned", "using",
        "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq"
    };
    return keywords.count(name) != 0 ? name + "_" : name;
}

std::string service_header_path(const design::service_def& service) {
    return "gen/services/" + service.name + ".hh";
}

std::string path_expression(const design::method_def& method) {
    std::string expr;
    std::string literal;
    auto flush = [&] {
        if (!literal.empty()) {
            expr += (expr.empty() ? "" : " + ") + codegen::string_literal(literal);
            literal.clear();
        }
    };

    std::size_t pos = 0;
    const std::string& path = method.path;
    while (pos < path.size()) {
        if (path[pos] == '{') {
            const std::size_t close = path.find('}', pos);
            flush();
            const std::string param = path.substr(pos + 1, close - pos - 1);
            expr += (expr.empty() ? "std::string(\"\") + " : " + ") + std::string("escape_path(") + cpp_identifier(param) + ")";
            pos = close + 1;
        } else {
            literal += path[pos++];
        }
    }
    flush();
    return expr.empty() ? "\"/\"" : expr;
}

}  // namespace svcgen::generators
