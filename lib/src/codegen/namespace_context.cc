#include <svcgen/codegen/namespace_context.hh>
#include <svcgen/project.hh>

namespace svcgen::codegen {

namespace fs = std::filesystem;

std::string NamespaceContext::include_path(const std::string& relative) const {
    return include_prefix.empty() ? relative : include_prefix + "/" + relative;
}

std::string NamespaceContext::qualify(const std::string& nested) const {
    return nested.empty() ? namespace_name : namespace_name + "::" + nested;
}

NamespaceContext resolve_namespace_context(const fs::path& dir) {
    auto root = find_project_root(dir);
    if (!root) {
        throw namespace_resolution_error(
            "cannot determine the namespace of " + dir.string() +
            ": no " + project_file_name + " found in it or any parent directory");
    }

    ProjectConfig config;
    try {
        config = load_project_config(*root);
    } catch (const config_error& e) {
        throw namespace_resolution_error(e.what());
    }

    std::error_code ec;
    fs::path absolute = fs::weakly_canonical(fs::absolute(dir), ec);
    if (ec) {
        absolute = fs::absolute(dir).lexically_normal();
    }
    fs::path relative = absolute.lexically_relative(*root);

    NamespaceContext ctx;
    ctx.project_root = *root;
    ctx.namespace_name = config.namespace_name;
    for (const auto& part : relative) {
        const std::string component = part.string();
        if (component.empty() || component == ".") {
            continue;
        }
        ctx.include_prefix += (ctx.include_prefix.empty() ? "" : "/") + component;
        ctx.namespace_name += "::" + to_identifier(component);
    }
    return ctx;
}

}  // namespace svcgen::codegen
