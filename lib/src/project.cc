//
// Project configuration loading (svcgen.yaml)
//

#include <svcgen/project.hh>

#include <fkYAML/node.hpp>

#include <cctype>
#include <fstream>
#include <system_error>

namespace svcgen {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> read_string_list(const fkyaml::node& node, const std::string& key) {
    std::vector<std::string> values;
    if (!node.contains(key)) {
        return values;
    }

    const auto& list = node[key];
    if (!list.is_sequence()) {
        throw config_error("'" + key + "' must be a list of strings");
    }
    for (const auto& item : list) {
        if (!item.is_string()) {
            throw config_error("'" + key + "' must be a list of strings");
        }
        values.push_back(item.get_value<std::string>());
    }
    return values;
}

std::optional<std::string> read_string(const fkyaml::node& node, const std::string& key) {
    if (!node.contains(key)) {
        return std::nullopt;
    }
    if (!node[key].is_string()) {
        throw config_error("'" + key + "' must be a string");
    }
    return node[key].get_value<std::string>();
}

std::vector<fs::path> resolve_dirs(const std::vector<std::string>& dirs, const fs::path& root) {
    std::vector<fs::path> resolved;
    resolved.reserve(dirs.size());
    for (const auto& dir : dirs) {
        fs::path p(dir);
        resolved.push_back(p.is_absolute() ? p : (root / p).lexically_normal());
    }
    return resolved;
}

}  // namespace

std::string to_identifier(const std::string& name) {
    std::string id;
    id.reserve(name.size() + 1);
    for (unsigned char c : name) {
        id += std::isalnum(c) ? static_cast<char>(c) : '_';
    }
    if (id.empty() || std::isdigit(static_cast<unsigned char>(id.front()))) {
        id.insert(id.begin(), '_');
    }
    return id;
}

bool is_namespace_name(const std::string& name) {
    std::size_t start = 0;
    while (true) {
        const std::size_t sep = name.find("::", start);
        const std::string component = name.substr(start, sep == std::string::npos ? sep : sep - start);
        if (component.empty() || to_identifier(component) != component) {
            return false;
        }
        if (sep == std::string::npos) {
            return true;
        }
        start = sep + 2;
    }
}

std::optional<fs::path> find_project_root(const fs::path& start) {
    std::error_code ec;
    fs::path dir = fs::weakly_canonical(fs::absolute(start, ec), ec);
    if (ec) {
        dir = fs::absolute(start).lexically_normal();
    }

    while (true) {
        if (fs::is_regular_file(dir / project_file_name, ec)) {
            return dir;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            return std::nullopt;
        }
        dir = dir.parent_path();
    }
}

ProjectConfig load_project_config(const fs::path& root) {
    fs::path file = root / project_file_name;
    std::ifstream input(file);
    if (!input.is_open()) {
        throw config_error("Failed to open file: " + file.string());
    }

    try {
        return parse_project_config(input, root);
    } catch (const config_error& e) {
        throw config_error(file.string() + ": " + e.what());
    }
}

ProjectConfig parse_project_config(std::istream& input, const fs::path& root) {
    fkyaml::node node;
    try {
        node = fkyaml::node::deserialize(input);
    } catch (const std::exception& e) {
        throw config_error(std::string("Failed to parse YAML: ") + e.what());
    }

    ProjectConfig config;
    config.root = root;

    // An empty file is a valid configuration.
    if (node.is_null()) {
        config.namespace_name = to_identifier(root.filename().string());
        return config;
    }
    if (!node.is_mapping()) {
        throw config_error("top level must be a mapping");
    }

    auto ns = read_string(node, "namespace");
    config.namespace_name = ns ? *ns : to_identifier(root.filename().string());
    config.compiler = read_string(node, "compiler");
    config.cxxflags = read_string_list(node, "cxxflags");
    config.include_dirs = resolve_dirs(read_string_list(node, "include_dirs"), root);
    config.library_dirs = resolve_dirs(read_string_list(node, "library_dirs"), root);

    if (config.namespace_name.empty()) {
        throw config_error("'namespace' must not be empty");
    }
    if (!is_namespace_name(config.namespace_name)) {
        throw config_error("'namespace' must be a C++ namespace name, got '" + config.namespace_name + "'");
    }
    return config;
}

}  // namespace svcgen
