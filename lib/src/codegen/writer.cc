#include <svcgen/codegen/writer.hh>
#include <svcgen/codegen/source_formatter.hh>

#include <fstream>
#include <sstream>
#include <system_error>

namespace svcgen::codegen {

namespace fs = std::filesystem;

namespace {

/// Generic relative form of path, or nullopt if it leaves the directory.
std::optional<std::string> contained_path(const std::string& path) {
    fs::path p(path);
    if (path.empty() || p.is_absolute() || p.has_root_name() || p.has_root_directory()) {
        return std::nullopt;
    }
    fs::path normal = p.lexically_normal();
    if (normal.empty() || normal == "." || !normal.has_filename()) {
        return std::nullopt;
    }
    auto first = normal.begin();
    if (first != normal.end() && *first == "..") {
        return std::nullopt;
    }
    return normal.generic_string();
}

}  // namespace

Writer::Writer(fs::path dir)
    : dir_(std::move(dir))
{
}

Writer::Writer(fs::path dir, NamespaceContext context)
    : dir_(std::move(dir))
    , context_(std::move(context))
{
}

const NamespaceContext& Writer::context() {
    if (!context_) {
        context_ = resolve_namespace_context(dir_);
    }
    return *context_;
}

fs::path Writer::write(const File& file) {
    const std::string natural = file.output_path(registry_);
    auto rel = contained_path(natural);
    if (!rel) {
        throw path_collision_error("output path " + natural + " is not inside " + dir_.string());
    }
    if (registry_.count(*rel) != 0) {
        throw path_collision_error("output path " + *rel + " was already written");
    }

    const fs::path target = dir_ / fs::path(*rel);
    std::error_code ec;
    if (!file.overwrite() && fs::exists(target, ec)) {
        registry_.insert(*rel);
        return {};
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw write_error("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    const NamespaceContext& ns = context();

    std::ostringstream buffer;
    for (const auto& section : file.sections(ns)) {
        section.write(buffer);
    }

    std::string content = buffer.str();
    if (is_formattable(target)) {
        std::vector<fs::path> include_dirs = include_dirs_;
        include_dirs.push_back(ns.project_root);
        content = SourceFormatter(target.string(), std::move(include_dirs)).format(content);
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw write_error("cannot open " + target.string() + " for writing");
    }
    out << content;
    out.close();
    if (!out) {
        throw write_error("failed to write " + target.string());
    }

    registry_.insert(*rel);
    return target;
}

}  // namespace svcgen::codegen
