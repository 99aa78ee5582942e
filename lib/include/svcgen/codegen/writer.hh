//
// Output Writer
//
// A writer session rooted at one directory. The session remembers every
// relative path it wrote, so two Files can never end at the same place, and
// normalizes the C++ it writes (see source_formatter.hh).
//
// Usage:
// \code
//   codegen::Writer writer("gen");
//   for (const auto& file : files) {
//       auto path = writer.write(*file);
//       if (!path.empty()) {
//           written.push_back(path);
//       }
//   }
// \endcode
//

#pragma once

#include <svcgen/codegen/file.hh>
#include <svcgen/codegen/namespace_context.hh>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace svcgen::codegen {

class write_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Writer {
public:
    explicit Writer(std::filesystem::path dir);

    /// Session whose namespace context is given instead of resolved, for
    /// directories outside any project.
    Writer(std::filesystem::path dir, NamespaceContext context);

    /**
     * Render file below the session directory.
     *
     * @return dir / relative path, or an empty path when the file must not
     *         overwrite an existing one and was skipped
     * @throws path_collision_error if the path is absolute, escapes the
     *         directory or was already written by this session
     * @throws namespace_resolution_error if the directory is not in a project
     * @throws render_error, format_error, write_error
     *
     * The registry is only updated when the call succeeds.
     */
    std::filesystem::path write(const File& file);

    /// Directories searched for the headers generated C++ includes while it
    /// is normalized. The project root is always searched.
    void set_include_dirs(std::vector<std::filesystem::path> dirs) { include_dirs_ = std::move(dirs); }

    [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }
    [[nodiscard]] const PathSet& written() const { return registry_; }

private:
    std::filesystem::path dir_;
    PathSet registry_;
    std::optional<NamespaceContext> context_;
    std::vector<std::filesystem::path> include_dirs_;

    const NamespaceContext& context();
};

}  // namespace svcgen::codegen
