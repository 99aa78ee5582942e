//
// Namespace Context
//
// Identity of a destination directory inside a project: the prefix under
// which its headers are included and the C++ namespace code generated into
// it lives in. Files use it to include sibling generated headers and to name
// their own namespace without knowing where they are written.
//

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace svcgen::codegen {

class namespace_resolution_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct NamespaceContext {
    std::filesystem::path project_root;
    std::string include_prefix;   ///< "" at the project root, otherwise "a/b"
    std::string namespace_name;   ///< e.g. "cellar::a::b"

    /// Include path of a file relative to the destination directory.
    [[nodiscard]] std::string include_path(const std::string& relative) const;

    /// Namespace nested below the destination namespace.
    [[nodiscard]] std::string qualify(const std::string& nested) const;
};

/// Resolve the context of dir by locating its project root.
/// @throws namespace_resolution_error if dir is not inside a project
NamespaceContext resolve_namespace_context(const std::filesystem::path& dir);

}  // namespace svcgen::codegen
