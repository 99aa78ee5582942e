//
// Generated File Descriptors
//
// A File knows how to render itself (an ordered list of sections) and where
// it goes (a path relative to the writer directory). Both the generator driver
// and every file produced by the concrete generators are Files.
//

#pragma once

#include <svcgen/codegen/namespace_context.hh>
#include <svcgen/codegen/section.hh>

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace svcgen::codegen {

/// Relative paths (generic form) already written by a writer session.
using PathSet = std::set<std::string>;

class path_collision_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// File
// ============================================================================

class File {
public:
    virtual ~File() = default;

    /// Sections rendered in order into the file.
    [[nodiscard]] virtual std::vector<Section> sections(const NamespaceContext& ns) const = 0;

    /// Path relative to the writer directory. Must not be a member of
    /// reserved; the same reserved set always yields the same path.
    /// @throws path_collision_error if no free path exists
    [[nodiscard]] virtual std::string output_path(const PathSet& reserved) const = 0;

    /// Files returning false are left alone when they already exist on disk.
    [[nodiscard]] virtual bool overwrite() const { return true; }
};

/// natural if it is not reserved, otherwise "stem_N.ext" for the first free
/// N in [1, 99].
/// @throws path_collision_error when all candidates are taken
std::string unique_path(const std::string& natural, const PathSet& reserved);

// ============================================================================
// Imports
// ============================================================================

/// A namespace import emitted at the top of a generated file.
struct ImportSpec {
    std::optional<std::string> alias;  ///< Local name, if any
    std::string path;                  ///< Fully qualified namespace or symbol

    /// "namespace alias = path;" or "using path;"
    [[nodiscard]] std::string code() const;
};

// ============================================================================
// Common Sections
// ============================================================================

struct FileHeader {
    std::string title;
    std::string namespace_name;             ///< Empty for the global namespace
    bool pragma_once = false;
    bool editable = false;                  ///< Scaffolding meant to be edited by hand
    std::vector<std::string> system_includes;
    std::vector<std::string> includes;
    std::vector<ImportSpec> imports;
};

/// Generated-code banner, includes, namespace opening and imports.
Section header_section(FileHeader header);

/// Namespace closing matching header_section. Renders nothing for the
/// global namespace.
Section footer_section(std::string namespace_name);

}  // namespace svcgen::codegen
