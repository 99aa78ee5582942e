//
// Source Formatter - Normalization of Generated C++
//
// Templates declare namespace imports generously; the formatter removes the
// ones a file does not use and rewrites the file in one canonical layout so
// that generating the same input twice produces byte-identical output.
//
// Pipeline:
//   1. Parse the content with libclang. Errors of the "Parse Issue" and
//      "Lexical or Preprocessor Issue" categories in the file itself are
//      fatal; semantic errors and missing includes are not, since generated
//      files are normalized before the headers they include exist.
//   2. Collect namespace-scope imports from the clang token stream, each one
//      placed by the cursor at its keyword:
//        namespace alias = a::b;     (aliased)
//        using a::b::Name;           (unaliased)
//   3. Drop the imports whose name is never used, until none is left unused.
//      A use is the name as an unqualified identifier outside the import
//      itself and outside preprocessor lines.
//   4. Lay the file out with clang-format in canonical_style()
//      (includes sorted and deduplicated, at most one blank line in a row),
//      then end it with exactly one newline.
//
// clang-format is the program named by $SVCGEN_CLANG_FORMAT, else the one
// found when svcgen was built.
//

#pragma once

#include <svcgen/codegen/file.hh>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace svcgen::codegen {

/**
 * Malformed generated source, or a layout pass that did not run.
 *
 * what() is "<file>:<line>:<column>: <message>" followed by the complete raw
 * content, so the template that produced it can be debugged from the error
 * alone.
 */
class format_error : public std::runtime_error {
public:
    format_error(const std::string& file, int line, int column,
                 const std::string& message, const std::string& content);

    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] int column() const { return column_; }

    /// The "<file>:<line>:<column>: <message>" part without the content.
    [[nodiscard]] const std::string& diagnostic() const { return diagnostic_; }

private:
    int line_;
    int column_;
    std::string diagnostic_;
};

class SourceFormatter {
public:
    /// @param file_name Name used in diagnostics; its extension selects the language
    /// @param include_dirs Searched for the headers the content includes
    explicit SourceFormatter(std::string file_name = "<source>",
                             std::vector<std::filesystem::path> include_dirs = {});

    /// Normalize content.
    /// @throws format_error if content does not parse or clang-format fails
    [[nodiscard]] std::string format(const std::string& content) const;

    /// Namespace imports declared in content, in declaration order.
    /// @throws format_error as format()
    [[nodiscard]] std::vector<ImportSpec> imports(const std::string& content) const;

private:
    std::string file_name_;
    std::vector<std::filesystem::path> include_dirs_;

    [[nodiscard]] std::string parse_name() const;
};

/// True for the C++ source and header extensions the writer normalizes.
bool is_formattable(const std::filesystem::path& path);

/// The clang-format style of every normalized file, as a --style argument.
const char* canonical_style();

}  // namespace svcgen::codegen
