//
// C++ Code Writer
//
// Extends CodeWriter with the C++ constructs generated files are made of:
// include directives, namespaces, classes/structs, functions and comments.
//

#pragma once

#include <svcgen/codegen/code_writer.hh>

#include <string>
#include <vector>

namespace svcgen::codegen {

class CppCodeWriter : public CodeWriter {
public:
    explicit CppCodeWriter(std::ostream& output);

    // ========================================================================
    // Blocks
    // ========================================================================

    /// "namespace a::b {" ... "}  // namespace a::b"
    Block write_namespace(const std::string& name);

    /// "struct Name {" ... "};"
    Block write_struct(const std::string& name);

    /// "class Name : bases {" ... "};"
    Block write_class(const std::string& name, const std::string& bases = "");

    /// "<return_type> name(params) {" ... "}"
    Block write_function(const std::string& return_type,
                         const std::string& name,
                         const std::string& params);

    // ========================================================================
    // Single-line Helpers
    // ========================================================================

    void write_pragma_once();
    void write_include(const std::string& header, bool system = false);
    void write_comment(const std::string& comment);

    /// Write a "///" comment, one line per entry.
    void write_doc_comment(const std::vector<std::string>& lines);

    /// Access specifier at the enclosing class indentation.
    void write_access(const std::string& specifier);
};

/// text as a double-quoted C++ string literal. Quotes, backslashes and
/// control characters are escaped.
std::string string_literal(const std::string& text);

}  // namespace svcgen::codegen
