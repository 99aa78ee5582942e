//
// C++ Code Writer Implementation
//

#include <svcgen/codegen/cpp_code_writer.hh>

#include <cstdio>

namespace svcgen::codegen {

CppCodeWriter::CppCodeWriter(std::ostream& output)
    : CodeWriter(output)
{
}

Block CppCodeWriter::write_namespace(const std::string& name) {
    if (name.empty()) {
        return open_block("namespace", "}  // namespace");
    }
    return open_block("namespace " + name, "}  // namespace " + name);
}

Block CppCodeWriter::write_struct(const std::string& name) {
    return open_block("struct " + name, "};");
}

Block CppCodeWriter::write_class(const std::string& name, const std::string& bases) {
    std::string header = "class " + name;
    if (!bases.empty()) {
        header += " : " + bases;
    }
    return open_block(header, "};");
}

Block CppCodeWriter::write_function(const std::string& return_type,
                                    const std::string& name,
                                    const std::string& params) {
    return open_block(return_type + " " + name + "(" + params + ")");
}

void CppCodeWriter::write_pragma_once() {
    write_line("#pragma once");
}

void CppCodeWriter::write_include(const std::string& header, bool system) {
    if (system) {
        write_line("#include <" + header + ">");
    } else {
        write_line("#include \"" + header + "\"");
    }
}

void CppCodeWriter::write_comment(const std::string& comment) {
    write_line("// " + comment);
}

void CppCodeWriter::write_doc_comment(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        write_line(line.empty() ? "///" : "/// " + line);
    }
}

void CppCodeWriter::write_access(const std::string& specifier) {
    unindent();
    write_line(specifier + ":");
    indent();
}

std::string string_literal(const std::string& text) {
    std::string literal = "\"";
    for (char c : text) {
        switch (c) {
            case '"':  literal += "\\\""; break;
            case '\\': literal += "\\\\"; break;
            case '\n': literal += "\\n"; break;
            case '\r': literal += "\\r"; break;
            case '\t': literal += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                    char octal[8];
                    std::snprintf(octal, sizeof(octal), "\\%03o", static_cast<unsigned char>(c));
                    literal += octal;
                } else {
                    literal += c;
                }
        }
    }
    literal += '"';
    return literal;
}

}  // namespace svcgen::codegen
