//
// Code Writer - RAII-Based Text Emission for Templates
//
// Every template renders through a CodeWriter. Blocks returned by the
// write_* methods close themselves (brace + unindent) when they go out of
// scope, so a template cannot leave a brace unbalanced by forgetting it.
//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace svcgen::codegen {

class Block;

// ============================================================================
// CodeWriter
// ============================================================================

class CodeWriter {
public:
    explicit CodeWriter(std::ostream& output);
    virtual ~CodeWriter() = default;

    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    // ========================================================================
    // Basic Output
    // ========================================================================

    /// Write a line prefixed with the current indentation.
    void write_line(const std::string& line);

    /// Write text as-is (no indentation, no newline).
    void write_raw(const std::string& text);

    void write_blank_line();

    // ========================================================================
    // Blocks
    // ========================================================================

    /// Write "<header> {" and return a guard that writes "<closer>".
    Block open_block(const std::string& header, const std::string& closer = "}");

    Block write_if(const std::string& condition);
    Block write_for(const std::string& declaration, const std::string& range);
    Block write_try();
    Block write_scope();

    // ========================================================================
    // Indentation
    // ========================================================================

    void indent();
    void unindent();
    [[nodiscard]] std::size_t current_indent_level() const { return indent_level_; }

    void set_indent_string(const std::string& indent);
    [[nodiscard]] const std::string& get_indent_string() const { return indent_string_; }

    // ========================================================================
    // Streaming (accumulates until endl)
    // ========================================================================

    CodeWriter& operator<<(const std::string& text);
    CodeWriter& operator<<(const char* text);
    CodeWriter& operator<<(std::size_t value);
    CodeWriter& operator<<(int value);
    CodeWriter& operator<<(CodeWriter& (*manip)(CodeWriter&));

    friend CodeWriter& endl(CodeWriter& writer);

protected:
    std::ostream& output_;

private:
    std::size_t indent_level_;
    std::string indent_string_;
    std::string cached_indent_;
    std::string line_buffer_;

    void update_cached_indent();
};

/// Flush the buffered line (see CodeWriter::operator<<).
CodeWriter& endl(CodeWriter& writer);

// ============================================================================
// Block - RAII guard closing a braced region
// ============================================================================

class Block {
public:
    Block(CodeWriter* writer, std::string closer);
    ~Block();

    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;
    Block(Block&& other) noexcept;
    Block& operator=(Block&& other) noexcept;

    /// "} else if (cond) {" - this block hands its closing over to the result.
    Block write_else_if(const std::string& condition);

    /// "} else {"
    Block write_else();

    /// "} catch (type var) {"
    Block write_catch(const std::string& exception_type, const std::string& var_name = "e");

    /// Close the block now instead of at scope exit.
    void close();

    Block& operator<<(const std::string& text);
    Block& operator<<(const char* text);
    Block& operator<<(CodeWriter& (*manip)(CodeWriter&));

private:
    Block chain(const std::string& header);

    CodeWriter* writer_;
    std::string closer_;
};

}  // namespace svcgen::codegen
