//
// Code Writer Implementation
//

#include <svcgen/codegen/code_writer.hh>

#include <utility>

namespace svcgen::codegen {

// ============================================================================
// CodeWriter
// ============================================================================

CodeWriter::CodeWriter(std::ostream& output)
    : output_(output),
      indent_level_(0),
      indent_string_("    ")
{
}

void CodeWriter::write_line(const std::string& line) {
    if (!line.empty()) {
        output_ << cached_indent_ << line;
    }
    output_ << '\n';
}

void CodeWriter::write_raw(const std::string& text) {
    output_ << text;
}

void CodeWriter::write_blank_line() {
    output_ << '\n';
}

Block CodeWriter::open_block(const std::string& header, const std::string& closer) {
    write_line(header.empty() ? "{" : header + " {");
    indent();
    return Block(this, closer);
}

Block CodeWriter::write_if(const std::string& condition) {
    return open_block("if (" + condition + ")");
}

Block CodeWriter::write_for(const std::string& declaration, const std::string& range) {
    return open_block("for (" + declaration + " : " + range + ")");
}

Block CodeWriter::write_try() {
    return open_block("try");
}

Block CodeWriter::write_scope() {
    return open_block("");
}

void CodeWriter::indent() {
    indent_level_++;
    update_cached_indent();
}

void CodeWriter::unindent() {
    if (indent_level_ > 0) {
        indent_level_--;
        update_cached_indent();
    }
}

void CodeWriter::set_indent_string(const std::string& indent) {
    indent_string_ = indent;
    update_cached_indent();
}

void CodeWriter::update_cached_indent() {
    cached_indent_.clear();
    for (std::size_t i = 0; i < indent_level_; ++i) {
        cached_indent_ += indent_string_;
    }
}

CodeWriter& CodeWriter::operator<<(const std::string& text) {
    line_buffer_ += text;
    return *this;
}

CodeWriter& CodeWriter::operator<<(const char* text) {
    if (text) {
        line_buffer_ += text;
    }
    return *this;
}

CodeWriter& CodeWriter::operator<<(std::size_t value) {
    line_buffer_ += std::to_string(value);
    return *this;
}

CodeWriter& CodeWriter::operator<<(int value) {
    line_buffer_ += std::to_string(value);
    return *this;
}

CodeWriter& CodeWriter::operator<<(CodeWriter& (*manip)(CodeWriter&)) {
    return manip(*this);
}

CodeWriter& endl(CodeWriter& writer) {
    writer.write_line(writer.line_buffer_);
    writer.line_buffer_.clear();
    return writer;
}

// ============================================================================
// Block
// ============================================================================

Block::Block(CodeWriter* writer, std::string closer)
    : writer_(writer),
      closer_(std::move(closer))
{
}

Block::~Block() {
    close();
}

Block::Block(Block&& other) noexcept
    : writer_(other.writer_),
      closer_(std::move(other.closer_))
{
    other.writer_ = nullptr;
}

Block& Block::operator=(Block&& other) noexcept {
    if (this != &other) {
        close();
        writer_ = other.writer_;
        closer_ = std::move(other.closer_);
        other.writer_ = nullptr;
    }
    return *this;
}

void Block::close() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line(closer_);
        writer_ = nullptr;
    }
}

Block Block::chain(const std::string& header) {
    CodeWriter* writer = writer_;
    writer_ = nullptr;
    writer->unindent();
    writer->write_line("} " + header + " {");
    writer->indent();
    return Block(writer, "}");
}

Block Block::write_else_if(const std::string& condition) {
    return chain("else if (" + condition + ")");
}

Block Block::write_else() {
    return chain("else");
}

Block Block::write_catch(const std::string& exception_type, const std::string& var_name) {
    std::string clause = "catch (" + exception_type;
    if (!var_name.empty()) {
        clause += " " + var_name;
    }
    return chain(clause + ")");
}

Block& Block::operator<<(const std::string& text) {
    *writer_ << text;
    return *this;
}

Block& Block::operator<<(const char* text) {
    *writer_ << text;
    return *this;
}

Block& Block::operator<<(CodeWriter& (*manip)(CodeWriter&)) {
    *writer_ << manip;
    return *this;
}

}  // namespace svcgen::codegen
