//
// Source Formatter Implementation
//
// Stages: libclang parse -> import pruning on the clang tokens -> clang-format.
//

#include <svcgen/codegen/source_formatter.hh>
#include <svcgen/pipeline/process.hh>

#include <clang-c/Index.h>

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <set>
#include <utility>

namespace svcgen::codegen {

namespace {

constexpr const char* style =
    "{BasedOnStyle: LLVM, Standard: c++20, IndentWidth: 4, ColumnLimit: 100, "
    "AccessModifierOffset: -4, EmptyLineBeforeAccessModifier: LogicalBlock, "
    "AllowShortFunctionsOnASingleLine: Empty, AllowShortLambdasOnASingleLine: Empty, "
    "AllowShortIfStatementsOnASingleLine: Never, AllowShortLoopsOnASingleLine: false, "
    "AllowShortBlocksOnASingleLine: Never, BreakBeforeBraces: Attach, "
    "NamespaceIndentation: None, FixNamespaceComments: true, SpacesBeforeTrailingComments: 2, "
    "PointerAlignment: Left, DerivePointerAlignment: false, SortIncludes: CaseSensitive, IncludeBlocks: Preserve, "
    "MaxEmptyLinesToKeep: 1, KeepEmptyLinesAtTheStartOfBlocks: false, ReflowComments: false}";

std::string take_string(CXString s) {
    const char* c = clang_getCString(s);
    std::string result = c != nullptr ? c : "";
    clang_disposeString(s);
    return result;
}

// ============================================================================
// Translation unit
// ============================================================================

/// Owns the index and the translation unit of one parse.
class translation_unit {
public:
    translation_unit(const std::string& file, const std::string& content,
                     const std::vector<std::filesystem::path>& include_dirs)
        : index_(clang_createIndex(0, 0))
    {
        std::vector<std::string> args = {"-x", "c++", "-std=c++20"};
        for (const auto& dir : include_dirs) {
            args.push_back("-I" + dir.string());
        }
        std::vector<const char*> argv;
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }

        CXUnsavedFile unsaved;
        unsaved.Filename = file.c_str();
        unsaved.Contents = content.data();
        unsaved.Length = content.size();

        const CXErrorCode rc = clang_parseTranslationUnit2(
            index_, file.c_str(), argv.data(), static_cast<int>(argv.size()),
            &unsaved, 1, CXTranslationUnit_None, &tu_);
        if (rc != CXError_Success) {
            tu_ = nullptr;
            clang_disposeIndex(index_);
            throw format_error(file, 1, 1, "libclang could not parse the file (error " +
                               std::to_string(static_cast<int>(rc)) + ")", content);
        }
        file_ = clang_getFile(tu_, file.c_str());
    }

    ~translation_unit() {
        if (tu_ != nullptr) {
            clang_disposeTranslationUnit(tu_);
        }
        clang_disposeIndex(index_);
    }

    translation_unit(const translation_unit&) = delete;
    translation_unit& operator=(const translation_unit&) = delete;

    [[nodiscard]] CXTranslationUnit get() const { return tu_; }
    [[nodiscard]] CXFile file() const { return file_; }

private:
    CXIndex index_;
    CXTranslationUnit tu_ = nullptr;
    CXFile file_ = nullptr;
};

/// Throws for the first syntax error in the file itself. Fatal diagnostics
/// (a missing header) and semantic errors are left alone.
void check_syntax(const translation_unit& unit, const std::string& file, const std::string& content) {
    const unsigned count = clang_getNumDiagnostics(unit.get());
    for (unsigned i = 0; i < count; ++i) {
        CXDiagnostic diag = clang_getDiagnostic(unit.get(), i);
        const CXDiagnosticSeverity severity = clang_getDiagnosticSeverity(diag);
        const CXSourceLocation location = clang_getDiagnosticLocation(diag);
        const std::string category = take_string(clang_getDiagnosticCategoryText(diag));
        const bool syntax = severity == CXDiagnostic_Error &&
                            clang_Location_isFromMainFile(location) != 0 &&
                            (category == "Parse Issue" || category == "Lexical or Preprocessor Issue");
        if (!syntax) {
            clang_disposeDiagnostic(diag);
            continue;
        }
        unsigned line = 0;
        unsigned column = 0;
        clang_getSpellingLocation(location, nullptr, &line, &column, nullptr);
        std::string message = take_string(clang_getDiagnosticSpelling(diag));
        clang_disposeDiagnostic(diag);
        throw format_error(file, static_cast<int>(line), static_cast<int>(column), message, content);
    }
}

// ============================================================================
// Tokens
// ============================================================================

struct token {
    CXTokenKind kind = CXToken_Punctuation;
    std::string text;
    unsigned line = 0;
    unsigned begin = 0;     ///< Byte offset
    unsigned end = 0;       ///< Byte offset past the token
    bool namespace_scope = false;
    bool directive = false; ///< Part of a preprocessor line
    bool removed = false;

    [[nodiscard]] bool is_punct(const char* t) const {
        return kind == CXToken_Punctuation && text == t;
    }
    [[nodiscard]] bool is_keyword(const char* t) const {
        return kind == CXToken_Keyword && text == t;
    }
};

bool is_namespace_level(CXCursorKind kind) {
    return kind == CXCursor_TranslationUnit || kind == CXCursor_Namespace ||
           kind == CXCursor_LinkageSpec;
}

/// Whether the declaration starting at location sits directly in a namespace.
/// A declaration clang could not resolve has no cursor of its own, and the
/// location then reports the enclosing scope.
bool at_namespace_scope(CXTranslationUnit tu, CXSourceLocation location) {
    CXCursor cursor = clang_getCursor(tu, location);
    CXCursorKind kind = clang_getCursorKind(cursor);
    if (kind == CXCursor_NamespaceAlias || kind == CXCursor_UsingDeclaration) {
        kind = clang_getCursorKind(clang_getCursorSemanticParent(cursor));
    }
    return !clang_isInvalid(kind) && is_namespace_level(kind);
}

std::vector<token> tokenize(const translation_unit& unit, const std::string& content) {
    CXTranslationUnit tu = unit.get();
    const CXSourceRange range = clang_getRange(
        clang_getLocationForOffset(tu, unit.file(), 0),
        clang_getLocationForOffset(tu, unit.file(), static_cast<unsigned>(content.size())));

    CXToken* raw = nullptr;
    unsigned count = 0;
    clang_tokenize(tu, range, &raw, &count);

    std::vector<token> tokens;
    tokens.reserve(count);
    unsigned directive_line = 0;
    for (unsigned i = 0; i < count; ++i) {
        token t;
        t.kind = clang_getTokenKind(raw[i]);
        t.text = take_string(clang_getTokenSpelling(tu, raw[i]));
        const CXSourceLocation location = clang_getTokenLocation(tu, raw[i]);
        clang_getSpellingLocation(location, nullptr, &t.line, nullptr, &t.begin);
        t.end = t.begin + static_cast<unsigned>(t.text.size());

        const bool starts_line = tokens.empty() || tokens.back().line != t.line;
        if (starts_line && t.is_punct("#")) {
            directive_line = t.line;
        }
        t.directive = directive_line != 0 && t.line == directive_line;

        if (!t.directive && (t.is_keyword("namespace") || t.is_keyword("using"))) {
            t.namespace_scope = at_namespace_scope(tu, location);
        }
        tokens.push_back(std::move(t));
    }
    clang_disposeTokens(tu, raw, count);
    return tokens;
}

// ============================================================================
// Import pruning
// ============================================================================

struct import_decl {
    std::size_t first = 0;     ///< Index of 'namespace' or 'using'
    std::size_t last = 0;      ///< Index of ';'
    ImportSpec spec;
    std::string name;          ///< Name a use refers to
};

struct qualified_name {
    std::string path;
    std::string last;
    int components = 0;
    std::size_t end = 0;       ///< Index of the terminating ';'
};

std::optional<qualified_name> parse_qualified(const std::vector<token>& tokens, std::size_t k) {
    qualified_name q;
    if (k < tokens.size() && tokens[k].is_punct("::")) {
        q.path = "::";
        ++k;
    }
    while (k < tokens.size()) {
        if (tokens[k].kind != CXToken_Identifier) {
            return std::nullopt;
        }
        q.path += tokens[k].text;
        q.last = tokens[k].text;
        ++q.components;
        ++k;
        if (k >= tokens.size()) {
            return std::nullopt;
        }
        if (tokens[k].is_punct(";")) {
            q.end = k;
            return q;
        }
        if (!tokens[k].is_punct("::")) {
            return std::nullopt;
        }
        q.path += "::";
        ++k;
    }
    return std::nullopt;
}

std::vector<import_decl> find_imports(const std::vector<token>& tokens) {
    std::vector<import_decl> imports;
    for (std::size_t k = 0; k < tokens.size(); ++k) {
        const token& t = tokens[k];
        if (!t.namespace_scope || t.removed) {
            continue;
        }
        if (t.is_keyword("namespace")) {
            if (k + 2 >= tokens.size() || tokens[k + 1].kind != CXToken_Identifier ||
                !tokens[k + 2].is_punct("=")) {
                continue;
            }
            auto q = parse_qualified(tokens, k + 3);
            if (!q) {
                continue;
            }
            import_decl decl;
            decl.first = k;
            decl.last = q->end;
            decl.spec.alias = tokens[k + 1].text;
            decl.spec.path = q->path;
            decl.name = tokens[k + 1].text;
            imports.push_back(std::move(decl));
            k = q->end;
        } else if (t.is_keyword("using")) {
            auto q = parse_qualified(tokens, k + 1);
            if (!q || (q->components < 2 && q->path.rfind("::", 0) != 0)) {
                continue;
            }
            import_decl decl;
            decl.first = k;
            decl.last = q->end;
            decl.spec.path = q->path;
            decl.name = q->last;
            imports.push_back(std::move(decl));
            k = q->end;
        }
    }
    return imports;
}

bool is_used(const import_decl& decl, const std::vector<token>& tokens) {
    for (std::size_t k = 0; k < tokens.size(); ++k) {
        const token& t = tokens[k];
        if ((k >= decl.first && k <= decl.last) || t.removed || t.directive) {
            continue;
        }
        if (t.kind != CXToken_Identifier || t.text != decl.name) {
            continue;
        }
        // x::name, obj.name and ptr->name are other entities.
        if (k > 0) {
            const token& prev = tokens[k - 1];
            if (prev.is_punct("::") || prev.is_punct(".") || prev.is_punct("->")) {
                continue;
            }
        }
        if (decl.spec.alias) {
            if (k + 1 < tokens.size() && tokens[k + 1].is_punct("::")) {
                return true;
            }
            continue;
        }
        return true;
    }
    return false;
}

/// Removes unused imports until every remaining one is used. Returns the
/// byte ranges of the removed declarations, in file order.
std::vector<std::pair<unsigned, unsigned>> remove_unused_imports(std::vector<token>& tokens) {
    std::vector<std::pair<unsigned, unsigned>> ranges;
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& decl : find_imports(tokens)) {
            if (is_used(decl, tokens)) {
                continue;
            }
            for (std::size_t i = decl.first; i <= decl.last; ++i) {
                tokens[i].removed = true;
            }
            ranges.emplace_back(tokens[decl.first].begin, tokens[decl.last].end);
            changed = true;
        }
    }
    std::sort(ranges.begin(), ranges.end());
    return ranges;
}

/// content without the given ranges. A line left blank by a removal goes too.
std::string cut(const std::string& content, const std::vector<std::pair<unsigned, unsigned>>& ranges) {
    std::string out;
    std::size_t pos = 0;
    for (const auto& [begin, end] : ranges) {
        std::size_t from = begin;
        std::size_t to = end;
        const std::size_t newline = from == 0 ? std::string::npos : content.rfind('\n', from - 1);
        const std::size_t line_start = newline == std::string::npos ? 0 : newline + 1;
        const std::size_t line_end = content.find('\n', to);
        const bool alone =
            content.find_first_not_of(" \t", line_start) == from &&
            (line_end == std::string::npos ? content.find_first_not_of(" \t\r", to) == std::string::npos
                                           : content.find_first_not_of(" \t\r", to) == line_end);
        if (alone && line_start >= pos) {
            from = line_start;
            to = line_end == std::string::npos ? content.size() : line_end + 1;
        }
        out.append(content, pos, from - pos);
        pos = std::max(pos, to);
    }
    out.append(content, pos, std::string::npos);
    return out;
}

// ============================================================================
// Layout
// ============================================================================

std::string clang_format_program() {
    if (const char* env = std::getenv("SVCGEN_CLANG_FORMAT"); env != nullptr && *env != '\0') {
        return env;
    }
    return SVCGEN_CLANG_FORMAT;
}

std::string layout(const std::string& file, const std::string& content) {
    pipeline::ProcessOptions options;
    options.argv = {
        clang_format_program(),
        std::string("--style=") + style,
        "--assume-filename=" + file,
    };
    options.input = content;
    pipeline::ProcessResult result = pipeline::run_process(options);
    if (!result.success()) {
        const std::string why = result.started ? result.describe_status() + ": " + result.stderr_text
                                               : result.error;
        throw format_error(file, 1, 1, "clang-format failed: " + why, content);
    }

    std::string text = std::move(result.stdout_text);
    text.erase(0, text.find_first_not_of('\n'));
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text + "\n";
}

}  // namespace

// ============================================================================
// format_error
// ============================================================================

format_error::format_error(const std::string& file, int line, int column,
                           const std::string& message, const std::string& content)
    : std::runtime_error(file + ":" + std::to_string(line) + ":" + std::to_string(column) +
                         ": " + message + "\n========\nContent:\n" + content),
      line_(line),
      column_(column),
      diagnostic_(file + ":" + std::to_string(line) + ":" + std::to_string(column) + ": " + message)
{
}

// ============================================================================
// SourceFormatter
// ============================================================================

SourceFormatter::SourceFormatter(std::string file_name, std::vector<std::filesystem::path> include_dirs)
    : file_name_(std::move(file_name))
    , include_dirs_(std::move(include_dirs))
{
}

std::string SourceFormatter::parse_name() const {
    // libclang needs a file name it can place in a directory
    if (file_name_.empty() || file_name_.front() == '<') {
        return "source.cc";
    }
    return file_name_;
}

std::string SourceFormatter::format(const std::string& content) const {
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        return "\n";
    }

    const std::string name = parse_name();
    std::string pruned;
    {
        translation_unit unit(name, content, include_dirs_);
        check_syntax(unit, file_name_, content);
        std::vector<token> tokens = tokenize(unit, content);
        pruned = cut(content, remove_unused_imports(tokens));
    }
    return layout(name, pruned);
}

std::vector<ImportSpec> SourceFormatter::imports(const std::string& content) const {
    translation_unit unit(parse_name(), content, include_dirs_);
    check_syntax(unit, file_name_, content);
    std::vector<token> tokens = tokenize(unit, content);
    std::vector<ImportSpec> specs;
    for (auto& decl : find_imports(tokens)) {
        specs.push_back(std::move(decl.spec));
    }
    return specs;
}

bool is_formattable(const std::filesystem::path& path) {
    static const std::set<std::string> extensions = {
        ".cc", ".cpp", ".cxx", ".c++", ".hh", ".hpp", ".hxx", ".h"
    };
    return extensions.count(path.extension().string()) > 0;
}

const char* canonical_style() {
    return style;
}

}  // namespace svcgen::codegen
