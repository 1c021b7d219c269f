#pragma once

#include "diagnostics.hpp"
#include "folio/nodes/document.hpp"
#include <vector>

namespace folio::parser {

// ============================================================================
// Configuration
// ============================================================================

struct ParserOptions {
    // Fail the parse when any diagnostic was recorded
    bool strict{true};
    // Element nesting limit enforced by the markup tokenizer
    usize max_depth{512};
};

// ============================================================================
// ParseError
// ============================================================================

enum class ParseErrorKind : u8 {
    // Input could not be tokenized (malformed UTF-8, NUL, nesting too deep)
    Tokenize,
    // Strict parse with a non-empty diagnostics list
    Diagnostics,
};

[[nodiscard]] std::string_view parse_error_kind_name(ParseErrorKind kind);

struct ParseError {
    ParseErrorKind kind;
    String message;
    std::vector<String> diagnostics;
};

// ============================================================================
// Parser - storage-format markup to Document
// ============================================================================

// Holds configuration only; every parse call gets its own diagnostics
// collector, so one Parser may be shared between threads.
class Parser {
public:
    Parser() = default;
    explicit Parser(ParserOptions options) : m_options(options) {}

    [[nodiscard]] Result<nodes::Document, ParseError> parse(std::string_view input) const;

    void set_strict(bool strict) { m_options.strict = strict; }
    [[nodiscard]] bool strict() const { return m_options.strict; }

    void set_max_depth(usize max_depth) { m_options.max_depth = max_depth; }
    [[nodiscard]] usize max_depth() const { return m_options.max_depth; }

    [[nodiscard]] const ParserOptions& options() const { return m_options; }

private:
    ParserOptions m_options;
};

// ============================================================================
// Convenience functions
// ============================================================================

[[nodiscard]] Result<nodes::Document, ParseError> parse(std::string_view input,
                                                        const ParserOptions& options = {});

} // namespace folio::parser
