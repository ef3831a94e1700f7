// abstractchain/parser/expression_parser.h
#ifndef ABSTRACTCHAIN_PARSER_EXPRESSION_PARSER_H
#define ABSTRACTCHAIN_PARSER_EXPRESSION_PARSER_H

#include "common/types.h"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace abstractchain {

struct ParseDiagnostic {
    enum class Kind : uint8_t {
        MALFORMED,
        UNKNOWN_FUNCTION
    };

    Kind kind = Kind::MALFORMED;
    size_t offset = 0;        // position of the '[' that opened the marker
    std::string message;
    std::string snippet;
};

struct ParseOutput {
    std::vector<CallExpression> calls;          // textual order
    std::vector<ParseDiagnostic> diagnostics;   // non-fatal
};

// Extracts `[FUNC name(arg, ...) = placeholder]` markers from free text.
//
// Malformed markers and markers naming an unknown function are reported as
// diagnostics and left in the text as inert content. Argument tokens are
// classified as follows:
//   - a quoted token is always a string literal;
//   - an unquoted identifier naming a placeholder defined anywhere in the plan
//     is a reference (forward references included);
//   - an unquoted identifier with the same stem as the plan's placeholders
//     followed by digits (e.g. `y5` next to `y1`) is a reference too;
//   - anything else is coerced to integer, float, boolean, JSON, else string.
class ExpressionParser {
public:
    static constexpr std::string_view MARKER = "[FUNC";

    explicit ExpressionParser(std::unordered_set<std::string> function_names);
    explicit ExpressionParser(const std::vector<std::string>& function_names);

    ParseOutput parse(const std::string& text) const;

    // True if the text still contains something that starts a marker
    static bool contains_markers(std::string_view text);

private:
    struct RawArgument {
        std::string text;   // trimmed source text
        std::optional<std::string> quoted;  // decoded value if the whole token is one quoted string
    };

    struct RawCall {
        std::string function_name;
        std::vector<RawArgument> arguments;
        Placeholder placeholder;
        SourceSpan span;
    };

    std::unordered_set<std::string> function_names_;

    // Scans one marker starting at `pos` (which points at "[FUNC").
    // Returns std::nullopt and fills `error` when the marker is malformed.
    std::optional<RawCall> scan_marker(const std::string& text, size_t pos, std::string& error) const;
    bool scan_arguments(const std::string& text, size_t& i, std::vector<RawArgument>& out, std::string& error) const;
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_PARSER_EXPRESSION_PARSER_H
