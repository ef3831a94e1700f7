// src/parser/expression_parser.cpp
#include "abstractchain/parser/expression_parser.h"
#include "common/utils.h"
#include <cctype>

namespace abstractchain {

namespace {

constexpr size_t SNIPPET_LENGTH = 48;

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void skip_spaces(const std::string& text, size_t& i) {
    while (i < text.size() && is_space(text[i])) ++i;
}

std::string read_identifier(const std::string& text, size_t& i) {
    size_t start = i;
    if (i < text.size() && (std::isalpha(static_cast<unsigned char>(text[i])) || text[i] == '_')) {
        ++i;
        while (i < text.size() && (std::isalnum(static_cast<unsigned char>(text[i])) || text[i] == '_')) ++i;
    }
    return text.substr(start, i - start);
}

char closer_for(char opener) {
    switch (opener) {
        case '(': return ')';
        case '[': return ']';
        default:  return '}';
    }
}

// A quote only opens a string at the start of a token or right after a
// delimiter, so apostrophes inside bare words (Uber's) stay literal text.
bool quote_allowed_after(char last_significant) {
    return last_significant == 0 || last_significant == '(' || last_significant == '[' ||
           last_significant == '{' || last_significant == ',' || last_significant == ':';
}

// Decodes `raw` if it is exactly one quoted string, e.g. "a, b" or 'it\'s'.
std::optional<std::string> decode_quoted(std::string_view raw) {
    if (raw.size() < 2) return std::nullopt;
    char quote = raw.front();
    if (quote != '"' && quote != '\'') return std::nullopt;

    std::string out;
    for (size_t i = 1; i < raw.size(); ++i) {
        char c = raw[i];
        if (c == '\\' && i + 1 < raw.size()) {
            char next = raw[++i];
            switch (next) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                default:  out += next; break;
            }
            continue;
        }
        if (c == quote) {
            // closing quote must end the token
            if (i + 1 != raw.size()) return std::nullopt;
            return out;
        }
        out += c;
    }
    return std::nullopt;
}

std::string make_snippet(const std::string& text, size_t pos) {
    std::string snippet = text.substr(pos, SNIPPET_LENGTH);
    if (pos + SNIPPET_LENGTH < text.size()) snippet += "...";
    return snippet;
}

} // namespace

ExpressionParser::ExpressionParser(std::unordered_set<std::string> function_names)
    : function_names_(std::move(function_names)) {}

ExpressionParser::ExpressionParser(const std::vector<std::string>& function_names)
    : function_names_(function_names.begin(), function_names.end()) {}

bool ExpressionParser::contains_markers(std::string_view text) {
    return text.find(MARKER) != std::string_view::npos;
}

bool ExpressionParser::scan_arguments(const std::string& text, size_t& i,
                                      std::vector<RawArgument>& out, std::string& error) const {
    std::vector<char> openers;
    char quote = 0;
    char last_significant = 0;
    size_t token_start = i;
    bool saw_comma = false;

    auto push_token = [&](size_t token_end) -> bool {
        std::string raw = trim(std::string_view(text).substr(token_start, token_end - token_start));
        if (raw.empty()) {
            error = "empty argument";
            return false;
        }
        RawArgument arg;
        arg.quoted = decode_quoted(raw);
        arg.text = std::move(raw);
        out.push_back(std::move(arg));
        return true;
    };

    for (; i < text.size(); ++i) {
        char c = text[i];

        if (quote != 0) {
            if (c == '\\') {
                ++i; // skip escaped character
            } else if (c == quote) {
                quote = 0;
                last_significant = c;
            }
            continue;
        }

        if ((c == '"' || c == '\'') && quote_allowed_after(last_significant)) {
            quote = c;
            continue;
        }

        if (c == '(' || c == '[' || c == '{') {
            openers.push_back(c);
        } else if (c == ')' || c == ']' || c == '}') {
            if (openers.empty()) {
                if (c != ')') {
                    error = std::string("unbalanced '") + c + "' in arguments";
                    return false;
                }
                // end of the argument list
                bool empty_list = !saw_comma && trim(std::string_view(text).substr(token_start, i - token_start)).empty();
                if (!empty_list && !push_token(i)) {
                    return false;
                }
                ++i;
                return true;
            }
            if (closer_for(openers.back()) != c) {
                error = std::string("mismatched '") + c + "' in arguments";
                return false;
            }
            openers.pop_back();
        } else if (c == ',' && openers.empty()) {
            if (!push_token(i)) {
                return false;
            }
            saw_comma = true;
            token_start = i + 1;
            last_significant = 0;
            continue;
        }

        if (!is_space(c)) {
            last_significant = c;
        }
    }

    error = quote != 0 ? "unterminated string literal" : "unterminated argument list";
    return false;
}

std::optional<ExpressionParser::RawCall> ExpressionParser::scan_marker(
    const std::string& text, size_t pos, std::string& error) const {
    RawCall call;
    size_t i = pos + MARKER.size();

    if (i >= text.size() || !is_space(text[i])) {
        error = "expected whitespace after [FUNC";
        return std::nullopt;
    }
    skip_spaces(text, i);

    call.function_name = read_identifier(text, i);
    if (call.function_name.empty()) {
        error = "expected function name";
        return std::nullopt;
    }

    skip_spaces(text, i);
    if (i >= text.size() || text[i] != '(') {
        error = "expected '(' after function name '" + call.function_name + "'";
        return std::nullopt;
    }
    ++i;

    if (!scan_arguments(text, i, call.arguments, error)) {
        return std::nullopt;
    }

    skip_spaces(text, i);
    if (i >= text.size() || text[i] != '=') {
        error = "expected '=' after argument list";
        return std::nullopt;
    }
    ++i;
    skip_spaces(text, i);

    call.placeholder = read_identifier(text, i);
    if (call.placeholder.empty()) {
        error = "expected placeholder identifier after '='";
        return std::nullopt;
    }

    skip_spaces(text, i);
    if (i >= text.size() || text[i] != ']') {
        error = "expected ']' after placeholder '" + call.placeholder + "'";
        return std::nullopt;
    }
    ++i;

    call.span = SourceSpan{pos, i - pos};
    return call;
}

ParseOutput ExpressionParser::parse(const std::string& text) const {
    ParseOutput output;
    std::vector<RawCall> recognised;

    // 1. 扫描所有标记
    size_t pos = text.find(MARKER);
    while (pos != std::string::npos) {
        std::string error;
        auto raw = scan_marker(text, pos, error);
        if (!raw) {
            output.diagnostics.push_back({ParseDiagnostic::Kind::MALFORMED, pos,
                                          "malformed call expression: " + error,
                                          make_snippet(text, pos)});
            pos = text.find(MARKER, pos + 1);
            continue;
        }

        size_t next = raw->span.end();
        if (function_names_.count(raw->function_name) == 0) {
            output.diagnostics.push_back({ParseDiagnostic::Kind::UNKNOWN_FUNCTION, pos,
                                          "unknown function '" + raw->function_name + "'",
                                          text.substr(pos, raw->span.length)});
        } else {
            recognised.push_back(std::move(*raw));
        }
        pos = text.find(MARKER, next);
    }

    // 2. 收集占位符及其前缀
    std::unordered_set<Placeholder> defined;
    std::unordered_set<std::string> stems;
    for (const auto& call : recognised) {
        defined.insert(call.placeholder);
        std::string stem, digits;
        if (split_placeholder_shape(call.placeholder, stem, digits)) {
            stems.insert(stem);
        }
    }

    auto is_reference = [&](const std::string& token) {
        if (!is_identifier(token)) return false;
        if (defined.count(token) > 0) return true;
        std::string stem, digits;
        return split_placeholder_shape(token, stem, digits) && stems.count(stem) > 0;
    };

    // 3. 分类参数
    output.calls.reserve(recognised.size());
    for (auto& raw : recognised) {
        CallExpression call;
        call.function_name = std::move(raw.function_name);
        call.output_placeholder = std::move(raw.placeholder);
        call.source_span = raw.span;

        for (auto& raw_arg : raw.arguments) {
            ArgumentToken token;
            if (raw_arg.quoted) {
                token.kind = ArgumentToken::Kind::LITERAL;
                token.literal = *raw_arg.quoted;
            } else if (is_reference(raw_arg.text)) {
                token.kind = ArgumentToken::Kind::REFERENCE;
                token.reference = raw_arg.text;
            } else {
                token.kind = ArgumentToken::Kind::LITERAL;
                token.literal = coerce_scalar(raw_arg.text);
            }
            token.raw = std::move(raw_arg.text);
            call.arguments.push_back(std::move(token));
        }
        output.calls.push_back(std::move(call));
    }

    return output;
}

} // namespace abstractchain
