// src/common/utils.cpp
#include "common/utils.h"
#include <cctype>
#include <stdexcept>
#include <string>

namespace abstractchain {

bool is_integer(std::string_view s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    if (start >= s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool is_float(std::string_view s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-' || s[0] == '+') ? 1 : 0;
    bool has_dot = false;
    bool has_digit = false;
    bool has_exp = false;
    for (size_t i = start; i < s.size(); ++i) {
        char c = s[i];
        if (c == '.') {
            if (has_dot || has_exp) return false;
            has_dot = true;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            has_digit = true;
        } else if ((c == 'e' || c == 'E') && has_digit && !has_exp) {
            has_exp = true;
            has_digit = false; // exponent needs its own digits
            if (i + 1 < s.size() && (s[i + 1] == '-' || s[i + 1] == '+')) ++i;
        } else {
            return false;
        }
    }
    return has_digit;
}

bool is_identifier(std::string_view s) {
    if (s.empty()) return false;
    auto first = static_cast<unsigned char>(s[0]);
    if (!std::isalpha(first) && s[0] != '_') return false;
    for (char c : s.substr(1)) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_') return false;
    }
    return true;
}

bool split_placeholder_shape(std::string_view s, std::string& stem, std::string& digits) {
    if (!is_identifier(s)) return false;
    size_t pos = s.size();
    while (pos > 0 && std::isdigit(static_cast<unsigned char>(s[pos - 1]))) {
        --pos;
    }
    if (pos == 0 || pos == s.size()) return false;
    stem = std::string(s.substr(0, pos));
    digits = std::string(s.substr(pos));
    return true;
}

Value coerce_scalar(const std::string& token) {
    if (token == "true" || token == "True") return true;
    if (token == "false" || token == "False") return false;

    if (is_integer(token)) {
        try {
            return std::stoll(token);
        } catch (const std::out_of_range&) {
            // too wide for int64, fall through to float
        }
    }
    if (is_float(token)) {
        try {
            return std::stod(token);
        } catch (const std::out_of_range&) {
            return token;
        }
    }

    if (!token.empty() && (token.front() == '[' || token.front() == '{')) {
        Value parsed = Value::parse(token, nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }
    return token;
}

std::string render_value(const Value& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return dump_lossy(value);
}

std::string dump_lossy(const Value& value, int indent) {
    return value.dump(indent, ' ', false, Value::error_handler_t::replace);
}

std::string trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(begin, end - begin));
}

std::string join_values(const std::vector<Value>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += dump_lossy(values[i]);
    }
    return out;
}

} // namespace abstractchain
