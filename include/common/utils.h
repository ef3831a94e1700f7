#ifndef ABSTRACTCHAIN_COMMON_UTILS_H
#define ABSTRACTCHAIN_COMMON_UTILS_H

#include "types.h"
#include <string>
#include <string_view>
#include <vector>

namespace abstractchain {

// Helper: check if string is a valid integer or float
bool is_integer(std::string_view s);
bool is_float(std::string_view s);

// [A-Za-z_][A-Za-z0-9_]*
bool is_identifier(std::string_view s);

// Splits "y12" into ("y", "12"); returns false if there is no alphabetic stem
// or no numeric suffix.
bool split_placeholder_shape(std::string_view s, std::string& stem, std::string& digits);

// Coerce an unquoted scalar token to the simplest matching type:
// integer, float, boolean, JSON array/object, else string.
Value coerce_scalar(const std::string& token);

// Literal rendering of a tool result inside a filled plan.
// Strings are emitted verbatim, everything else as JSON text.
std::string render_value(const Value& value);

// Value::dump() that replaces invalid UTF-8 instead of throwing
std::string dump_lossy(const Value& value, int indent = -1);

std::string trim(std::string_view s);

// Joins argument values as "3, 2" for error messages
std::string join_values(const std::vector<Value>& values);

} // namespace abstractchain

#endif // ABSTRACTCHAIN_COMMON_UTILS_H
