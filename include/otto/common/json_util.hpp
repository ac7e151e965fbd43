#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace otto::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// json_quote for present values, the literal null otherwise.
[[nodiscard]] std::string json_quote_or_null(const std::optional<std::string> &value);

/// Unescape the body of a JSON string literal (without its quotes), including \uXXXX.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// True when `text` is exactly one well-formed JSON value (RFC 8259), surrounding
/// whitespace allowed.
[[nodiscard]] bool json_validate(const std::string &text);

/// Top-level members of a JSON object, each mapped to its raw JSON text (strings keep
/// their quotes). Returns nullopt when `json` is not a well-formed object.
using JsonRawMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] std::optional<JsonRawMap> json_object_members(const std::string &json);

/// Raw JSON text of each element of a well-formed array, in order.
[[nodiscard]] std::optional<std::vector<std::string>>
json_array_elements(const std::string &array_json);

/// Decode a raw JSON string token ("...") to its value; nullopt if `raw` is not a string.
[[nodiscard]] std::optional<std::string> json_as_string(const std::string &raw);

/// Parse a raw JSON integer token; nullopt for non-integers or out-of-range values.
[[nodiscard]] std::optional<long long> json_as_integer(const std::string &raw);

/// Parse a raw JSON boolean token.
[[nodiscard]] std::optional<bool> json_as_bool(const std::string &raw);

/// Re-indents a well-formed JSON document with `indent` spaces per level.
[[nodiscard]] std::string json_pretty(const std::string &json, std::size_t indent = 2);

} // namespace otto::common
