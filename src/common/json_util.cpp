#include "otto/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace otto::common {

namespace {

constexpr int kMaxDepth = 64;

void append_utf8(std::string &out, const unsigned long code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, unsigned long &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const auto ch = static_cast<unsigned char>(raw[i]);
    if (std::isxdigit(ch) == 0) {
      return false;
    }
    out <<= 4;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<unsigned long>(ch - '0');
    } else {
      out |= static_cast<unsigned long>(std::tolower(ch) - 'a' + 10);
    }
  }
  return true;
}

// Strict recursive-descent scanner. Each scan_* returns the position just past the
// value, or npos when the input is malformed.
class JsonScanner {
public:
  explicit JsonScanner(const std::string &text) : text_(text) {}

  [[nodiscard]] std::size_t scan_value(std::size_t pos, const int depth) const {
    if (depth > kMaxDepth) {
      return std::string::npos;
    }
    pos = json_skip_ws(text_, pos);
    if (pos >= text_.size()) {
      return std::string::npos;
    }
    const char ch = text_[pos];
    if (ch == '{') {
      return scan_object(pos, depth);
    }
    if (ch == '[') {
      return scan_array(pos, depth);
    }
    if (ch == '"') {
      return scan_string(pos);
    }
    if (ch == '-' || (ch >= '0' && ch <= '9')) {
      return scan_number(pos);
    }
    for (const char *literal : {"true", "false", "null"}) {
      const std::string word(literal);
      if (text_.compare(pos, word.size(), word) == 0) {
        return pos + word.size();
      }
    }
    return std::string::npos;
  }

  [[nodiscard]] std::size_t scan_string(const std::size_t pos) const {
    if (pos >= text_.size() || text_[pos] != '"') {
      return std::string::npos;
    }
    for (std::size_t i = pos + 1; i < text_.size(); ++i) {
      const auto ch = static_cast<unsigned char>(text_[i]);
      if (ch == '"') {
        return i + 1;
      }
      if (ch < 0x20) {
        return std::string::npos;
      }
      if (ch == '\\') {
        if (i + 1 >= text_.size()) {
          return std::string::npos;
        }
        const char esc = text_[i + 1];
        if (esc == 'u') {
          unsigned long ignored = 0;
          if (!parse_hex4(text_, i + 2, ignored)) {
            return std::string::npos;
          }
          i += 5;
        } else if (esc == '"' || esc == '\\' || esc == '/' || esc == 'b' || esc == 'f' ||
                   esc == 'n' || esc == 'r' || esc == 't') {
          ++i;
        } else {
          return std::string::npos;
        }
      }
    }
    return std::string::npos;
  }

  [[nodiscard]] std::size_t scan_number(std::size_t pos) const {
    const auto digit_at = [this](const std::size_t p) {
      return p < text_.size() && text_[p] >= '0' && text_[p] <= '9';
    };
    if (pos < text_.size() && text_[pos] == '-') {
      ++pos;
    }
    if (!digit_at(pos)) {
      return std::string::npos;
    }
    if (text_[pos] == '0') {
      ++pos;
    } else {
      while (digit_at(pos)) {
        ++pos;
      }
    }
    if (pos < text_.size() && text_[pos] == '.') {
      ++pos;
      if (!digit_at(pos)) {
        return std::string::npos;
      }
      while (digit_at(pos)) {
        ++pos;
      }
    }
    if (pos < text_.size() && (text_[pos] == 'e' || text_[pos] == 'E')) {
      ++pos;
      if (pos < text_.size() && (text_[pos] == '+' || text_[pos] == '-')) {
        ++pos;
      }
      if (!digit_at(pos)) {
        return std::string::npos;
      }
      while (digit_at(pos)) {
        ++pos;
      }
    }
    return pos;
  }

  [[nodiscard]] std::size_t scan_array(std::size_t pos, const int depth) const {
    ++pos;
    pos = json_skip_ws(text_, pos);
    if (pos < text_.size() && text_[pos] == ']') {
      return pos + 1;
    }
    while (true) {
      pos = scan_value(pos, depth + 1);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return std::string::npos;
      }
      if (text_[pos] == ']') {
        return pos + 1;
      }
      if (text_[pos] != ',') {
        return std::string::npos;
      }
      ++pos;
    }
  }

  [[nodiscard]] std::size_t scan_object(std::size_t pos, const int depth) const {
    ++pos;
    pos = json_skip_ws(text_, pos);
    if (pos < text_.size() && text_[pos] == '}') {
      return pos + 1;
    }
    while (true) {
      pos = json_skip_ws(text_, pos);
      pos = scan_string(pos);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size() || text_[pos] != ':') {
        return std::string::npos;
      }
      pos = scan_value(pos + 1, depth + 1);
      if (pos == std::string::npos) {
        return pos;
      }
      pos = json_skip_ws(text_, pos);
      if (pos >= text_.size()) {
        return std::string::npos;
      }
      if (text_[pos] == '}') {
        return pos + 1;
      }
      if (text_[pos] != ',') {
        return std::string::npos;
      }
      ++pos;
    }
  }

private:
  const std::string &text_;
};

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_quote_or_null(const std::optional<std::string> &value) {
  return value.has_value() ? json_quote(*value) : std::string("null");
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned long code_point = 0;
      if (!parse_hex4(raw, i + 1, code_point)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      // Surrogate pair.
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < raw.size() + 1 &&
          raw.compare(i + 1, 2, "\\u") == 0) {
        unsigned long low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

bool json_validate(const std::string &text) {
  const JsonScanner scanner(text);
  const auto end = scanner.scan_value(0, 0);
  if (end == std::string::npos) {
    return false;
  }
  return json_skip_ws(text, end) == text.size();
}

std::optional<JsonRawMap> json_object_members(const std::string &json) {
  const JsonScanner scanner(json);
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::nullopt;
  }
  const auto object_end = scanner.scan_object(pos, 0);
  if (object_end == std::string::npos || json_skip_ws(json, object_end) != json.size()) {
    return std::nullopt;
  }

  JsonRawMap members;
  pos = json_skip_ws(json, pos + 1);
  while (pos < object_end && json[pos] != '}') {
    const auto key_end = scanner.scan_string(pos);
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 2));
    pos = json_skip_ws(json, key_end);
    const auto value_start = json_skip_ws(json, pos + 1);
    const auto value_end = scanner.scan_value(value_start, 1);
    members[key] = json.substr(value_start, value_end - value_start);
    pos = json_skip_ws(json, value_end);
    if (json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
    }
  }
  return members;
}

std::optional<std::vector<std::string>> json_array_elements(const std::string &array_json) {
  const JsonScanner scanner(array_json);
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return std::nullopt;
  }
  const auto array_end = scanner.scan_array(pos, 0);
  if (array_end == std::string::npos || json_skip_ws(array_json, array_end) != array_json.size()) {
    return std::nullopt;
  }

  std::vector<std::string> out;
  pos = json_skip_ws(array_json, pos + 1);
  while (pos < array_end && array_json[pos] != ']') {
    const auto value_end = scanner.scan_value(pos, 1);
    out.push_back(array_json.substr(pos, value_end - pos));
    pos = json_skip_ws(array_json, value_end);
    if (array_json[pos] == ',') {
      pos = json_skip_ws(array_json, pos + 1);
    }
  }
  return out;
}

std::optional<std::string> json_as_string(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return std::nullopt;
  }
  return json_unescape(raw.substr(1, raw.size() - 2));
}

std::optional<long long> json_as_integer(const std::string &raw) {
  long long value = 0;
  const char *begin = raw.data();
  const char *end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<bool> json_as_bool(const std::string &raw) {
  if (raw == "true") {
    return true;
  }
  if (raw == "false") {
    return false;
  }
  return std::nullopt;
}

std::string json_pretty(const std::string &json, const std::size_t indent) {
  std::string out;
  out.reserve(json.size() * 2);
  std::size_t depth = 0;
  const auto newline = [&]() {
    out.push_back('\n');
    out.append(depth * indent, ' ');
  };

  for (std::size_t i = 0; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        out.append(json, i, std::string::npos);
        break;
      }
      out.append(json, i, end - i + 1);
      i = end;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    if (ch == '{' || ch == '[') {
      const char close = ch == '{' ? '}' : ']';
      const auto next = json_skip_ws(json, i + 1);
      if (next < json.size() && json[next] == close) {
        out.push_back(ch);
        out.push_back(close);
        i = next;
        continue;
      }
      out.push_back(ch);
      ++depth;
      newline();
    } else if (ch == '}' || ch == ']') {
      depth = depth > 0 ? depth - 1 : 0;
      newline();
      out.push_back(ch);
    } else if (ch == ',') {
      out.push_back(',');
      newline();
    } else if (ch == ':') {
      out += ": ";
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

} // namespace otto::common
