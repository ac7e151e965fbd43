#include "otto/common/toml.hpp"

#include "otto/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace otto::common {

namespace {

constexpr const char *kMultilineQuote = "\"\"\"";

std::string strip_comment(const std::string &line) {
  bool in_basic = false;
  bool in_literal = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && !in_literal && (i == 0 || line[i - 1] != '\\')) {
      in_basic = !in_basic;
    } else if (ch == '\'' && !in_basic) {
      in_literal = !in_literal;
    }
    if (!in_basic && !in_literal && ch == '#') {
      break;
    }
    output.push_back(ch);
  }
  return output;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (ch == '"' && (i == 0 || body[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }
  return result;
}

std::string unescape_basic(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    switch (body[++i]) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(body[i]);
      break;
    }
  }
  return out;
}

std::optional<std::string> decode_string(std::string raw) {
  raw = trim(raw);
  if (raw.size() >= 6 && starts_with(raw, kMultilineQuote) &&
      raw.compare(raw.size() - 3, 3, kMultilineQuote) == 0) {
    std::string body = raw.substr(3, raw.size() - 6);
    // A newline right after the opening delimiter is trimmed.
    if (!body.empty() && body.front() == '\n') {
      body.erase(0, 1);
    }
    return unescape_basic(body);
  }
  if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
    return unescape_basic(raw.substr(1, raw.size() - 2));
  }
  if (raw.size() >= 2 && raw.front() == '\'' && raw.back() == '\'') {
    return raw.substr(1, raw.size() - 2);
  }
  return std::nullopt;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::optional<std::string> TomlDocument::find_string(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return decode_string(it->second);
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  return find_string(key).value_or(fallback);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = trim(it->second);
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::optional<std::int64_t> TomlDocument::find_i64(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  std::string normalized = trim(it->second);
  // TOML allows underscores between digits.
  std::erase(normalized, '_');
  std::int64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  if (first != last && *first == '+') {
    ++first;
  }
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::int64_t TomlDocument::get_i64(const std::string &key, const std::int64_t fallback) const {
  return find_i64(key).value_or(fallback);
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (auto decoded = decode_string(element); decoded.has_value()) {
      out.push_back(std::move(*decoded));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }
    const std::string key = trim(clean_line.substr(0, equals_index));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number));
    }

    // Multi-line basic strings are taken verbatim from the raw lines, comments included.
    std::string value = trim(line.substr(line.find('=') + 1));
    if (starts_with(value, kMultilineQuote) &&
        (value.size() < 6 || value.compare(value.size() - 3, 3, kMultilineQuote) != 0)) {
      const std::size_t start_line = line_number;
      std::string continuation;
      bool closed = false;
      while (std::getline(stream, continuation)) {
        ++line_number;
        value += "\n" + continuation;
        const std::string tail = trim(continuation);
        if (tail.size() >= 3 && tail.compare(tail.size() - 3, 3, kMultilineQuote) == 0) {
          value = trim(value);
          closed = true;
          break;
        }
      }
      if (!closed) {
        return Result<TomlDocument>::failure("Unterminated multi-line string at line " +
                                             std::to_string(start_line));
      }
    } else {
      value = trim(clean_line.substr(equals_index + 1));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

Result<TomlDocument> load_toml_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Result<TomlDocument>::success(TomlDocument{});
  }
  auto content = read_text_file(path);
  if (!content.ok()) {
    return Result<TomlDocument>::failure(content.error());
  }
  auto parsed = parse_toml(content.value());
  if (!parsed.ok()) {
    return Result<TomlDocument>::failure(path.string() + ": " + parsed.error());
  }
  return parsed;
}

} // namespace otto::common
