#pragma once

#include "otto/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace otto::common {

/// Flat view of a TOML file: `[section]` headers fold into dotted keys, values are kept
/// as their raw text and decoded on access.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::optional<std::string> find_string(const std::string &key) const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::optional<std::int64_t> find_i64(const std::string &key) const;
  [[nodiscard]] std::int64_t get_i64(const std::string &key, std::int64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

/// Parses a TOML subset: tables, strings (basic, literal, multi-line basic), integers,
/// booleans and single-line string arrays.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

/// Loads `path`; a missing file yields an empty document.
[[nodiscard]] Result<TomlDocument> load_toml_file(const std::filesystem::path &path);

} // namespace otto::common
