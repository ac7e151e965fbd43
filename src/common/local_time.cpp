#include "otto/common/local_time.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace otto::common {

namespace {

constexpr const char *kZoneinfoRoot = "/usr/share/zoneinfo";
constexpr std::int64_t kSecondsPerDay = 86'400;
constexpr std::size_t kHeaderSize = 44;
constexpr std::int64_t kDefaultRuleTime = 2 * 3600;

std::int64_t floor_div(const std::int64_t value, const std::int64_t divisor) {
  std::int64_t quotient = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
    --quotient;
  }
  return quotient;
}

bool is_leap_year(const std::int64_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(const std::int64_t year, const int month) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return month == 2 && is_leap_year(year) ? 29 : kDays[month - 1];
}

// Days since 1970-01-01 of a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t year, const int month, const int day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = floor_div(year, 400);
  const std::int64_t year_of_era = year - era * 400;
  const std::int64_t day_of_year = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const std::int64_t day_of_era =
      year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
  return era * 146'097 + day_of_era - 719'468;
}

struct CivilDate {
  std::int64_t year = 1970;
  int month = 1;
  int day = 1;
};

CivilDate civil_from_days(std::int64_t days) {
  days += 719'468;
  const std::int64_t era = floor_div(days, 146'097);
  const std::int64_t day_of_era = days - era * 146'097;
  const std::int64_t year_of_era =
      (day_of_era - day_of_era / 1460 + day_of_era / 36'524 - day_of_era / 146'096) / 365;
  const std::int64_t day_of_year =
      day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
  const std::int64_t mp = (5 * day_of_year + 2) / 153;
  const int day = static_cast<int>(day_of_year - (153 * mp + 2) / 5 + 1);
  const int month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  return CivilDate{year_of_era + era * 400 + (month <= 2 ? 1 : 0), month, day};
}

// 0 = Sunday.
int weekday_from_days(const std::int64_t days) {
  const std::int64_t weekday = (days + 4) % 7;
  return static_cast<int>(weekday < 0 ? weekday + 7 : weekday);
}

/// One `start` or `end` field of a POSIX TZ rule: Jn, n or Mm.w.d, plus a local time.
struct RuleDate {
  enum class Kind { Julian, ZeroBased, MonthWeekDay };
  Kind kind = Kind::MonthWeekDay;
  int day = 0;
  int month = 0;
  int week = 0;
  std::int64_t time = kDefaultRuleTime;
};

/// The TZ string footer of a TZif file, used past the last explicit transition.
struct PosixRule {
  std::int64_t std_offset = 0;
  std::optional<std::int64_t> dst_offset;
  std::optional<RuleDate> start;
  std::optional<RuleDate> end;
};

class PosixParser {
public:
  explicit PosixParser(const std::string &text) : text_(text) {}

  std::optional<PosixRule> parse() {
    PosixRule rule;
    if (!skip_name()) {
      return std::nullopt;
    }
    const auto std_offset = parse_offset();
    if (!std_offset.has_value()) {
      return std::nullopt;
    }
    rule.std_offset = *std_offset;
    if (at_end()) {
      return rule;
    }
    if (!skip_name()) {
      return std::nullopt;
    }
    rule.dst_offset = rule.std_offset + 3600;
    if (!at_end() && peek() != ',') {
      const auto dst_offset = parse_offset();
      if (!dst_offset.has_value()) {
        return std::nullopt;
      }
      rule.dst_offset = *dst_offset;
    }
    if (at_end()) {
      // Without transition dates the zone stays on standard time.
      rule.dst_offset.reset();
      return rule;
    }
    if (!consume(',')) {
      return std::nullopt;
    }
    rule.start = parse_rule_date();
    if (!rule.start.has_value() || !consume(',')) {
      return std::nullopt;
    }
    rule.end = parse_rule_date();
    if (!rule.end.has_value() || !at_end()) {
      return std::nullopt;
    }
    return rule;
  }

private:
  [[nodiscard]] bool at_end() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const { return at_end() ? '\0' : text_[pos_]; }

  bool consume(const char expected) {
    if (peek() != expected) {
      return false;
    }
    ++pos_;
    return true;
  }

  bool skip_name() {
    if (consume('<')) {
      const auto close = text_.find('>', pos_);
      if (close == std::string::npos) {
        return false;
      }
      pos_ = close + 1;
      return true;
    }
    const std::size_t start = pos_;
    while (!at_end() && std::isalpha(static_cast<unsigned char>(peek())) != 0) {
      ++pos_;
    }
    return pos_ - start >= 3;
  }

  std::optional<std::int64_t> parse_number() {
    const std::size_t start = pos_;
    std::int64_t value = 0;
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
      value = value * 10 + (peek() - '0');
      ++pos_;
    }
    if (pos_ == start) {
      return std::nullopt;
    }
    return value;
  }

  // [+-]hh[:mm[:ss]] in seconds.
  std::optional<std::int64_t> parse_clock() {
    std::int64_t sign = 1;
    if (consume('-')) {
      sign = -1;
    } else {
      consume('+');
    }
    const auto hours = parse_number();
    if (!hours.has_value()) {
      return std::nullopt;
    }
    std::int64_t seconds = *hours * 3600;
    if (consume(':')) {
      const auto minutes = parse_number();
      if (!minutes.has_value()) {
        return std::nullopt;
      }
      seconds += *minutes * 60;
      if (consume(':')) {
        const auto secs = parse_number();
        if (!secs.has_value()) {
          return std::nullopt;
        }
        seconds += *secs;
      }
    }
    return sign * seconds;
  }

  // POSIX offsets count westward; this returns the UTC offset (east positive).
  std::optional<std::int64_t> parse_offset() {
    const auto clock = parse_clock();
    if (!clock.has_value()) {
      return std::nullopt;
    }
    return -*clock;
  }

  std::optional<RuleDate> parse_rule_date() {
    RuleDate date;
    if (consume('M')) {
      date.kind = RuleDate::Kind::MonthWeekDay;
      const auto month = parse_number();
      if (!month.has_value() || !consume('.')) {
        return std::nullopt;
      }
      const auto week = parse_number();
      if (!week.has_value() || !consume('.')) {
        return std::nullopt;
      }
      const auto day = parse_number();
      if (!day.has_value() || *month < 1 || *month > 12 || *week < 1 || *week > 5 || *day > 6) {
        return std::nullopt;
      }
      date.month = static_cast<int>(*month);
      date.week = static_cast<int>(*week);
      date.day = static_cast<int>(*day);
    } else {
      date.kind = consume('J') ? RuleDate::Kind::Julian : RuleDate::Kind::ZeroBased;
      const auto day = parse_number();
      if (!day.has_value() || *day > 365 ||
          (date.kind == RuleDate::Kind::Julian && *day < 1)) {
        return std::nullopt;
      }
      date.day = static_cast<int>(*day);
    }
    if (consume('/')) {
      const auto time = parse_clock();
      if (!time.has_value()) {
        return std::nullopt;
      }
      date.time = *time;
    }
    return date;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

// Local seconds since the epoch at which `date` falls in `year`, before adding its time.
std::int64_t rule_day_start(const RuleDate &date, const std::int64_t year) {
  const std::int64_t jan1 = days_from_civil(year, 1, 1);
  switch (date.kind) {
  case RuleDate::Kind::Julian: {
    std::int64_t day_of_year = date.day - 1;
    if (is_leap_year(year) && date.day >= 60) {
      ++day_of_year;
    }
    return (jan1 + day_of_year) * kSecondsPerDay;
  }
  case RuleDate::Kind::ZeroBased:
    return (jan1 + date.day) * kSecondsPerDay;
  case RuleDate::Kind::MonthWeekDay:
    break;
  }
  const std::int64_t first = days_from_civil(year, date.month, 1);
  const int first_weekday = weekday_from_days(first);
  int day = 1 + (date.day - first_weekday + 7) % 7 + (date.week - 1) * 7;
  if (day > days_in_month(year, date.month)) {
    day -= 7;
  }
  return (first + day - 1) * kSecondsPerDay;
}

std::int64_t posix_utc_offset(const PosixRule &rule, const std::int64_t utc_seconds) {
  if (!rule.dst_offset.has_value() || !rule.start.has_value() || !rule.end.has_value()) {
    return rule.std_offset;
  }
  const std::int64_t year =
      civil_from_days(floor_div(utc_seconds + rule.std_offset, kSecondsPerDay)).year;
  // Start is expressed in standard time, end in daylight time.
  const std::int64_t start =
      rule_day_start(*rule.start, year) + rule.start->time - rule.std_offset;
  const std::int64_t end = rule_day_start(*rule.end, year) + rule.end->time - *rule.dst_offset;
  const bool in_dst = start < end ? (utc_seconds >= start && utc_seconds < end)
                                  : (utc_seconds >= start || utc_seconds < end);
  return in_dst ? *rule.dst_offset : rule.std_offset;
}

/// Offsets of one zone as read from its TZif file.
struct ZoneRules {
  std::vector<std::int64_t> transitions;
  std::vector<std::uint8_t> transition_types;
  std::vector<std::int64_t> type_offsets;
  std::optional<PosixRule> footer;

  [[nodiscard]] std::int64_t utc_offset(const std::int64_t utc_seconds) const {
    if (transitions.empty() || utc_seconds >= transitions.back()) {
      if (footer.has_value()) {
        return posix_utc_offset(*footer, utc_seconds);
      }
      if (transitions.empty()) {
        return type_offsets.empty() ? 0 : type_offsets.front();
      }
    }
    if (utc_seconds < transitions.front()) {
      return type_offsets.front();
    }
    const auto upper = std::upper_bound(transitions.begin(), transitions.end(), utc_seconds);
    const auto index = static_cast<std::size_t>(std::distance(transitions.begin(), upper)) - 1;
    return type_offsets[transition_types[index]];
  }
};

class TzifReader {
public:
  explicit TzifReader(const std::string &data) : data_(data) {}

  Result<ZoneRules> read() {
    if (data_.size() < kHeaderSize || data_.compare(0, 4, "TZif") != 0) {
      return Result<ZoneRules>::failure("not a TZif file");
    }
    const char version = data_[4];
    const auto v1 = read_counts(0);
    if (!v1.has_value()) {
      return Result<ZoneRules>::failure("truncated TZif header");
    }
    if (version == '\0') {
      return read_block(kHeaderSize, *v1, 4);
    }

    const std::size_t v2_header = kHeaderSize + block_size(*v1, 4);
    const auto v2 = read_counts(v2_header);
    if (!v2.has_value() || data_.compare(v2_header, 4, "TZif") != 0) {
      return Result<ZoneRules>::failure("truncated TZif v2 header");
    }
    auto rules = read_block(v2_header + kHeaderSize, *v2, 8);
    if (!rules.ok()) {
      return rules;
    }
    const std::size_t footer_start = v2_header + kHeaderSize + block_size(*v2, 8);
    if (footer_start < data_.size() && data_[footer_start] == '\n') {
      const auto footer_end = data_.find('\n', footer_start + 1);
      if (footer_end != std::string::npos && footer_end > footer_start + 1) {
        const std::string tz = data_.substr(footer_start + 1, footer_end - footer_start - 1);
        rules.value().footer = PosixParser(tz).parse();
      }
    }
    return rules;
  }

private:
  struct Counts {
    std::uint32_t isut = 0;
    std::uint32_t isstd = 0;
    std::uint32_t leap = 0;
    std::uint32_t time = 0;
    std::uint32_t type = 0;
    std::uint32_t chars = 0;
  };

  [[nodiscard]] std::int64_t read_be(const std::size_t at, const std::size_t width) const {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
      value = (value << 8) | static_cast<unsigned char>(data_[at + i]);
    }
    if (width == 4) {
      return static_cast<std::int32_t>(static_cast<std::uint32_t>(value));
    }
    return static_cast<std::int64_t>(value);
  }

  [[nodiscard]] std::optional<Counts> read_counts(const std::size_t header) const {
    if (data_.size() < header + kHeaderSize) {
      return std::nullopt;
    }
    const std::size_t base = header + 20;
    const auto count = [&](const std::size_t index) {
      return static_cast<std::uint32_t>(read_be(base + index * 4, 4));
    };
    return Counts{count(0), count(1), count(2), count(3), count(4), count(5)};
  }

  [[nodiscard]] static std::size_t block_size(const Counts &counts, const std::size_t width) {
    return counts.time * width + counts.time + counts.type * 6 + counts.chars +
           counts.leap * (width + 4) + counts.isstd + counts.isut;
  }

  [[nodiscard]] Result<ZoneRules> read_block(const std::size_t start, const Counts &counts,
                                             const std::size_t width) const {
    if (counts.type == 0 || data_.size() < start + block_size(counts, width)) {
      return Result<ZoneRules>::failure("truncated TZif data block");
    }
    ZoneRules rules;
    std::size_t pos = start;
    for (std::uint32_t i = 0; i < counts.time; ++i, pos += width) {
      rules.transitions.push_back(read_be(pos, width));
    }
    for (std::uint32_t i = 0; i < counts.time; ++i, ++pos) {
      const auto type = static_cast<std::uint8_t>(data_[pos]);
      if (type >= counts.type) {
        return Result<ZoneRules>::failure("TZif transition references unknown type");
      }
      rules.transition_types.push_back(type);
    }
    for (std::uint32_t i = 0; i < counts.type; ++i, pos += 6) {
      rules.type_offsets.push_back(read_be(pos, 4));
    }
    return Result<ZoneRules>::success(std::move(rules));
  }

  const std::string &data_;
};

std::filesystem::path zoneinfo_root() {
  if (const char *dir = std::getenv("TZDIR"); dir != nullptr && *dir != '\0') {
    return dir;
  }
  return kZoneinfoRoot;
}

bool is_safe_zone_name(const std::string &timezone) {
  return !timezone.empty() && timezone.front() != '/' && timezone.find("..") == std::string::npos;
}

Result<std::shared_ptr<const ZoneRules>> load_zone(const std::string &timezone) {
  using R = Result<std::shared_ptr<const ZoneRules>>;
  static std::mutex cache_mutex;
  static std::map<std::string, std::shared_ptr<const ZoneRules>> cache;

  if (!is_safe_zone_name(timezone)) {
    return R::failure("unknown timezone: " + timezone);
  }
  {
    std::lock_guard<std::mutex> lock(cache_mutex);
    if (const auto it = cache.find(timezone); it != cache.end()) {
      return R::success(it->second);
    }
  }

  const auto path = zoneinfo_root() / timezone;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return R::failure("unknown timezone: " + timezone);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return R::failure("cannot read zoneinfo for " + timezone);
  }
  const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto rules = TzifReader(data).read();
  if (!rules.ok()) {
    return R::failure("invalid zoneinfo for " + timezone + ": " + rules.error());
  }

  auto shared = std::make_shared<const ZoneRules>(std::move(rules.value()));
  std::lock_guard<std::mutex> lock(cache_mutex);
  cache.emplace(timezone, shared);
  return R::success(std::move(shared));
}

Result<std::int64_t> local_seconds(const std::int64_t epoch_ms, const std::string &timezone) {
  const auto zone = load_zone(timezone);
  if (!zone.ok()) {
    return Result<std::int64_t>::failure(zone.error());
  }
  const std::int64_t utc_seconds = floor_div(epoch_ms, 1000);
  return Result<std::int64_t>::success(utc_seconds + zone.value()->utc_offset(utc_seconds));
}

} // namespace

bool is_valid_timezone(const std::string &timezone) { return load_zone(timezone).ok(); }

Result<std::int64_t> utc_offset_seconds(const std::int64_t epoch_ms, const std::string &timezone) {
  const auto zone = load_zone(timezone);
  if (!zone.ok()) {
    return Result<std::int64_t>::failure(zone.error());
  }
  return Result<std::int64_t>::success(zone.value()->utc_offset(floor_div(epoch_ms, 1000)));
}

Result<int> local_minute_of_day(const std::int64_t epoch_ms, const std::string &timezone) {
  const auto local = local_seconds(epoch_ms, timezone);
  if (!local.ok()) {
    return Result<int>::failure(local.error());
  }
  const std::int64_t second_of_day = local.value() - floor_div(local.value(), kSecondsPerDay) *
                                                         kSecondsPerDay;
  return Result<int>::success(static_cast<int>(second_of_day / 60));
}

Result<std::string> local_date_key(const std::int64_t epoch_ms, const std::string &timezone) {
  const auto local = local_seconds(epoch_ms, timezone);
  if (!local.ok()) {
    return Result<std::string>::failure(local.error());
  }
  const auto date = civil_from_days(floor_div(local.value(), kSecondsPerDay));
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02d-%02d", static_cast<long long>(date.year),
                date.month, date.day);
  return Result<std::string>::success(buffer);
}

} // namespace otto::common
