#include "ingest/date_parser.hpp"

#include <cctype>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace sentinel {
namespace ingest {

namespace {

std::string_view trimView(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

// Digits only, at most four of them.
std::optional<int> parseNumber(std::string_view digits) {
  if (digits.empty() || digits.size() > 4) return std::nullopt;
  int value = 0;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    value = value * 10 + (c - '0');
  }
  return value;
}

std::vector<std::string_view> splitOn(std::string_view value, char separator) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (true) {
    size_t pos = value.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.push_back(value.substr(start));
      break;
    }
    parts.push_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

int expandYear(std::string_view digits, int year) {
  if (digits.size() != 2) return year;
  return year >= 69 ? 1900 + year : 2000 + year;
}

struct CivilDate {
  int year;
  int month;
  int day;
};

std::optional<CivilDate> parseDatePart(std::string_view text, bool day_first) {
  char separator = 0;
  for (char candidate : {'/', '-', '.'}) {
    if (text.find(candidate) != std::string_view::npos) {
      separator = candidate;
      break;
    }
  }
  if (separator == 0) return std::nullopt;

  auto parts = splitOn(text, separator);
  if (parts.size() != 3) return std::nullopt;

  auto first = parseNumber(parts[0]);
  auto second = parseNumber(parts[1]);
  auto third = parseNumber(parts[2]);
  if (!first || !second || !third) return std::nullopt;

  if (parts[0].size() == 4) {
    CivilDate date{*first, *second, *third};
    if (isValidDate(date.year, date.month, date.day)) return date;
    return std::nullopt;
  }

  if (parts[2].size() != 4 && parts[2].size() != 2) return std::nullopt;
  int year = expandYear(parts[2], *third);

  CivilDate preferred = day_first ? CivilDate{year, *second, *first}
                                  : CivilDate{year, *first, *second};
  if (isValidDate(preferred.year, preferred.month, preferred.day)) return preferred;

  CivilDate swapped{year, preferred.day, preferred.month};
  if (isValidDate(swapped.year, swapped.month, swapped.day)) return swapped;

  return std::nullopt;
}

// Seconds into the day, or nullopt when malformed.
std::optional<int> parseTimePart(std::string_view text) {
  if (text.empty()) return 0;

  auto dot = text.find('.');
  if (dot != std::string_view::npos) {
    auto fraction = text.substr(dot + 1);
    if (fraction.empty()) return std::nullopt;
    for (char c : fraction) {
      if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    // Sub-second precision is dropped
    text = text.substr(0, dot);
  }

  auto parts = splitOn(text, ':');
  if (parts.size() < 2 || parts.size() > 3) return std::nullopt;
  for (const auto& part : parts) {
    if (part.empty() || part.size() > 2) return std::nullopt;
  }

  auto hour = parseNumber(parts[0]);
  auto minute = parseNumber(parts[1]);
  std::optional<int> second = 0;
  if (parts.size() == 3) {
    second = parseNumber(parts[2]);
  }
  if (!hour || !minute || !second) return std::nullopt;
  if (*hour > 23 || *minute > 59 || *second > 59) return std::nullopt;

  return *hour * 3600 + *minute * 60 + *second;
}

}  // namespace

std::int64_t daysFromCivil(int year, unsigned month, unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool isValidDate(int year, int month, int day) {
  if (year < 1 || month < 1 || month > 12 || day < 1) return false;

  static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int limit = kDaysInMonth[month - 1];
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) limit = 29;
  return day <= limit;
}

std::optional<EpochSeconds> parseDateTime(const std::string& text, bool day_first) {
  std::string_view value = trimView(text);
  if (value.empty()) return std::nullopt;

  std::string_view date_text = value;
  std::string_view time_text;
  auto split = value.find_first_of(" T");
  if (split != std::string_view::npos) {
    date_text = value.substr(0, split);
    time_text = trimView(value.substr(split + 1));
  }

  auto date = parseDatePart(date_text, day_first);
  if (!date) return std::nullopt;

  auto seconds = parseTimePart(time_text);
  if (!seconds) return std::nullopt;

  std::int64_t days = daysFromCivil(date->year, static_cast<unsigned>(date->month),
                                    static_cast<unsigned>(date->day));
  return days * 86400 + *seconds;
}

}  // namespace ingest
}  // namespace sentinel
