#include "post_date.hpp"
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace chr = std::chrono;

static const std::array<const char *, 12> month_names = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

static bool all_digits(const std::string &s, size_t pos, size_t len) {
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  return true;
}

chr::year_month_day today_utc() {
  return chr::year_month_day{chr::floor<chr::days>(chr::system_clock::now())};
}

std::optional<chr::year_month_day> parse_post_date(const std::string &text) {
  if (text.size() < 10 || text[4] != '-' || text[7] != '-' ||
      !all_digits(text, 0, 4) || !all_digits(text, 5, 2) ||
      !all_digits(text, 8, 2)) {
    return std::nullopt;
  }

  if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
    return std::nullopt;
  }

  chr::year_month_day date{chr::year{std::stoi(text.substr(0, 4))},
                           chr::month{static_cast<unsigned>(
                               std::stoi(text.substr(5, 2)))},
                           chr::day{static_cast<unsigned>(
                               std::stoi(text.substr(8, 2)))}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

FormattedDate format_post_date(const chr::year_month_day &date) {
  if (!date.ok()) {
    throw std::invalid_argument("Invalid calendar date");
  }

  int year = static_cast<int>(date.year());
  unsigned month = static_cast<unsigned>(date.month());
  unsigned day = static_cast<unsigned>(date.day());

  std::ostringstream datetime;
  datetime << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2)
           << month << '-' << std::setw(2) << day;

  std::ostringstream display;
  display << month_names[month - 1] << ' ' << day << ", " << year;

  return {datetime.str(), display.str()};
}

FormattedDate format_post_date(const std::string &text) {
  auto date = parse_post_date(text);
  if (!date) {
    throw std::invalid_argument("Invalid date (expected yyyy-MM-dd): " + text);
  }
  return format_post_date(*date);
}
