#ifndef POST_DATE_HPP
#define POST_DATE_HPP

#include <chrono>
#include <optional>
#include <string>

struct FormattedDate {
  std::string datetime; // yyyy-MM-dd
  std::string display;  // MMMM d, yyyy
};

// Current UTC calendar date.
std::chrono::year_month_day today_utc();

// Accepts "yyyy-MM-dd", optionally followed by a time part ("T..." or " ...").
std::optional<std::chrono::year_month_day>
parse_post_date(const std::string &text);

FormattedDate format_post_date(const std::chrono::year_month_day &date);

// Throws std::invalid_argument when text is not a valid yyyy-MM-dd date.
FormattedDate format_post_date(const std::string &text);

#endif
