#include "slug.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

static std::string strip_markdown_extension(const std::string &filename) {
  static const std::regex md_ext{R"(\.md$)"};
  return std::regex_replace(filename, md_ext, "");
}

static std::string trim(const std::string &str) {
  auto is_space = [](unsigned char c) { return std::isspace(c); };
  auto begin = std::find_if_not(str.begin(), str.end(), is_space);
  auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string sanitize_slug(const std::string &filename) {
  static const std::regex unsafe_chars{R"([^\w\s-])"};
  static const std::regex whitespace_run{R"(\s+)"};

  std::string slug = strip_markdown_extension(filename);
  slug = std::regex_replace(slug, unsafe_chars, "");
  slug = trim(slug);
  slug = std::regex_replace(slug, whitespace_run, "-");

  std::transform(slug.begin(), slug.end(), slug.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return slug;
}

std::string derive_title(const std::string &filename) {
  std::string title = strip_markdown_extension(filename);
  std::replace(title.begin(), title.end(), '-', ' ');
  title = trim(title);

  if (title.empty()) {
    return "Untitled";
  }

  std::transform(title.begin(), title.end(), title.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  title[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(title[0])));
  return title;
}
