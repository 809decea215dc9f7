#include "link_rewriter.hpp"
#include <regex>

static std::string escape_attribute(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

std::string rewrite_links(const std::string &markdown) {
  static const std::regex link_pattern{R"(\[([^\]]+)\]\(([^)]+)\))"};

  std::string result;
  result.reserve(markdown.size());

  auto last = markdown.cbegin();
  for (std::sregex_iterator it(markdown.begin(), markdown.end(), link_pattern),
       end;
       it != end; ++it) {
    const std::smatch &match = *it;
    result.append(last, match[0].first);
    last = match[0].second;

    const std::string text = match[1].str();
    const std::string url = match[2].str();

    bool is_image = match.position(0) > 0 && markdown[match.position(0) - 1] == '!';
    if (is_image || url.rfind(internal_link_prefix, 0) == 0) {
      result += match.str(0);
      continue;
    }

    result += "<a href=\"" + escape_attribute(url) + "\" target=\"_blank\">" +
              text + "</a>";
  }
  result.append(last, markdown.cend());

  return result;
}
