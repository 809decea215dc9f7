#include "page_renderer.hpp"
#include "utils/post_date.hpp"
#include <sstream>
#include <utility>

static const char *page_style =
    "body { max-width: 800px; margin: 0 auto; padding: 1rem; "
    "font-family: system-ui; line-height: 1.5; } "
    ".post-date { color: #666; margin-bottom: 2rem; }";

std::string escape_html(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

PageRenderer::PageRenderer(std::string lang) : lang(std::move(lang)) {}

std::string PageRenderer::render(const Metadata &meta,
                                 const std::string &html_body) const {
  FormattedDate date = format_post_date(meta.date);
  std::string title = escape_html(meta.title);

  std::ostringstream html;
  html << "<!DOCTYPE html>\n"
       << "<html lang=\"" << escape_html(lang) << "\">\n"
       << "<head>\n"
       << "<title>" << title << "</title>\n"
       << "<meta charset=\"UTF-8\">\n"
       << "<meta name=\"viewport\" "
          "content=\"width=device-width, initial-scale=1.0\">\n"
       << "<style>" << page_style << "</style>\n"
       << "</head>\n"
       << "<body>\n"
       << "<header>\n"
       << "<h1>" << title << "</h1>\n"
       << "<time class=\"post-date\" datetime=\"" << date.datetime << "\">"
       << date.display << "</time>\n"
       << "</header>\n"
       << "<main>\n"
       << "<article>\n"
       << "<div class=\"content\">\n"
       << "<div>" << html_body << "</div>\n"
       << "</div>\n"
       << "</article>\n"
       << "</main>\n"
       << "</body>\n"
       << "</html>\n";

  return html.str();
}
