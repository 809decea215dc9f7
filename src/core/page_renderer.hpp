#ifndef PAGE_RENDERER_HPP
#define PAGE_RENDERER_HPP

#include "frontmatter.hpp"
#include <string>

class PageRenderer {
private:
  std::string lang;

public:
  explicit PageRenderer(std::string lang = "en");

  // Wraps an HTML body fragment into a complete, self-contained document.
  std::string render(const Metadata &meta, const std::string &html_body) const;
};

std::string escape_html(const std::string &text);

#endif
