#ifndef MARKDOWN_HPP
#define MARKDOWN_HPP

#include <string>

class MarkdownProcessor {
public:
  // Throws std::runtime_error if md4c rejects the input.
  static std::string to_html(const std::string &markdown);
};

#endif
