#ifndef LINK_REWRITER_HPP
#define LINK_REWRITER_HPP

#include <string>

// Links into the site itself; these stay in the current tab.
inline constexpr const char *internal_link_prefix = "/posts/";

// Turns every inline markdown link that does not point at internal_link_prefix
// into an <a target="_blank"> element. Must run before markdown conversion.
std::string rewrite_links(const std::string &markdown);

#endif
