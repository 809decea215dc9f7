#ifndef SLUG_HPP
#define SLUG_HPP

#include <string>

// "My Post!.md" -> "my-post". Idempotent on extension-free input.
std::string sanitize_slug(const std::string &filename);

// "hello-world.md" -> "Hello world". Never empty.
std::string derive_title(const std::string &filename);

#endif
