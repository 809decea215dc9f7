#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "core/slug.hpp"

int main() {
    std::cout << "[Test] Starting Slug Test..." << std::endl;

    assert(sanitize_slug("My Post!.md") == "my-post");
    assert(sanitize_slug("hello-world.md") == "hello-world");
    assert(sanitize_slug("  Spaces   Everywhere  .md") == "spaces-everywhere");
    assert(sanitize_slug("C++ & Rust: a comparison.md") == "c-rust-a-comparison");
    assert(sanitize_slug("under_score.md") == "under_score");
    assert(sanitize_slug("notes.markdown") == "notesmarkdown");

    const std::vector<std::string> inputs = {
        "My Post!", "Already-a-slug", "  Tabs\tand   spaces ", "Ünïcödé Title", "a.b.c", "x--y"};
    for (const auto &input : inputs) {
        std::string once = sanitize_slug(input);
        assert(sanitize_slug(once) == once);
        assert(sanitize_slug(input) == once);
    }

    assert(derive_title("hello-world.md") == "Hello world");
    assert(derive_title("ALL-CAPS.md") == "All caps");
    assert(derive_title("-.md") == "Untitled");

    std::cout << "[PASS] Slug Test." << std::endl;
    return 0;
}
