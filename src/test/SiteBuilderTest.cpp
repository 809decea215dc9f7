#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/site_builder.hpp"
#include "utils/post_date.hpp"

namespace fs = std::filesystem;

static void write(const fs::path &path, const std::string &content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
}

static std::string slurp(const fs::path &path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

static fs::path fresh_root(const std::string &name) {
    fs::path root = fs::temp_directory_path() / ("quire_site_builder_" + name);
    fs::remove_all(root);
    fs::create_directories(root);
    return root;
}

int main() {
    std::cout << "[Test] Starting SiteBuilder Test..." << std::endl;

    // Single document without front matter.
    {
        fs::path root = fresh_root("hello");
        write(root / "content/posts/hello-world.md", "Hi [Google](https://google.com).");

        SiteBuilder builder(root);
        BuildReport report = builder.build();

        fs::path page = root / "public/posts/hello-world.html";
        assert(report.ok());
        assert(report.discovered == 1);
        assert(report.written.size() == 1);
        assert(fs::exists(page));

        std::string html = slurp(page);
        FormattedDate today = format_post_date(report.build_date);
        assert(contains(html, "<title>Hello world</title>"));
        assert(contains(html, "datetime=\"" + today.datetime + "\""));
        assert(contains(html, today.display));
        assert(contains(html, "<a href=\"https://google.com\" target=\"_blank\">Google</a>"));

        fs::remove_all(root);
    }

    // Missing content directory is fatal and writes nothing.
    {
        fs::path root = fresh_root("missing");
        SiteBuilder builder(root);

        bool threw = false;
        try {
            builder.build();
        } catch (const std::runtime_error &) {
            threw = true;
        }
        assert(threw);
        assert(!fs::exists(root / "public"));

        fs::remove_all(root);
    }

    // A malformed header does not stop the well-formed document.
    {
        fs::path root = fresh_root("mixed");
        write(root / "content/posts/broken.md", "---\ntitle: [oops\n---\nlost body\n");
        write(root / "content/posts/good.md",
              "---\ntitle: Good One\ndate: 2024-05-17\nslug: good-one\n---\n"
              "Go to [broken](/posts/broken.html).\n");

        SiteBuilder builder(root);
        BuildReport report = builder.build();

        assert(report.discovered == 2);
        assert(report.written.size() == 2);

        std::string broken = slurp(root / "public/posts/broken.html");
        assert(contains(broken, "<title>Broken</title>"));
        assert(!contains(broken, "lost body"));

        std::string good = slurp(root / "public/posts/good-one.html");
        assert(contains(good, "<title>Good One</title>"));
        assert(contains(good, "May 17, 2024"));
        assert(contains(good, "<a href=\"/posts/broken.html\">broken</a>"));
        assert(!contains(good, "target=\"_blank\""));

        fs::remove_all(root);
    }

    // Rebuilds drop pages of removed documents; nested folders are discovered.
    {
        fs::path root = fresh_root("rebuild");
        write(root / "content/posts/first.md", "first");
        write(root / "content/posts/2024/nested post.md", "nested");
        write(root / "content/posts/notes.txt", "not markdown");

        SiteBuilder builder(root);
        BuildReport report = builder.build();
        assert(report.discovered == 2);
        assert(fs::exists(root / "public/posts/first.html"));
        assert(fs::exists(root / "public/posts/nested-post.html"));

        write(root / "public/stray.html", "left over");
        fs::remove(root / "content/posts/first.md");

        report = builder.build();
        assert(report.discovered == 1);
        assert(!fs::exists(root / "public/posts/first.html"));
        assert(!fs::exists(root / "public/stray.html"));
        assert(fs::exists(root / "public/posts/nested-post.html"));

        fs::remove_all(root);
    }

    // An entry that cannot be inspected fails on its own; the pass completes.
    {
        fs::path root = fresh_root("bad_entry");
        write(root / "content/posts/good.md", "still here");

        SiteBuilder builder(root);
        BuildReport first = builder.build();
        assert(first.ok());
        assert(fs::exists(root / "public/posts/good.html"));

        fs::create_symlink("loop.md", root / "content/posts/loop.md");

        BuildReport report = builder.build();
        assert(!report.ok());
        assert(report.failures.size() == 1);
        assert(report.failures[0].document.filename() == "loop.md");
        assert(report.written.size() == 1);
        assert(fs::exists(root / "public/posts/good.html"));
        assert(contains(slurp(root / "public/posts/good.html"), "still here"));

        fs::remove_all(root);
    }

    // A write failure is isolated to its document.
    {
        fs::path root = fresh_root("write_failure");
        write(root / "content/posts/blocked.md", "blocked");
        write(root / "content/posts/fine.md", "fine");

        SiteBuilder builder(root);
        builder.clean_output();
        auto today = today_utc();
        fs::create_directories(root / "public/posts/blocked.html");

        bool threw = false;
        try {
            builder.build_post(root / "content/posts/blocked.md", today);
        } catch (const std::exception &) {
            threw = true;
        }
        assert(threw);

        fs::path fine = builder.build_post(root / "content/posts/fine.md", today);
        assert(fine == root / "public/posts/fine.html");
        assert(fs::exists(fine));

        fs::remove_all(root);
    }

    // Output and content directories come from quire.yaml.
    {
        fs::path root = fresh_root("config");
        write(root / "quire.yaml", "content_dir: posts\noutput_dir: site\nlang: fr\n");
        write(root / "posts/bonjour.md", "Salut");

        SiteBuilder builder(root);
        BuildReport report = builder.build();
        assert(report.ok());
        assert(fs::exists(root / "site/posts/bonjour.html"));
        assert(contains(slurp(root / "site/posts/bonjour.html"), "<html lang=\"fr\">"));

        fs::remove_all(root);
    }

    std::cout << "[PASS] SiteBuilder Test." << std::endl;
    return 0;
}
