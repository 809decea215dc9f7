#ifndef SITE_BUILDER_HPP
#define SITE_BUILDER_HPP

#include "frontmatter.hpp"
#include "page_renderer.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct BuildFailure {
  fs::path document;
  std::string message;
};

struct BuildReport {
  std::chrono::year_month_day build_date;
  size_t discovered = 0;
  std::vector<fs::path> written;
  std::vector<BuildFailure> failures;
  long long elapsed_ms = 0;

  bool ok() const { return failures.empty(); }
};

class SiteBuilder {
private:
  fs::path project_root;
  fs::path content_dir;
  fs::path output_dir;

  SiteConfig config;
  PageRenderer renderer;

  void write_file(const fs::path &path, const std::string &content);

public:
  explicit SiteBuilder(const fs::path &root);
  SiteBuilder(const fs::path &root, const SiteConfig &cfg);

  // One full pass: clean output, render every document. Throws only when the
  // content directory is missing; per-document errors land in the report.
  BuildReport build();

  void clean_output();
  // Entries that cannot be inspected are appended to `failures`.
  std::vector<fs::path>
  discover_documents(std::vector<BuildFailure> &failures) const;

  // Renders and writes a single document, returning the page path.
  fs::path build_post(const fs::path &document,
                      const std::chrono::year_month_day &today);

  fs::path page_path(const std::string &slug) const {
    return output_dir / "posts" / (slug + ".html");
  }

  const fs::path &get_content_dir() const { return content_dir; }
  const fs::path &get_output_dir() const { return output_dir; }
  const SiteConfig &get_config() const { return config; }

  void print_build_summary(const BuildReport &report);
};

#endif
