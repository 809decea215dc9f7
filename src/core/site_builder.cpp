#include "site_builder.hpp"
#include "link_rewriter.hpp"
#include "markdown.hpp"
#include "utils/post_date.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <system_error>
#include <termcolor/termcolor.hpp>

SiteBuilder::SiteBuilder(const fs::path &root)
    : SiteBuilder(root, SiteConfig::load(root / "quire.yaml")) {}

SiteBuilder::SiteBuilder(const fs::path &root, const SiteConfig &cfg)
    : project_root(root), config(cfg), renderer(cfg.lang) {
  content_dir = root / config.content_dir;
  output_dir = root / config.output_dir;
}

void SiteBuilder::write_file(const fs::path &path, const std::string &content) {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot write file: " + path.string());
  }
  file << content;
  if (!file) {
    throw std::runtime_error("Failed writing file: " + path.string());
  }
}

static void log_failure(const fs::path &relative, const std::string &message) {
  std::cerr << termcolor::bright_red << "  ✗ " << termcolor::reset
            << termcolor::white << relative.string() << termcolor::reset
            << termcolor::bright_blue << ": " << message << termcolor::reset
            << "\n";
}

void SiteBuilder::clean_output() {
  std::error_code ec;
  if (!fs::exists(output_dir, ec)) {
    return;
  }

  std::cout << termcolor::bright_cyan << "🧹 Cleaning " << termcolor::reset
            << termcolor::white << output_dir.string() << termcolor::reset
            << "\n";

  // The root stays in place so a running server keeps its document root.
  for (const auto &entry : fs::directory_iterator(output_dir, ec)) {
    std::error_code remove_ec;
    fs::remove_all(entry.path(), remove_ec);
    if (remove_ec) {
      std::cerr << termcolor::yellow << "  ⚠ " << termcolor::reset
                << "Could not remove " << entry.path().string() << ": "
                << remove_ec.message() << "\n";
    }
  }
}

std::vector<fs::path>
SiteBuilder::discover_documents(std::vector<BuildFailure> &failures) const {
  std::vector<fs::path> documents;

  std::error_code ec;
  fs::recursive_directory_iterator it(
      content_dir, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;

  while (!ec && it != end) {
    const fs::directory_entry &entry = *it;

    if (entry.path().extension() == ".md") {
      std::error_code type_ec;
      bool regular = entry.is_regular_file(type_ec);
      if (type_ec) {
        failures.push_back({entry.path(), type_ec.message()});
        log_failure(entry.path().lexically_relative(content_dir),
                    type_ec.message());
      } else if (regular) {
        documents.push_back(entry.path());
      }
    }

    it.increment(ec);
  }

  if (ec) {
    failures.push_back({content_dir, ec.message()});
    log_failure(content_dir, "discovery stopped early: " + ec.message());
  }

  std::sort(documents.begin(), documents.end());
  return documents;
}

fs::path SiteBuilder::build_post(const fs::path &document,
                                 const std::chrono::year_month_day &today) {
  ExtractedDocument doc = FrontMatter::load(document, today);

  std::string html_body = MarkdownProcessor::to_html(rewrite_links(doc.body));
  std::string html = renderer.render(doc.metadata, html_body);

  fs::path out_path = page_path(doc.metadata.slug);
  write_file(out_path, html);
  return out_path;
}

BuildReport SiteBuilder::build() {
  auto start = std::chrono::high_resolution_clock::now();

  if (!fs::is_directory(content_dir)) {
    throw std::runtime_error("Content directory does not exist: " +
                             content_dir.string());
  }

  BuildReport report;
  report.build_date = today_utc();

  // Discovery happens before cleaning; a bad entry never costs the old site.
  std::vector<fs::path> documents = discover_documents(report.failures);
  report.discovered = documents.size() + report.failures.size();

  clean_output();
  fs::create_directories(output_dir / "posts");

  std::cout << "\n"
            << termcolor::bright_cyan << "🔨 Building posts" << termcolor::reset
            << "\n";

  std::map<fs::path, fs::path> producers;

  for (const auto &document : documents) {
    fs::path relative = document.lexically_relative(content_dir);
    try {
      fs::path out_path = build_post(document, report.build_date);

      auto [it, inserted] = producers.emplace(out_path, relative);
      if (!inserted) {
        std::cerr << termcolor::yellow << "  ⚠ " << termcolor::reset
                  << termcolor::white << relative.string() << termcolor::reset
                  << " overwrote " << out_path.filename().string()
                  << " from " << it->second.string() << "\n";
        it->second = relative;
      } else {
        report.written.push_back(out_path);
      }

      std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
                << termcolor::white << relative.string() << termcolor::reset
                << termcolor::bright_blue << " → "
                << out_path.lexically_relative(output_dir).string()
                << termcolor::reset << "\n";
    } catch (const std::exception &e) {
      report.failures.push_back({document, e.what()});
      log_failure(relative, e.what());
    }
  }

  auto end = std::chrono::high_resolution_clock::now();
  report.elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
          .count();

  print_build_summary(report);
  return report;
}

void SiteBuilder::print_build_summary(const BuildReport &report) {
  std::cout << "\n"
            << termcolor::bright_green << "✓ " << termcolor::reset << "Built "
            << termcolor::bright_white << report.written.size()
            << termcolor::reset << " of " << report.discovered << " posts";
  if (!report.failures.empty()) {
    std::cout << termcolor::bright_red << " (" << report.failures.size()
              << " errors)" << termcolor::reset;
  }
  std::cout << termcolor::bright_blue << " in " << report.elapsed_ms << "ms"
            << termcolor::reset << "\n";
}
