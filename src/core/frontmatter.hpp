#ifndef FRONTMATTER_H
#define FRONTMATTER_H

#include <chrono>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

struct Metadata {
  std::string title;
  std::chrono::year_month_day date;
  std::string slug;
};

// Where the metadata of an extracted document came from.
enum class MetadataSource {
  Header,          // parsed front matter, per-field defaults filled in
  Defaults,        // no front matter block
  MalformedHeader, // block present but not a YAML mapping; body dropped
  ReadFailure      // file could not be read; body empty
};

struct ExtractedDocument {
  Metadata metadata;
  std::string body;
  MetadataSource source = MetadataSource::Defaults;
};

class FrontMatter {
public:
  static Metadata defaults(const std::string &filename,
                           const std::chrono::year_month_day &today);

  // Never throws for malformed headers: falls back to defaults() instead.
  static ExtractedDocument parse(const std::string &content,
                                 const std::string &filename,
                                 const std::chrono::year_month_day &today);

  static ExtractedDocument load(const fs::path &path,
                                const std::chrono::year_month_day &today);
};

#endif
