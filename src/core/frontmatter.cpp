#include "frontmatter.hpp"
#include "slug.hpp"
#include "utils/post_date.hpp"
#include "yaml-cpp/yaml.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <termcolor/termcolor.hpp>

static const std::string open_marker = "---\n";
static const std::string close_marker = "\n---\n";

static std::string scalar_or_empty(const YAML::Node &node,
                                   const std::string &key) {
  YAML::Node value = node[key];
  if (!value || !value.IsScalar()) {
    return "";
  }
  return value.as<std::string>();
}

static void warn(const std::string &filename, const std::string &message) {
  std::cerr << termcolor::yellow << "  ⚠ " << termcolor::reset
            << termcolor::white << filename << termcolor::reset
            << termcolor::bright_blue << ": " << message << termcolor::reset
            << "\n";
}

Metadata FrontMatter::defaults(const std::string &filename,
                               const std::chrono::year_month_day &today) {
  Metadata meta;
  meta.title = derive_title(filename);
  meta.date = today;
  meta.slug = sanitize_slug(filename);
  if (meta.slug.empty()) {
    meta.slug = "untitled";
  }
  return meta;
}

ExtractedDocument
FrontMatter::parse(const std::string &content, const std::string &filename,
                   const std::chrono::year_month_day &today) {
  ExtractedDocument doc;
  doc.metadata = defaults(filename, today);

  if (content.compare(0, open_marker.size(), open_marker) != 0) {
    doc.body = content;
    return doc;
  }

  size_t end_pos = content.find(close_marker, open_marker.size());
  if (end_pos == std::string::npos) {
    doc.body = content;
    return doc;
  }

  std::string yaml_str =
      content.substr(open_marker.size(), end_pos - open_marker.size());

  YAML::Node node;
  try {
    node = YAML::Load(yaml_str);
  } catch (const YAML::Exception &e) {
    warn(filename, "malformed front matter (" + std::string(e.what()) +
                       "), using defaults");
    doc.source = MetadataSource::MalformedHeader;
    return doc;
  }

  // An empty block loads as a null node and counts as an empty mapping.
  if (!node.IsMap() && !node.IsNull()) {
    warn(filename, "front matter is not a key/value block, using defaults");
    doc.source = MetadataSource::MalformedHeader;
    return doc;
  }

  doc.source = MetadataSource::Header;
  doc.body = content.substr(end_pos + close_marker.size());

  if (node.IsNull()) {
    return doc;
  }

  std::string title = scalar_or_empty(node, "title");
  if (!title.empty()) {
    doc.metadata.title = title;
  }

  std::string date = scalar_or_empty(node, "date");
  if (!date.empty()) {
    auto parsed = parse_post_date(date);
    if (parsed) {
      doc.metadata.date = *parsed;
    } else {
      warn(filename, "unparsable date '" + date + "', using build date");
    }
  }

  std::string slug = sanitize_slug(scalar_or_empty(node, "slug"));
  if (!slug.empty()) {
    doc.metadata.slug = slug;
  }

  return doc;
}

ExtractedDocument
FrontMatter::load(const fs::path &path,
                  const std::chrono::year_month_day &today) {
  std::string filename = path.filename().string();

  std::ifstream file(path);
  std::stringstream buffer;
  if (file.is_open()) {
    buffer << file.rdbuf();
  }

  if (!file.is_open() || file.bad()) {
    std::cerr << termcolor::bright_red << "  ✗ " << termcolor::reset
              << "Error reading " << termcolor::white << path.string()
              << termcolor::reset << ", using default metadata\n";
    ExtractedDocument doc;
    doc.metadata = defaults(filename, today);
    doc.source = MetadataSource::ReadFailure;
    return doc;
  }

  return parse(buffer.str(), filename, today);
}
