#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

class SiteConfig {
public:
  std::string site_name = "quire";
  std::string lang = "en";

  std::string content_dir = "content/posts";
  std::string output_dir = "public";

  std::string host = "0.0.0.0";
  int port = 3000;

  // A missing file yields the defaults; a malformed one throws.
  static SiteConfig load(const fs::path &config_path) {
    SiteConfig config;

    if (!fs::exists(config_path)) {
      return config;
    }

    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Invalid config file " + config_path.string() +
                               ": " + e.what());
    }

    if (yaml.IsNull()) {
      return config;
    }
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid config file " + config_path.string() +
                               ": expected a key/value mapping");
    }

    try {
      if (yaml["site_name"])
        config.site_name = yaml["site_name"].as<std::string>();
      if (yaml["lang"])
        config.lang = yaml["lang"].as<std::string>();

      if (yaml["content_dir"])
        config.content_dir = yaml["content_dir"].as<std::string>();
      if (yaml["output_dir"])
        config.output_dir = yaml["output_dir"].as<std::string>();

      if (yaml["host"])
        config.host = yaml["host"].as<std::string>();
      if (yaml["port"])
        config.port = yaml["port"].as<int>();
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Invalid config file " + config_path.string() +
                               ": " + e.what());
    }

    if (config.port <= 0 || config.port > 65535) {
      throw std::runtime_error("Invalid port in " + config_path.string() +
                               ": " + std::to_string(config.port));
    }

    return config;
  }
};

#endif
