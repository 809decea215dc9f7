#include "core/site_builder.hpp"
#include "server/dev_server.hpp"
#include "server/preview_server.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <termcolor/termcolor.hpp>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "quire - A minimal markdown blog builder\n\n";
  std::cout << "Commands:\n";
  std::cout << "  quire build               Build posts into the output "
               "directory\n";
  std::cout << "  quire serve               Build, then serve the output "
               "directory\n";
  std::cout << "  quire dev                 Build, serve and rebuild on every "
               "change\n";
  std::cout << "  quire --help              Show this help\n\n";
  std::cout << "Settings are read from ./quire.yaml when present.\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  fs::path project_root = fs::current_path();

  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  try {

    if (command == "dev") {
      SiteBuilder builder(project_root);
      start_dev_server(builder);
    } else if (command == "build") {
      SiteBuilder builder(project_root);
      builder.build();
    } else if (command == "serve") {
      SiteBuilder builder(project_root);
      start_preview_server(builder);
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      print_usage();
      return 1;
    }

  } catch (const std::exception &e) {
    std::cerr << termcolor::bright_red << "✗ Fatal error: " << termcolor::reset
              << e.what() << std::endl;
    return 1;
  }

  return 0;
}
