#include "dev_server.hpp"
#include "core/site_builder.hpp"
#include "core/watch_orchestrator.hpp"
#include "preview_server.hpp"
#include "server.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <termcolor/termcolor.hpp>

int start_watch_and_bind(WatchOrchestrator &watcher, Server &svr,
                         const std::string &host, int port) {
  watcher.start();

  try {
    return bind_with_retry(svr, host, port);
  } catch (const std::exception &e) {
    std::cerr << termcolor::bright_red << "✗ Failed to start HTTP server: "
              << termcolor::reset << e.what() << "\n";
    watcher.stop();
    throw;
  }
}

void start_dev_server(SiteBuilder &builder) {
  auto total_start = std::chrono::high_resolution_clock::now();
  const SiteConfig &config = builder.get_config();

  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔═══════════════════════════════════════════╗\n"
            << "║        🚀 Starting Dev Server             ║\n"
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n";

  BuildReport initial = builder.build();

  std::cout << "\n"
            << termcolor::bright_cyan << "👁️  Setting up file watcher"
            << termcolor::reset << "\n";

  WatchOrchestrator watcher(builder.get_content_dir(),
                            [&builder](const WatchEvent &) {
                              std::cout << termcolor::bright_cyan
                                        << "  🔨 Rebuilding site..."
                                        << termcolor::reset << "\n";
                              builder.build();
                            });

  Server svr;
  configure_preview_routes(svr, builder.get_output_dir());
  int port = start_watch_and_bind(watcher, svr, config.host, config.port);

  auto total_end = std::chrono::high_resolution_clock::now();
  auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      total_end - total_start);

  std::string url = "http://localhost:" + std::to_string(port);

  std::cout << "\n"
            << termcolor::bright_green
            << "╔═══════════════════════════════════════════╗\n"
            << "║           ✨ Server Ready!                ║\n"
            << "╠═══════════════════════════════════════════╣"
            << termcolor::reset << "\n";
  std::cout << termcolor::bright_green << "║  " << termcolor::reset
            << "Site:       " << termcolor::bright_white << std::setw(28)
            << std::left << config.site_name << termcolor::reset
            << termcolor::bright_green << "║" << termcolor::reset << "\n";
  std::cout << termcolor::bright_green << "║  " << termcolor::reset
            << "HTTP:       " << termcolor::bright_white << std::setw(28)
            << std::left << url << termcolor::reset << termcolor::bright_green
            << "║" << termcolor::reset << "\n";
  std::cout << termcolor::bright_green << "║  " << termcolor::reset
            << "Posts:      " << termcolor::bright_white << std::setw(28)
            << std::left << std::to_string(initial.written.size())
            << termcolor::reset << termcolor::bright_green << "║"
            << termcolor::reset << "\n";
  std::cout << termcolor::bright_green << "║  " << termcolor::reset
            << "Started in: " << termcolor::bright_white << std::setw(28)
            << std::left << (std::to_string(total_duration.count()) + "ms")
            << termcolor::reset << termcolor::bright_green << "║"
            << termcolor::reset << "\n";
  std::cout << termcolor::bright_green
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";

  std::cout << termcolor::bright_blue << "Press Ctrl+C to stop server..."
            << termcolor::reset << "\n\n";

  run_until_signalled(svr);

  std::cout << "\n"
            << termcolor::bright_yellow << "⏳ Shutting down..."
            << termcolor::reset << "\n";

  watcher.stop();

  std::cout << termcolor::bright_green << "✓ " << termcolor::reset
            << "Dev server stopped cleanly\n\n";
}
