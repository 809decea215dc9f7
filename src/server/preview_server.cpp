#include "preview_server.hpp"
#include "core/site_builder.hpp"
#include <atomic>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <signal.h>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <termcolor/termcolor.hpp>

static std::atomic<Server *> active_server{nullptr};

static void handle_stop_signal(int) {
  Server *svr = active_server.load();
  if (svr) {
    svr->stop();
  }
}

static std::optional<std::string> read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);

  if (!file.is_open()) {
    return std::nullopt;
  }

  return std::string((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
}

static std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm = *std::localtime(&time);
  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

static void log_request(const std::string &method, const std::string &path,
                        int status) {
  std::cout << termcolor::bright_blue << "[" << get_timestamp() << "]"
            << termcolor::reset << " " << termcolor::bright_cyan << method
            << termcolor::reset << " " << termcolor::white << path
            << termcolor::reset << " ";

  if (status >= 200 && status < 300) {
    std::cout << termcolor::bright_green;
  } else if (status >= 400 && status < 500) {
    std::cout << termcolor::bright_red;
  } else if (status >= 500) {
    std::cout << termcolor::red << termcolor::bold;
  }
  std::cout << status << termcolor::reset << std::endl;
}

static bool has_parent_segment(const fs::path &relative) {
  for (const auto &part : relative) {
    if (part == "..") {
      return true;
    }
  }
  return false;
}

void serve_output_file(const fs::path &output_root, const Request &req,
                       Response &res) {
  std::string url = req.path.empty() ? "/" : req.path;

  size_t query_pos = url.find_first_of("?#");
  if (query_pos != std::string::npos) {
    url = url.substr(0, query_pos);
  }

  fs::path relative = fs::path(url).relative_path();
  fs::path file_path = output_root / relative;

  // Any stat error (too long, loop, permission) is "not found" here.
  std::error_code ec;
  bool found = false;
  if (!has_parent_segment(relative)) {
    if (fs::is_directory(file_path, ec)) {
      file_path /= "index.html";
    }
    found = fs::is_regular_file(file_path, ec) && !ec;
  }

  if (!found) {
    res.status = 404;
    res.set_content("<h1>Page Not Found</h1>", "text/html");
    return;
  }

  auto html = read_file(file_path);
  if (!html) {
    throw std::runtime_error("Cannot read " + file_path.string());
  }
  res.set_content(*html, "text/html");
}

void configure_preview_routes(Server &svr, const fs::path &output_root) {
  svr.set_logger([](const Request &req, const Response &res) {
    log_request(req.method, req.path, res.status);
  });

  svr.Get(
      ".*",
      [output_root](const Request &req, Response &res) {
        serve_output_file(output_root, req, res);
      },
      true);
}

int bind_with_retry(Server &svr, const std::string &host, int port) {
  for (int candidate = port; candidate <= 65535; ++candidate) {
    if (svr.bind_to_port(host, candidate)) {
      return candidate;
    }

    if (svr.get_last_errno() != EADDRINUSE) {
      throw std::runtime_error("Cannot bind " + host + ":" +
                               std::to_string(candidate) + ": " +
                               std::strerror(svr.get_last_errno()));
    }

    std::cout << termcolor::yellow << "  ⚠ " << termcolor::reset << "Port "
              << candidate << " is in use. Trying port " << candidate + 1
              << "\n";
  }

  throw std::runtime_error("No free port available from " +
                           std::to_string(port));
}

void run_until_signalled(Server &svr) {
  active_server.store(&svr);

  // No SA_RESTART, so blocking socket calls return EINTR on Ctrl+C.
  struct sigaction action {};
  action.sa_handler = handle_stop_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  struct sigaction previous_int {};
  struct sigaction previous_term {};
  if (sigaction(SIGINT, &action, &previous_int) < 0 ||
      sigaction(SIGTERM, &action, &previous_term) < 0) {
    active_server.store(nullptr);
    throw std::runtime_error(std::string("Cannot install signal handler: ") +
                             strerror(errno));
  }

  svr.listen_after_bind();

  if (sigaction(SIGINT, &previous_int, nullptr) < 0 ||
      sigaction(SIGTERM, &previous_term, nullptr) < 0) {
    std::cerr << termcolor::yellow << "⚠ Could not restore signal handlers: "
              << strerror(errno) << termcolor::reset << "\n";
  }
  active_server.store(nullptr);
}

void start_preview_server(SiteBuilder &builder) {
  const SiteConfig &config = builder.get_config();

  builder.build();

  Server svr;
  configure_preview_routes(svr, builder.get_output_dir());
  int port = bind_with_retry(svr, config.host, config.port);

  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔════════════════════════════════════════╗\n"
            << "║          Preview Server                ║\n"
            << "╚════════════════════════════════════════╝" << termcolor::reset
            << "\n\n";

  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << "Serving " << termcolor::bright_white << config.site_name
            << termcolor::reset << "\n";
  std::cout << termcolor::bright_blue << "    " << termcolor::reset
            << "Directory: " << termcolor::white
            << builder.get_output_dir().string() << termcolor::reset << "\n";
  std::cout << termcolor::bright_blue << "    " << termcolor::reset
            << "Local:     " << termcolor::bright_cyan << "http://localhost:"
            << port << termcolor::reset << "\n\n";
  std::cout << termcolor::bright_blue << "Press Ctrl+C to stop server..."
            << termcolor::reset << "\n\n";

  run_until_signalled(svr);

  std::cout << termcolor::bright_green << "✓ Server stopped cleanly"
            << termcolor::reset << "\n\n";
}
