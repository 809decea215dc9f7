#pragma once

#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iostream>
#include <netinet/in.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <unordered_map>
#include <vector>

struct Request {
  std::string method;
  std::string path;
  std::string version;
  std::unordered_map<std::string, std::string> headers;
};

struct Response {
  int status = 200;
  std::unordered_map<std::string, std::string> headers;
  std::string body;

  void set_content(const std::string &content, const std::string &type) {
    body = content;
    headers["Content-Type"] = type;
  }

  std::string to_http() const {
    std::ostringstream oss;
    std::string status_text = get_status_text(status);

    oss << "HTTP/1.1 " << status << " " << status_text << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";

    for (const auto &[key, value] : headers) {
      oss << key << ": " << value << "\r\n";
    }

    oss << "\r\n" << body;
    return oss.str();
  }

private:
  std::string get_status_text(int code) const {
    switch (code) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 500:
      return "Internal Server Error";
    default:
      return "Unknown";
    }
  }
};

using Handler = std::function<void(const Request &, Response &)>;
using Logger = std::function<void(const Request &, const Response &)>;

class Server {
private:
  std::atomic<int> server_fd{-1};
  int bound_port = -1;
  int last_errno = 0;
  std::atomic<bool> running{false};
  std::vector<std::pair<std::string, Handler>> routes;
  Handler default_handler;
  Logger logger;

  static constexpr int client_timeout_seconds = 5;

  static void strip_cr(std::string &line) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
  }

  void handle_client(int client_fd) {
    // A silent client must not hold up stop().
    timeval timeout{};
    timeout.tv_sec = client_timeout_seconds;
    if (::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout,
                     sizeof(timeout)) < 0) {
      std::cerr << "Failed to set SO_RCVTIMEO: " << strerror(errno) << "\n";
    }

    char buffer[8192];
    ssize_t bytes = ::recv(client_fd, buffer, sizeof(buffer) - 1, 0);

    if (bytes <= 0) {
      ::close(client_fd);
      return;
    }

    buffer[bytes] = '\0';
    Request req = parse_request(std::string(buffer, bytes));
    Response res = dispatch(req);

    if (logger) {
      logger(req, res);
    }

    std::string response = res.to_http();
    size_t sent = 0;
    while (sent < response.size()) {
      ssize_t n = ::send(client_fd, response.data() + sent,
                       response.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        break;
      }
      sent += static_cast<size_t>(n);
    }
    ::close(client_fd);
  }

public:
  ~Server() { stop(); }

  static Request parse_request(const std::string &raw) {
    Request req;
    std::istringstream iss(raw);
    std::string line;

    if (std::getline(iss, line)) {
      strip_cr(line);
      std::istringstream line_stream(line);
      line_stream >> req.method >> req.path >> req.version;
    }

    while (std::getline(iss, line)) {
      strip_cr(line);
      if (line.empty()) {
        break;
      }
      size_t colon = line.find(':');
      if (colon != std::string::npos) {
        std::string key = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(' ', colon + 1);
        req.headers[key] = value_start == std::string::npos
                               ? std::string()
                               : line.substr(value_start);
      }
    }

    return req;
  }

  // Runs the matching handler. Anything a handler throws becomes a 500 so a
  // single request can never take the server down.
  Response dispatch(const Request &req) const {
    Response res;
    try {
      bool handled = false;
      for (const auto &[pattern, handler] : routes) {
        if (pattern == req.path) {
          handler(req, res);
          handled = true;
          break;
        }
      }

      if (!handled && default_handler) {
        default_handler(req, res);
      } else if (!handled) {
        res.status = 404;
        res.set_content("<h1>Page Not Found</h1>", "text/html");
      }
    } catch (const std::exception &e) {
      std::cerr << "Error handling request " << req.path << ": " << e.what()
                << "\n";
      res = Response();
      res.status = 500;
      res.set_content("<h1>Error</h1><p>" + std::string(e.what()) + "</p>",
                      "text/html");
    }
    return res;
  }

  void set_logger(Logger log_handler) { logger = log_handler; }

  void Get(const std::string &pattern, Handler handler) {
    routes.push_back({pattern, handler});
  }

  void Get(const std::string &pattern, Handler handler, bool is_catch_all) {
    if (is_catch_all) {
      default_handler = handler;
    } else {
      routes.push_back({pattern, handler});
    }
  }

  // errno of the last failed bind_to_port() (EADDRINUSE when the port is
  // taken).
  int get_last_errno() const { return last_errno; }
  int get_bound_port() const { return bound_port; }

  bool bind_to_port(const std::string &host, int port) {
    last_errno = 0;
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd == -1) {
      last_errno = errno;
      std::cerr << "Failed to create socket: " << strerror(errno) << "\n";
      return false;
    }

    // No SO_REUSEPORT: a second bind on a busy port has to fail.
    int opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
      std::cerr << "Failed to set SO_REUSEADDR: " << strerror(errno) << "\n";
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
      last_errno = EINVAL;
      std::cerr << "Invalid listen address: " << host << "\n";
      ::close(fd);
      return false;
    }

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0 ||
        ::listen(fd, 16) < 0) {
      last_errno = errno;
      ::close(fd);
      return false;
    }

    server_fd.store(fd);
    bound_port = port;
    running = true;
    return true;
  }

  // Accept loop on the socket opened by bind_to_port(). Returns once stop()
  // is called.
  bool listen_after_bind() {
    if (server_fd.load() == -1) {
      return false;
    }

    while (running) {
      sockaddr_in client_addr{};
      socklen_t client_len = sizeof(client_addr);
      int client_fd = ::accept(server_fd.load(),
                               reinterpret_cast<sockaddr *>(&client_addr),
                               &client_len);

      if (client_fd < 0) {
        if (running && errno != EINTR) {
          std::cerr << "Accept failed: " << strerror(errno) << "\n";
        }
        continue;
      }

      handle_client(client_fd);
    }

    return true;
  }

  // Safe to call from a signal handler: only an atomic store and close().
  void stop() {
    running = false;
    int fd = server_fd.exchange(-1);
    if (fd != -1) {
      ::shutdown(fd, SHUT_RDWR);
      ::close(fd);
    }
  }
};
