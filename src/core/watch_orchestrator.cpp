#include "watch_orchestrator.hpp"
#include "utils/file_watcher_listener.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <termcolor/termcolor.hpp>

const char *to_string(WatchAction action) {
  switch (action) {
  case WatchAction::Created:
    return "Added";
  case WatchAction::Deleted:
    return "Deleted";
  case WatchAction::Modified:
    return "Modified";
  case WatchAction::Moved:
    return "Moved";
  }
  return "Changed";
}

static void log_event(const WatchEvent &event) {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm = *std::localtime(&time);

  std::cout << "\n"
            << termcolor::bright_blue << std::put_time(&tm, "%H:%M:%S")
            << termcolor::reset << " ";

  switch (event.action) {
  case WatchAction::Created:
    std::cout << termcolor::bright_green << "➕ ";
    break;
  case WatchAction::Deleted:
    std::cout << termcolor::bright_red << "➖ ";
    break;
  default:
    std::cout << termcolor::bright_cyan << "📝 ";
  }

  std::cout << to_string(event.action) << termcolor::reset << " "
            << termcolor::bright_white << event.path.string()
            << termcolor::reset << "\n";
}

WatchOrchestrator::WatchOrchestrator(const fs::path &dir, ChangeHandler handler)
    : watch_dir(dir), on_change(std::move(handler)) {}

WatchOrchestrator::~WatchOrchestrator() { stop(); }

void WatchOrchestrator::start() {
  if (worker.joinable()) {
    return;
  }

  if (!fs::is_directory(watch_dir)) {
    throw std::runtime_error("Cannot watch missing directory: " +
                             watch_dir.string());
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    stop_requested = false;
    pending.clear();
  }

  file_watcher = std::make_unique<efsw::FileWatcher>();
  listener = std::make_unique<DevServerListener>(this);

  efsw::WatchID id =
      file_watcher->addWatch(watch_dir.string(), listener.get(), true);
  if (id < 0) {
    std::string reason = efsw::Errors::Log::getLastErrorLog();
    file_watcher.reset();
    listener.reset();
    throw std::runtime_error("Cannot watch " + watch_dir.string() + ": " +
                             reason);
  }

  file_watcher->watch();
  worker = std::thread(&WatchOrchestrator::run, this);

  std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
            << "Watching " << termcolor::bright_white << watch_dir.string()
            << termcolor::reset << "\n";
}

void WatchOrchestrator::stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    stop_requested = true;
  }
  queue_cv.notify_all();

  if (worker.joinable()) {
    worker.join();
  }

  // Destroying the watcher joins efsw's thread; no more notify() calls after.
  file_watcher.reset();
  listener.reset();
}

void WatchOrchestrator::notify(const WatchEvent &event) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if (stop_requested) {
      return;
    }
    pending.push_back(event);
  }
  queue_cv.notify_one();
}

void WatchOrchestrator::run() {
  while (true) {
    WatchEvent event;
    {
      std::unique_lock<std::mutex> lock(queue_mutex);
      queue_cv.wait(lock, [this] { return stop_requested || !pending.empty(); });
      if (stop_requested) {
        break;
      }
      event = std::move(pending.front());
      pending.pop_front();
    }

    log_event(event);

    auto rebuild_start = std::chrono::high_resolution_clock::now();
    try {
      on_change(event);
      rebuilds++;

      auto rebuild_end = std::chrono::high_resolution_clock::now();
      auto rebuild_duration =
          std::chrono::duration_cast<std::chrono::milliseconds>(rebuild_end -
                                                                rebuild_start);
      std::cout << termcolor::bright_green << "  ✓ " << termcolor::reset
                << "Rebuild complete in " << termcolor::bright_white
                << rebuild_duration.count() << "ms" << termcolor::reset
                << "\n";
    } catch (const std::exception &e) {
      rebuilds++;
      std::cerr << termcolor::bright_red
                << "  ✗ Rebuild failed: " << termcolor::reset
                << termcolor::bright_white << e.what() << termcolor::reset
                << "\n";
    }
  }
}
