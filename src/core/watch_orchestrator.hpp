#ifndef WATCH_ORCHESTRATOR_HPP
#define WATCH_ORCHESTRATOR_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <efsw/efsw.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;

class DevServerListener;

enum class WatchAction { Created, Deleted, Modified, Moved };

struct WatchEvent {
  fs::path path;
  WatchAction action = WatchAction::Modified;
};

const char *to_string(WatchAction action);

// Runs one full rebuild per filesystem event on a dedicated thread.
//
// Events arrive from efsw's thread through notify() and are queued; the
// worker pops them one at a time and calls on_change synchronously, so
// rebuilds never overlap. stop() is observed at the next wait, never in the
// middle of a rebuild.
class WatchOrchestrator {
public:
  using ChangeHandler = std::function<void(const WatchEvent &)>;

private:
  fs::path watch_dir;
  ChangeHandler on_change;

  std::unique_ptr<efsw::FileWatcher> file_watcher;
  std::unique_ptr<DevServerListener> listener;

  std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::deque<WatchEvent> pending;
  bool stop_requested = false;

  std::thread worker;
  std::atomic<size_t> rebuilds{0};

  void run();

public:
  WatchOrchestrator(const fs::path &dir, ChangeHandler handler);
  ~WatchOrchestrator();

  WatchOrchestrator(const WatchOrchestrator &) = delete;
  WatchOrchestrator &operator=(const WatchOrchestrator &) = delete;

  // Registers the recursive watch and starts the worker. Throws
  // std::runtime_error when the directory cannot be watched.
  void start();
  void stop();

  void notify(const WatchEvent &event);

  bool running() const { return worker.joinable(); }
  size_t rebuild_count() const { return rebuilds.load(); }
  const fs::path &get_watch_dir() const { return watch_dir; }
};

#endif
