#include "file_watcher_listener.hpp"
#include "core/watch_orchestrator.hpp"

namespace fs = std::filesystem;

static WatchAction to_watch_action(efsw::Action action) {
  switch (action) {
  case efsw::Actions::Add:
    return WatchAction::Created;
  case efsw::Actions::Delete:
    return WatchAction::Deleted;
  case efsw::Actions::Moved:
    return WatchAction::Moved;
  case efsw::Actions::Modified:
  default:
    return WatchAction::Modified;
  }
}

DevServerListener::DevServerListener(WatchOrchestrator *o) : orchestrator(o) {}

void DevServerListener::handleFileAction(efsw::WatchID watchid,
                                         const std::string &dir,
                                         const std::string &filename,
                                         efsw::Action action,
                                         std::string oldFilename) {
  (void)watchid;
  (void)oldFilename;

  orchestrator->notify({fs::path(dir) / filename, to_watch_action(action)});
}
