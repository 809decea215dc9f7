#pragma once

#include <efsw/efsw.hpp>
#include <filesystem>
#include <string>

class WatchOrchestrator;

// Forwards every efsw event to the orchestrator's queue, unfiltered.
class DevServerListener : public efsw::FileWatchListener {
private:
  WatchOrchestrator *orchestrator;

public:
  explicit DevServerListener(WatchOrchestrator *o);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;
};
