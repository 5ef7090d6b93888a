#pragma once

#include "core/target.hpp"
#include "reporter.hpp"
#include <efsw/efsw.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

class Builder;

struct WatchEvent {
  std::filesystem::path path;
  efsw::Action action;
};

const char *action_name(efsw::Action action);

// What a running watch rebuilds: one target's source, output and
// parameters, captured when the session starts.
struct WatchBinding {
  std::filesystem::path watch_dir;
  std::filesystem::path source;
  std::filesystem::path output_dir;
  StringParams params;

  // Watches the directory holding the target's source and always passes
  // the absolute publication file as the "publisher" parameter, as
  // XsltBuilder::build does.
  static WatchBinding for_target(const Target &target);
};

using WatchCallback = std::function<void(const WatchEvent &)>;

// Runs a full HTML rebuild of the bound target. Builder failures and
// exceptions are logged, never thrown into the observer thread.
WatchCallback make_rebuild_callback(const WatchBinding &binding,
                                    Builder &builder, Reporter &log);

// Forwards every efsw notification, of any kind, to one callback.
class RebuildListener : public efsw::FileWatchListener {
private:
  WatchCallback on_event;

public:
  explicit RebuildListener(WatchCallback callback);

  void handleFileAction(efsw::WatchID watchid, const std::string &dir,
                        const std::string &filename, efsw::Action action,
                        std::string oldFilename = "") override;
};

// Owns one recursive efsw watch and the observer thread behind it.
class RebuildWatcher {
private:
  Reporter *reporter;
  std::unique_ptr<RebuildListener> listener;
  std::unique_ptr<efsw::FileWatcher> watcher;
  efsw::WatchID watch_id = 0;
  std::filesystem::path watch_dir_;
  mutable std::mutex mutex_;

public:
  explicit RebuildWatcher(Reporter &log);
  ~RebuildWatcher();

  RebuildWatcher(const RebuildWatcher &) = delete;
  RebuildWatcher &operator=(const RebuildWatcher &) = delete;

  // Throws std::runtime_error if the directory cannot be watched.
  void start(const std::filesystem::path &dir, WatchCallback on_event);

  // Returns only after the observer thread has been joined; no callback
  // runs after this. Idempotent.
  void stop();

  bool running() const;
  const std::filesystem::path &watch_dir() const { return watch_dir_; }
};
