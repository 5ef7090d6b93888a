#include "file_watcher_listener.hpp"
#include "core/builder.hpp"
#include "core/xslt_builder.hpp"
#include <chrono>
#include <stdexcept>

namespace fs = std::filesystem;

const char *action_name(efsw::Action action) {
  switch (action) {
  case efsw::Actions::Add:
    return "added";
  case efsw::Actions::Delete:
    return "deleted";
  case efsw::Actions::Modified:
    return "modified";
  case efsw::Actions::Moved:
    return "moved";
  }
  return "changed";
}

WatchBinding WatchBinding::for_target(const Target &target) {
  WatchBinding binding;
  binding.source = fs::absolute(target.source());
  binding.watch_dir = binding.source.parent_path();
  binding.output_dir = fs::absolute(target.output_dir());
  binding.params = target.stringparams();
  binding.params[kPublisherParam] = fs::absolute(target.publication()).string();
  return binding;
}

WatchCallback make_rebuild_callback(const WatchBinding &binding,
                                    Builder &builder, Reporter &log) {
  Builder *b = &builder;
  Reporter *reporter = &log;

  return [binding, b, reporter](const WatchEvent &event) {
    auto rebuild_start = std::chrono::high_resolution_clock::now();

    reporter->debug(std::string(action_name(event.action)) + " " +
                    event.path.string());
    reporter->info("Changes to source found, rebuilding target...");

    try {
      bool ok = b->build_html(binding.source, binding.output_dir,
                              binding.params);

      auto rebuild_duration =
          std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::high_resolution_clock::now() - rebuild_start);

      if (ok) {
        reporter->info("✓ Rebuild complete in " +
                       std::to_string(rebuild_duration.count()) + "ms");
      } else {
        reporter->error("Rebuild failed");
      }
    } catch (const std::exception &e) {
      reporter->error(std::string("Rebuild failed: ") + e.what());
    }
  };
}

RebuildListener::RebuildListener(WatchCallback callback)
    : on_event(std::move(callback)) {}

void RebuildListener::handleFileAction(efsw::WatchID watchid,
                                       const std::string &dir,
                                       const std::string &filename,
                                       efsw::Action action,
                                       std::string oldFilename) {
  (void)watchid;
  (void)oldFilename;

  on_event(WatchEvent{fs::path(dir) / filename, action});
}

RebuildWatcher::RebuildWatcher(Reporter &log) : reporter(&log) {}

RebuildWatcher::~RebuildWatcher() { stop(); }

void RebuildWatcher::start(const fs::path &dir, WatchCallback on_event) {
  stop();

  std::lock_guard<std::mutex> lock(mutex_);

  if (!fs::is_directory(dir)) {
    throw std::runtime_error("Cannot watch " + dir.string() +
                             ": not a directory");
  }

  auto new_listener = std::make_unique<RebuildListener>(std::move(on_event));
  auto new_watcher = std::make_unique<efsw::FileWatcher>();

  efsw::WatchID id =
      new_watcher->addWatch(dir.string(), new_listener.get(), true);
  if (id < 0) {
    throw std::runtime_error("Cannot watch " + dir.string() + ": " +
                             efsw::Errors::Log::getLastErrorLog());
  }

  new_watcher->watch();

  listener = std::move(new_listener);
  watcher = std::move(new_watcher);
  watch_id = id;
  watch_dir_ = dir;

  reporter->debug("Watch " + std::to_string(id) + " started on " +
                  dir.string());
}

void RebuildWatcher::stop() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!watcher) {
    return;
  }

  watcher->removeWatch(watch_id);
  // The efsw destructor joins its observer thread.
  watcher.reset();
  listener.reset();
  watch_id = 0;

  reporter->info("Watcher stopped");
}

bool RebuildWatcher::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return watcher != nullptr;
}
