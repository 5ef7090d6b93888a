#ifndef PREVIEW_SESSION_HPP
#define PREVIEW_SESSION_HPP

#include "preview_server.hpp"
#include "utils/file_watcher_listener.hpp"
#include "utils/reporter.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <filesystem>
#include <optional>

class Builder;

namespace fs = std::filesystem;

struct PreviewOptions {
  fs::path directory;
  BindPolicy access = BindPolicy::Private;
  unsigned short port = 8000;
  std::optional<WatchBinding> watch;
};

// Serve + optional watch/rebuild, torn down on SIGINT/SIGTERM or
// request_stop(). Shutdown always stops the watcher (joined) before the
// server.
class PreviewSession {
public:
  enum class State {
    Idle,
    ServerStarting,
    ServerRunning,
    WatcherRunning,
    ShuttingDown,
    Stopped
  };

private:
  Reporter *reporter;
  Builder *builder;
  PreviewServer server;
  RebuildWatcher watcher;
  std::atomic<State> state_{State::Idle};
  std::atomic<bool> stop_requested{false};
  std::chrono::milliseconds poll_interval;

  void wait_for_interruption(boost::asio::io_context &io);
  void shut_down();

public:
  PreviewSession(Builder &build, Reporter &log,
                 std::chrono::milliseconds poll = std::chrono::milliseconds(250));

  PreviewSession(const PreviewSession &) = delete;
  PreviewSession &operator=(const PreviewSession &) = delete;

  // Blocks until interrupted. Returns false if the server could not start;
  // nothing is left running in that case.
  bool run(const PreviewOptions &options);

  // Thread-safe; same effect as one interruption signal.
  void request_stop() { stop_requested = true; }

  State state() const { return state_; }
  unsigned short port() const { return server.port(); }
};

const char *to_string(PreviewSession::State state);

#endif
