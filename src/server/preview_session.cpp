#include "preview_session.hpp"
#include "core/builder.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>

namespace net = boost::asio;

const char *to_string(PreviewSession::State state) {
  switch (state) {
  case PreviewSession::State::Idle:
    return "idle";
  case PreviewSession::State::ServerStarting:
    return "server-starting";
  case PreviewSession::State::ServerRunning:
    return "server-running";
  case PreviewSession::State::WatcherRunning:
    return "watcher-running";
  case PreviewSession::State::ShuttingDown:
    return "shutting-down";
  case PreviewSession::State::Stopped:
    return "stopped";
  }
  return "unknown";
}

PreviewSession::PreviewSession(Builder &build, Reporter &log,
                               std::chrono::milliseconds poll)
    : reporter(&log), builder(&build), server(log), watcher(log),
      poll_interval(poll) {}

static std::string preview_url(BindPolicy access, unsigned short port) {
  std::string host = access == BindPolicy::Public ? "0.0.0.0" : "localhost";
  return "http://" + host + ":" + std::to_string(port);
}

bool PreviewSession::run(const PreviewOptions &options) {
  // Registered before anything starts, so an interruption at any point
  // after this is seen by wait_for_interruption.
  net::io_context io;
  net::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([this](const boost::system::error_code &ec, int) {
    if (!ec) {
      stop_requested = true;
    }
  });

  state_ = State::ServerStarting;

  try {
    server.start(options.directory, options.access, options.port);
  } catch (const std::exception &e) {
    reporter->error(e.what());
    state_ = State::Stopped;
    return false;
  }
  state_ = State::ServerRunning;

  reporter->info("Your build located at `" + options.directory.string() +
                 "` may be previewed at");
  reporter->info(preview_url(options.access, server.port()));
  if (options.access == BindPolicy::Public) {
    reporter->info("The server is reachable from other computers on your "
                   "local network.");
  }
  reporter->info("Use [Ctrl]+[C] to halt the server.");

  if (options.watch) {
    const WatchBinding &binding = *options.watch;
    reporter->info("Watching for changes in `" +
                   fs::absolute(binding.watch_dir).string() + "` ...");
    try {
      watcher.start(binding.watch_dir,
                    make_rebuild_callback(binding, *builder, *reporter));
      state_ = State::WatcherRunning;
    } catch (const std::exception &e) {
      reporter->error(e.what());
      reporter->warn("Continuing without rebuilding on changes.");
    }
  }

  wait_for_interruption(io);
  return true;
}

void PreviewSession::wait_for_interruption(net::io_context &io) {
  while (!stop_requested) {
    io.run_for(poll_interval);
    if (io.stopped()) {
      io.restart();
    }
  }

  // The signal_set in run() stays registered until teardown is complete,
  // so a second Ctrl-C cannot kill the process halfway through.
  state_ = State::ShuttingDown;
  reporter->info("");
  reporter->info("Closing server...");
  shut_down();
}

void PreviewSession::shut_down() {
  if (state_ == State::Stopped) {
    return;
  }
  state_ = State::ShuttingDown;

  watcher.stop();
  server.stop();

  state_ = State::Stopped;
}
