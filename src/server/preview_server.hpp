#ifndef PREVIEW_SERVER_HPP
#define PREVIEW_SERVER_HPP

#include "utils/reporter.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

class Server;

namespace fs = std::filesystem;

// Private listens on loopback only; public on every interface.
enum class BindPolicy { Private, Public };

std::optional<BindPolicy> parse_bind_policy(const std::string &name);
std::string bind_address(BindPolicy policy);

// Serves a directory over HTTP on its own thread, with client caching
// disabled on every response.
class PreviewServer {
private:
  Reporter *reporter;
  std::unique_ptr<Server> server;
  std::thread server_thread;
  fs::path directory_;
  std::atomic<unsigned short> port_{0};

public:
  explicit PreviewServer(Reporter &log);
  ~PreviewServer();

  PreviewServer(const PreviewServer &) = delete;
  PreviewServer &operator=(const PreviewServer &) = delete;

  // Binds on the calling thread, then serves on a new one. Throws
  // std::runtime_error if the address cannot be bound.
  void start(const fs::path &directory, BindPolicy policy,
             unsigned short port);

  // Idempotent. Returns after the serving thread has exited.
  void stop();

  bool running() const { return server != nullptr; }
  unsigned short port() const { return port_; }
  const fs::path &directory() const { return directory_; }
};

#endif
