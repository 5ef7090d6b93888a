#include "preview_server.hpp"
#include "server.hpp"

std::optional<BindPolicy> parse_bind_policy(const std::string &name) {
  if (name == "private" || name == "PRIVATE")
    return BindPolicy::Private;
  if (name == "public" || name == "PUBLIC")
    return BindPolicy::Public;
  return std::nullopt;
}

std::string bind_address(BindPolicy policy) {
  return policy == BindPolicy::Public ? "0.0.0.0" : "127.0.0.1";
}

static std::string format_request(const Request &req, const Response &res) {
  return req.method + " " + req.path + " " + std::to_string(res.status) +
         " " + std::to_string(res.body.size()) + "B";
}

PreviewServer::PreviewServer(Reporter &log) : reporter(&log) {}

PreviewServer::~PreviewServer() { stop(); }

void PreviewServer::start(const fs::path &directory, BindPolicy policy,
                          unsigned short port) {
  stop();

  auto svr = std::make_unique<Server>(directory);
  svr->set_default_header("Cache-Control",
                          "no-cache, no-store, must-revalidate");
  svr->set_default_header("Pragma", "no-cache");
  svr->set_default_header("Expires", "0");

  Reporter *log = reporter;
  svr->set_logger([log](const Request &req, const Response &res) {
    if (res.status >= 400) {
      log->warn(format_request(req, res));
    } else {
      log->debug(format_request(req, res));
    }
  });

  port_ = svr->bind(bind_address(policy), port);
  directory_ = directory;
  server = std::move(svr);

  Server *raw = server.get();
  server_thread = std::thread([raw, log]() {
    try {
      raw->serve();
    } catch (const std::exception &e) {
      log->error(std::string("Preview server stopped unexpectedly: ") +
                 e.what());
    }
  });

  reporter->debug("HTTP server listening on " + bind_address(policy) + ":" +
                  std::to_string(port_.load()));
}

void PreviewServer::stop() {
  if (!server) {
    return;
  }

  server->stop();
  if (server_thread.joinable()) {
    server_thread.join();
  }
  server->close_socket();
  server.reset();

  reporter->info("Server stopped");
}
