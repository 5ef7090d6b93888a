#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "reporter.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

inline constexpr const char *kConfigFilename = "folio.yaml";

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ServerConfig {
  unsigned short port = 8000;
  std::string access = "private";
};

struct BuildConfig {
  std::string xsl_dir = "/usr/share/pretext/xsl";
};

struct LogConfig {
  LogLevel level = LogLevel::Info;
  std::string file = "cli.log";
};

class ToolConfig {
private:
  static std::string scalar(const YAML::Node &node, const std::string &key,
                            const std::string &fallback) {
    if (node && node[key]) {
      return node[key].as<std::string>();
    }
    return fallback;
  }

public:
  ServerConfig server;
  BuildConfig build;
  LogConfig log;

  // Missing file is not an error: every field has a default.
  static ToolConfig load(const fs::path &config_path) {
    ToolConfig config;

    if (!fs::exists(config_path)) {
      return config;
    }

    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception &e) {
      throw ConfigError("Invalid " + config_path.string() + ": " +
                        std::string(e.what()));
    }

    if (!yaml.IsMap()) {
      if (yaml.IsNull()) {
        return config;
      }
      throw ConfigError(config_path.string() + " must contain a mapping");
    }

    try {
      if (const YAML::Node server = yaml["server"]) {
        if (server["port"]) {
          int port = server["port"].as<int>();
          if (port < 0 || port > 65535) {
            throw ConfigError("server.port out of range: " +
                              std::to_string(port));
          }
          config.server.port = static_cast<unsigned short>(port);
        }
        config.server.access = scalar(server, "access", config.server.access);
        if (config.server.access != "private" &&
            config.server.access != "public") {
          throw ConfigError("server.access must be 'private' or 'public', got '" +
                            config.server.access + "'");
        }
      }

      if (const YAML::Node build = yaml["build"]) {
        config.build.xsl_dir = scalar(build, "xsl_dir", config.build.xsl_dir);
      }

      if (const YAML::Node log = yaml["log"]) {
        if (log["level"]) {
          auto level = parse_log_level(log["level"].as<std::string>());
          if (!level) {
            throw ConfigError("log.level must be one of debug, info, "
                              "warning, error");
          }
          config.log.level = *level;
        }
        config.log.file = scalar(log, "file", config.log.file);
      }
    } catch (const YAML::Exception &e) {
      throw ConfigError("Invalid " + config_path.string() + ": " +
                        std::string(e.what()));
    }

    return config;
  }
};

#endif
