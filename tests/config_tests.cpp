#include "test_helpers.hpp"
#include "utils/config.hpp"
#include <doctest/doctest.h>

TEST_CASE("ToolConfig defaults when folio.yaml is absent") {
  TempTestDir temp_dir;
  ToolConfig config = ToolConfig::load(temp_dir.path / kConfigFilename);

  CHECK(config.server.port == 8000);
  CHECK(config.server.access == "private");
  CHECK(config.build.xsl_dir == "/usr/share/pretext/xsl");
  CHECK(config.log.level == LogLevel::Info);
  CHECK(config.log.file == "cli.log");
}

TEST_CASE("ToolConfig reads folio.yaml") {
  TempTestDir temp_dir;
  write_file(temp_dir.path / kConfigFilename, R"(
server:
  port: 8123
  access: public
build:
  xsl_dir: /opt/pretext/xsl
log:
  level: debug
  file: folio.log
)");

  ToolConfig config = ToolConfig::load(temp_dir.path / kConfigFilename);

  CHECK(config.server.port == 8123);
  CHECK(config.server.access == "public");
  CHECK(config.build.xsl_dir == "/opt/pretext/xsl");
  CHECK(config.log.level == LogLevel::Debug);
  CHECK(config.log.file == "folio.log");
}

TEST_CASE("ToolConfig keeps defaults for sections that are left out") {
  TempTestDir temp_dir;
  write_file(temp_dir.path / kConfigFilename, "server:\n  port: 9000\n");

  ToolConfig config = ToolConfig::load(temp_dir.path / kConfigFilename);
  CHECK(config.server.port == 9000);
  CHECK(config.server.access == "private");
  CHECK(config.log.file == "cli.log");
}

TEST_CASE("ToolConfig rejects invalid values") {
  TempTestDir temp_dir;
  auto path = temp_dir.path / kConfigFilename;

  SUBCASE("bad access policy") {
    write_file(path, "server:\n  access: everyone\n");
    CHECK_THROWS_AS(ToolConfig::load(path), ConfigError);
  }

  SUBCASE("port out of range") {
    write_file(path, "server:\n  port: 70000\n");
    CHECK_THROWS_AS(ToolConfig::load(path), ConfigError);
  }

  SUBCASE("non-numeric port") {
    write_file(path, "server:\n  port: eighty\n");
    CHECK_THROWS_AS(ToolConfig::load(path), ConfigError);
  }

  SUBCASE("unknown log level") {
    write_file(path, "log:\n  level: chatty\n");
    CHECK_THROWS_AS(ToolConfig::load(path), ConfigError);
  }

  SUBCASE("malformed YAML") {
    write_file(path, "server: [unclosed\n");
    CHECK_THROWS_AS(ToolConfig::load(path), ConfigError);
  }
}

TEST_CASE("parse_log_level") {
  CHECK(parse_log_level("debug") == LogLevel::Debug);
  CHECK(parse_log_level("WARNING") == LogLevel::Warning);
  CHECK_FALSE(parse_log_level("verbose").has_value());
}
