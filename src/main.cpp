#include "core/project.hpp"
#include "core/xslt_builder.hpp"
#include "server/preview_session.hpp"
#include "utils/config.hpp"
#include "utils/file_watcher_listener.hpp"
#include "utils/reporter.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef FOLIO_VERSION
#define FOLIO_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "folio - build and preview document projects\n\n";
  std::cout << "Commands:\n";
  std::cout << "  folio build [TARGET]      Build a target from project.ptx\n";
  std::cout << "      -f, --format FORMAT   html, latex or pdf\n";
  std::cout << "      -i, --input PATH      Main source file\n";
  std::cout << "      -o, --output DIR      Output directory\n";
  std::cout << "      -p, --publication PATH\n";
  std::cout << "      -x, --xsl PATH        Custom stylesheet\n";
  std::cout << "      --stringparam KEY VALUE\n";
  std::cout << "      --clean               Remove the output directory first\n";
  std::cout << "  folio view [TARGET]       Preview a target in your browser\n";
  std::cout << "      -a, --access private|public\n";
  std::cout << "      -p, --port PORT       Default 8000\n";
  std::cout << "      -d, --directory DIR   Serve DIR instead of a target\n";
  std::cout << "      -w, --watch           Build, then rebuild on changes\n";
  std::cout << "      -b, --build           Build before serving\n";
  std::cout << "  folio targets             List targets in project.ptx\n";
  std::cout << "  folio support             Show installation details\n";
  std::cout << "\nOptions:\n";
  std::cout << "  -v, --verbosity LEVEL     debug, info, warning or error\n";
  std::cout << "  --version                 Show version\n";
  std::cout << "  -h, --help                Show this help\n";
}

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Cursor over the arguments that follow the command name.
class Args {
private:
  std::vector<std::string> args;
  size_t pos = 0;

public:
  explicit Args(std::vector<std::string> a) : args(std::move(a)) {}

  bool done() const { return pos >= args.size(); }
  const std::string &next() { return args[pos++]; }

  std::string value(const std::string &flag) {
    if (done()) {
      throw UsageError("Option " + flag + " requires a value");
    }
    return next();
  }
};

static unsigned short parse_port(const std::string &text) {
  try {
    size_t used = 0;
    int port = std::stoi(text, &used);
    if (used == text.size() && port >= 0 && port <= 65535) {
      return static_cast<unsigned short>(port);
    }
  } catch (const std::exception &) {
  }
  throw UsageError("Invalid port: " + text);
}

static BuildTools build_tools(const Project &project, const ToolConfig &config) {
  BuildTools tools;
  tools.xsltproc = project.manifest().scalar("executables/xsltproc", "xsltproc");
  tools.pdflatex = project.manifest().scalar("executables/pdflatex", "pdflatex");
  tools.xsl_dir = config.build.xsl_dir;
  if (project.has_manifest()) {
    tools.project_root = project.root();
  }
  return tools;
}

static int run_build(Args &args, const Project &project,
                     const ToolConfig &config, Reporter &log) {
  std::optional<std::string> target_name;
  TargetOverrides overrides;
  bool clean = false;

  while (!args.done()) {
    std::string arg = args.next();
    if (arg == "-f" || arg == "--format") {
      std::string format = args.value(arg);
      if (!parse_format(format)) {
        throw UsageError("Unknown format `" + format +
                         "`; expected html, latex or pdf");
      }
      overrides.format = format;
    } else if (arg == "-i" || arg == "--input") {
      overrides.source = fs::absolute(args.value(arg));
    } else if (arg == "-o" || arg == "--output") {
      overrides.output_dir = fs::absolute(args.value(arg));
    } else if (arg == "-p" || arg == "--publication") {
      overrides.publication = fs::absolute(args.value(arg));
    } else if (arg == "-x" || arg == "--xsl") {
      overrides.xsl = fs::absolute(args.value(arg));
    } else if (arg == "--stringparam") {
      std::string key = args.value(arg);
      overrides.stringparams[key] = args.value(arg);
    } else if (arg == "--clean") {
      clean = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw UsageError("Unknown option for build: " + arg);
    } else if (!target_name) {
      target_name = arg;
    } else {
      throw UsageError("Unexpected argument: " + arg);
    }
  }

  if (!project.has_manifest()) {
    log.warn("No project.ptx manifest was found.");
    log.warn("Continuing using command-line arguments.");
  } else if (!target_name) {
    log.info("Since no build target was supplied, the first target of the "
             "project.ptx manifest will be built.");
  }

  auto target = project.target(target_name, overrides);
  if (!target) {
    log.error("Build target could not be found in project.ptx manifest.");
    log.error("Exiting without completing task.");
    return 1;
  }

  XsltBuilder builder(build_tools(project, config), log);
  return builder.build(*target, clean) ? 0 : 1;
}

static int run_view(Args &args, const Project &project,
                    const ToolConfig &config, Reporter &log) {
  std::optional<std::string> target_name;
  std::optional<fs::path> directory;
  BindPolicy access = parse_bind_policy(config.server.access)
                          .value_or(BindPolicy::Private);
  unsigned short port = config.server.port;
  bool watch = false;
  bool build = false;

  while (!args.done()) {
    std::string arg = args.next();
    if (arg == "-a" || arg == "--access") {
      std::string value = args.value(arg);
      auto policy = parse_bind_policy(value);
      if (!policy) {
        throw UsageError("Access must be public or private, got " + value);
      }
      access = *policy;
    } else if (arg == "-p" || arg == "--port") {
      port = parse_port(args.value(arg));
    } else if (arg == "-d" || arg == "--directory") {
      directory = fs::absolute(args.value(arg));
    } else if (arg == "-w" || arg == "--watch") {
      watch = true;
    } else if (arg == "-b" || arg == "--build") {
      build = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw UsageError("Unknown option for view: " + arg);
    } else if (!target_name) {
      target_name = arg;
    } else {
      throw UsageError("Unexpected argument: " + arg);
    }
  }

  XsltBuilder builder(build_tools(project, config), log);
  PreviewSession session(builder, log);

  if (directory) {
    PreviewOptions options;
    options.directory = *directory;
    options.access = access;
    options.port = port;
    return session.run(options) ? 0 : 1;
  }

  auto target = project.manifest_target(target_name);
  if (!target) {
    log.error("Target `" + target_name.value_or("") +
              "` could not be found.");
    return 1;
  }

  if (watch && target->output_format() != OutputFormat::Html) {
    log.warn("Watching is only supported for HTML targets; `" +
             target->name() + "` will not be rebuilt on changes.");
    watch = false;
  }

  if (build || watch) {
    if (!builder.build(*target, false)) {
      log.warn("Initial build failed; serving the previous build.");
    }
  }

  PreviewOptions options;
  options.directory = target->output_dir();
  options.access = access;
  options.port = port;
  if (watch) {
    options.watch = WatchBinding::for_target(*target);
  }
  return session.run(options) ? 0 : 1;
}

static int run_targets(const Project &project, Reporter &log) {
  if (!project.has_manifest()) {
    log.warn("No project.ptx manifest was found.");
    return 1;
  }
  if (project.targets().empty()) {
    log.info("The project manifest defines no targets.");
    return 0;
  }
  for (const auto &target : project.targets()) {
    std::cout << target.name() << "\n";
  }
  return 0;
}

static int run_support(const Project &project, const ToolConfig &config,
                       Reporter &log) {
  log.info("Please share the following information when asking for help.");
  log.info("");
  log.info(std::string("folio version: ") + FOLIO_VERSION);
  log.info("Stylesheet directory: " + config.build.xsl_dir);
  log.info("Current working directory: " + fs::current_path().string());
  if (project.has_manifest()) {
    log.info("Project path: " + project.root().string());
    log.info("");
    log.info("Contents of project.ptx:");
    log.info("------------------------");
    log.info(project.manifest().to_string());
  } else {
    log.info("No project.ptx found.");
  }
  return 0;
}

int main(int argc, char *argv[]) {
  std::vector<std::string> all(argv + 1, argv + argc);
  std::optional<LogLevel> cli_level;
  size_t i = 0;

  for (; i < all.size(); ++i) {
    const std::string &arg = all[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--version") {
      std::cout << FOLIO_VERSION << "\n";
      return 0;
    }
    if (arg == "-v" || arg == "--verbosity") {
      if (i + 1 >= all.size() || !(cli_level = parse_log_level(all[i + 1]))) {
        std::cerr << "Option " << arg
                  << " requires one of debug, info, warning, error\n";
        return 1;
      }
      ++i;
      continue;
    }
    break;
  }

  if (i >= all.size()) {
    print_usage();
    return 1;
  }

  std::string command = all[i];
  Args args(std::vector<std::string>(all.begin() + i + 1, all.end()));
  ConsoleReporter reporter(cli_level.value_or(LogLevel::Info));

  try {
    Project project = Project::open(fs::current_path(), reporter);
    ToolConfig config = ToolConfig::load(project.root() / kConfigFilename);

    if (!cli_level) {
      reporter.set_level(config.log.level);
    }

    if (project.has_manifest()) {
      if (!config.log.file.empty() &&
          !reporter.open_log_file(project.root() / config.log.file)) {
        reporter.warn("Could not open log file " + config.log.file);
      }
      reporter.info("Project found in `" + project.root().string() + "`.");
    } else {
      reporter.info("No existing project found.");
    }

    if (command == "build") {
      return run_build(args, project, config, reporter);
    } else if (command == "view") {
      return run_view(args, project, config, reporter);
    } else if (command == "targets") {
      return run_targets(project, reporter);
    } else if (command == "support") {
      return run_support(project, config, reporter);
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      print_usage();
      return 1;
    }

  } catch (const UsageError &e) {
    std::cerr << e.what() << "\nRun `folio --help` for help.\n";
    return 2;
  } catch (const std::exception &e) {
    reporter.error(std::string("Fatal error: ") + e.what());
    return 1;
  }

  return 0;
}
