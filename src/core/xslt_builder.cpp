#include "xslt_builder.hpp"
#include "utils/process.hpp"
#include <chrono>
#include <system_error>

XsltBuilder::XsltBuilder(BuildTools build_tools, Reporter &log)
    : tools(std::move(build_tools)), reporter(&log) {}

fs::path XsltBuilder::stylesheet_for(OutputFormat format) const {
  switch (format) {
  case OutputFormat::Html:
    return tools.xsl_dir / "pretext-html.xsl";
  case OutputFormat::Latex:
  case OutputFormat::Pdf:
    return tools.xsl_dir / "pretext-latex.xsl";
  }
  return tools.xsl_dir / "pretext-html.xsl";
}

bool XsltBuilder::run(const std::vector<std::string> &argv,
                      const fs::path &cwd) {
  reporter->debug("Running `" + join_command(argv) + "` in " + cwd.string());

  ExecResult result = run_process(argv, cwd);
  if (!result.error.empty()) {
    reporter->error(argv.front() + ": " + result.error);
    return false;
  }
  if (!result.succeeded()) {
    reporter->error(argv.front() + " exited with status " +
                    std::to_string(result.exit_code));
    return false;
  }
  return true;
}

static bool is_within(const fs::path &path, const fs::path &dir) {
  auto rel = path.lexically_relative(dir);
  return !rel.empty() && *rel.begin() != "..";
}

bool XsltBuilder::clean_output(const fs::path &output_dir,
                               const fs::path &source) {
  fs::path output = fs::absolute(output_dir).lexically_normal();

  if (output == output.root_path() ||
      (!tools.project_root.empty() &&
       is_within(fs::absolute(tools.project_root).lexically_normal(),
                 output)) ||
      is_within(fs::absolute(source).lexically_normal(), output)) {
    reporter->error("Refusing to clean " + output.string() +
                    ": it contains the project or its source");
    return false;
  }

  std::error_code ec;
  fs::remove_all(output, ec);
  if (ec) {
    reporter->error("Could not clean " + output.string() + ": " +
                    ec.message());
    return false;
  }
  reporter->info("Destroyed previous build at " + output.string());
  return true;
}

std::vector<std::string>
XsltBuilder::xsltproc_command(const fs::path &stylesheet,
                              const fs::path &source,
                              const StringParams &params,
                              const fs::path &output) const {
  std::vector<std::string> argv = {tools.xsltproc, "--xinclude"};
  for (const auto &[key, value] : params) {
    argv.push_back("--stringparam");
    argv.push_back(key);
    argv.push_back(value);
  }
  if (!output.empty()) {
    argv.push_back("-o");
    argv.push_back(output.string());
  }
  argv.push_back(stylesheet.string());
  argv.push_back(source.string());
  return argv;
}

bool XsltBuilder::build_latex(const fs::path &source,
                              const fs::path &output_dir,
                              const fs::path &stylesheet,
                              const StringParams &params,
                              fs::path &tex_file) {
  tex_file = output_dir / source.filename().replace_extension(".tex");
  return run(xsltproc_command(stylesheet, source, params, tex_file),
             output_dir);
}

bool XsltBuilder::build(const Target &target, bool clean) {
  auto start = std::chrono::high_resolution_clock::now();

  auto format = target.output_format();
  if (!format) {
    reporter->error("Unsupported output format `" + target.format() +
                    "` for target `" + target.name() + "`");
    return false;
  }

  fs::path source = fs::absolute(target.source());
  fs::path output_dir = fs::absolute(target.output_dir());

  if (!fs::exists(source)) {
    reporter->error("Source file not found: " + source.string());
    return false;
  }

  if (clean && fs::exists(output_dir) &&
      !clean_output(output_dir, source)) {
    return false;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    reporter->error("Could not create " + output_dir.string() + ": " +
                    ec.message());
    return false;
  }

  StringParams params = target.stringparams();
  params[kPublisherParam] = fs::absolute(target.publication()).string();

  fs::path stylesheet =
      target.xsl() ? fs::absolute(*target.xsl()) : stylesheet_for(*format);

  reporter->info("Building target `" + target.name() + "` (" +
                 target.format() + ") into " + output_dir.string());

  bool ok = false;
  switch (*format) {
  case OutputFormat::Html:
    ok = run(xsltproc_command(stylesheet, source, params, {}), output_dir);
    break;
  case OutputFormat::Latex: {
    fs::path tex_file;
    ok = build_latex(source, output_dir, stylesheet, params, tex_file);
    break;
  }
  case OutputFormat::Pdf: {
    fs::path tex_file;
    ok = build_latex(source, output_dir, stylesheet, params, tex_file) &&
         run({tools.pdflatex, "-interaction=nonstopmode",
              tex_file.filename().string()},
             output_dir);
    break;
  }
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::high_resolution_clock::now() - start);

  if (ok) {
    reporter->info("✓ Built `" + target.name() + "` in " +
                   std::to_string(elapsed.count()) + "ms");
  } else {
    reporter->error("Build of `" + target.name() + "` failed");
  }
  return ok;
}

bool XsltBuilder::build_html(const fs::path &source,
                             const fs::path &output_dir,
                             const StringParams &params) {
  fs::path abs_source = fs::absolute(source);
  fs::path abs_output = fs::absolute(output_dir);

  std::error_code ec;
  fs::create_directories(abs_output, ec);
  if (ec) {
    reporter->error("Could not create " + abs_output.string() + ": " +
                    ec.message());
    return false;
  }

  return run(xsltproc_command(stylesheet_for(OutputFormat::Html), abs_source,
                              params, {}),
             abs_output);
}
