#ifndef XSLT_BUILDER_HPP
#define XSLT_BUILDER_HPP

#include "builder.hpp"
#include "utils/reporter.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

inline constexpr const char *kPublisherParam = "publisher";

struct BuildTools {
  std::string xsltproc = "xsltproc";
  std::string pdflatex = "pdflatex";
  fs::path xsl_dir = "/usr/share/pretext/xsl";
  // Never removed by a clean build.
  fs::path project_root;
};

// Drives the PreTeXt stylesheets through xsltproc.
class XsltBuilder : public Builder {
private:
  BuildTools tools;
  Reporter *reporter;

  bool run(const std::vector<std::string> &argv, const fs::path &cwd);
  bool clean_output(const fs::path &output_dir, const fs::path &source);
  std::vector<std::string> xsltproc_command(const fs::path &stylesheet,
                                            const fs::path &source,
                                            const StringParams &params,
                                            const fs::path &output) const;

  bool build_latex(const fs::path &source, const fs::path &output_dir,
                   const fs::path &stylesheet, const StringParams &params,
                   fs::path &tex_file);

public:
  XsltBuilder(BuildTools build_tools, Reporter &log);

  bool build(const Target &target, bool clean) override;

  bool build_html(const fs::path &source, const fs::path &output_dir,
                  const StringParams &params) override;

  fs::path stylesheet_for(OutputFormat format) const;
};

#endif
