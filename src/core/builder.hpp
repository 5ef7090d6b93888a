#ifndef BUILDER_HPP
#define BUILDER_HPP

#include "target.hpp"
#include <filesystem>

namespace fs = std::filesystem;

// The document-conversion engine. folio only drives it and reads back
// success or failure.
class Builder {
public:
  virtual ~Builder() = default;

  // One-shot build of a resolved target. clean empties the output
  // directory first.
  virtual bool build(const Target &target, bool clean) = 0;

  // HTML rebuild used by the watcher.
  virtual bool build_html(const fs::path &source, const fs::path &output_dir,
                          const StringParams &params) = 0;
};

#endif
