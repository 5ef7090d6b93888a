#ifndef PROJECT_HPP
#define PROJECT_HPP

#include "manifest_store.hpp"
#include "target.hpp"
#include "utils/reporter.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class Project {
private:
  fs::path root_;
  bool located;
  ManifestStore manifest_;
  std::vector<Target> targets_;
  Reporter *reporter;

public:
  // root is the directory holding the manifest, or nullopt for a
  // manifest-less project rooted at fallback_root.
  Project(const std::optional<fs::path> &root, ManifestStore manifest,
          const fs::path &fallback_root, Reporter &log);

  // Locate the manifest from start_dir upwards and load it. Throws
  // ManifestError when a manifest is found but cannot be parsed.
  static Project open(const fs::path &start_dir, Reporter &log);

  bool has_manifest() const { return located; }
  const fs::path &root() const { return root_; }
  const ManifestStore &manifest() const { return manifest_; }

  // Targets as written in the manifest, in document order.
  const std::vector<Target> &targets() const { return targets_; }

  // No alias selects the first manifest target. nullopt means "target not
  // found"; it is never replaced by another target. Without a manifest the
  // result is built from the overrides alone.
  std::optional<Target> target(const std::optional<std::string> &alias,
                               const TargetOverrides &overrides = {}) const;

  // Like target(), but only targets written in the manifest count: without
  // a manifest there is nothing to preview and the result is nullopt.
  std::optional<Target>
  manifest_target(const std::optional<std::string> &alias) const;
};

#endif
