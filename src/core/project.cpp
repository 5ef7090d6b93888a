#include "project.hpp"
#include "manifest_locator.hpp"
#include "target_resolver.hpp"

Project::Project(const std::optional<fs::path> &root, ManifestStore manifest,
                 const fs::path &fallback_root, Reporter &log)
    : root_(root.value_or(fallback_root)), located(root.has_value()),
      manifest_(std::move(manifest)), reporter(&log) {
  TargetResolver resolver(root_);
  for (const auto *element : manifest_.target_elements()) {
    targets_.push_back(resolver.resolve(*element, TargetOverrides{}));
  }
}

Project Project::open(const fs::path &start_dir, Reporter &log) {
  std::optional<fs::path> root = locate_project_root(start_dir);
  ManifestStore manifest = ManifestStore::load(root, log);
  return Project(root, std::move(manifest), fs::absolute(start_dir), log);
}

std::optional<Target>
Project::target(const std::optional<std::string> &alias,
                const TargetOverrides &overrides) const {
  TargetResolver resolver(root_);

  if (!located) {
    return resolver.resolve(overrides);
  }

  auto element = manifest_.target_element(alias);
  if (!element) {
    if (!alias) {
      reporter->info("Project manifest defines no targets.");
    }
    return std::nullopt;
  }

  return resolver.resolve(**element, overrides);
}

std::optional<Target>
Project::manifest_target(const std::optional<std::string> &alias) const {
  if (!located) {
    return std::nullopt;
  }
  return target(alias);
}
