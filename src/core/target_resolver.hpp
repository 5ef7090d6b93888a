#ifndef TARGET_RESOLVER_HPP
#define TARGET_RESOLVER_HPP

#include "target.hpp"
#include <filesystem>

namespace fs = std::filesystem;

inline constexpr const char *kDefaultFormat = "html";
inline constexpr const char *kDefaultSource = "source/main.ptx";
inline constexpr const char *kDefaultPublication =
    "publication/publication.ptx";
inline constexpr const char *kDefaultOutputRoot = "output";

// Merges a manifest <target> element with command-line overrides. Relative
// paths read from the manifest are anchored at project_root; override
// paths are taken as given.
class TargetResolver {
private:
  fs::path project_root;

  fs::path anchor(const std::string &manifest_path) const;

public:
  explicit TargetResolver(fs::path root) : project_root(std::move(root)) {}

  Target resolve(const tinyxml2::XMLElement &node,
                 const TargetOverrides &overrides) const;

  // No manifest at all: the format doubles as the target name.
  Target resolve(const TargetOverrides &overrides) const;
};

#endif
