#ifndef MANIFEST_LOCATOR_HPP
#define MANIFEST_LOCATOR_HPP

#include <filesystem>
#include <optional>

namespace fs = std::filesystem;

inline constexpr const char *kManifestFilename = "project.ptx";

// Walk up from start_dir to the first directory holding a manifest.
// Returns nullopt once the filesystem root has been checked.
std::optional<fs::path> locate_project_root(const fs::path &start_dir);

#endif
