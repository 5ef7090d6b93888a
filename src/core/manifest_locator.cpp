#include "manifest_locator.hpp"
#include <system_error>

std::optional<fs::path> locate_project_root(const fs::path &start_dir) {
  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    current = start_dir;
  }
  current = current.lexically_normal();

  // "a/b/" normalizes to "a/b/" with an empty filename; drop it so that
  // parent_path() moves up a level.
  if (!current.has_filename() && current != current.root_path()) {
    current = current.parent_path();
  }

  while (true) {
    if (fs::is_regular_file(current / kManifestFilename, ec)) {
      return current;
    }

    fs::path parent = current.parent_path();
    if (parent == current || parent.empty()) {
      return std::nullopt;
    }
    current = parent;
  }
}
