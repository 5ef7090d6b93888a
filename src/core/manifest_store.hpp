#ifndef MANIFEST_STORE_HPP
#define MANIFEST_STORE_HPP

#include "utils/reporter.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <tinyxml2.h>
#include <vector>

namespace fs = std::filesystem;

// The manifest exists but cannot be used. Fatal for the whole invocation.
class ManifestError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

std::string trim(const std::string &text);

// Trimmed text of the named child element, if the child exists.
std::optional<std::string> child_text(const tinyxml2::XMLElement &parent,
                                      const char *name);

class ManifestStore {
private:
  std::unique_ptr<tinyxml2::XMLDocument> document;
  std::optional<fs::path> manifest_path;
  Reporter *reporter;

  ManifestStore(std::unique_ptr<tinyxml2::XMLDocument> doc,
                std::optional<fs::path> path, Reporter &log);

  const tinyxml2::XMLElement *root_element() const;

public:
  // Without a root the store holds an empty <project/>, so callers have a
  // single code path for "no manifest".
  static ManifestStore load(const std::optional<fs::path> &root,
                            Reporter &log);

  // Parse manifest text directly. source names the text in error messages.
  static ManifestStore parse(const std::string &xml, const std::string &source,
                             Reporter &log);

  ManifestStore(ManifestStore &&) noexcept = default;
  ManifestStore &operator=(ManifestStore &&) noexcept = default;

  bool has_manifest() const { return manifest_path.has_value(); }
  const std::optional<fs::path> &path() const { return manifest_path; }

  std::optional<const tinyxml2::XMLElement *>
  target_element(const std::optional<std::string> &alias) const;

  std::vector<const tinyxml2::XMLElement *> target_elements() const;

  // path is a '/'-separated element path below <project>, e.g.
  // "executables/xsltproc".
  std::string scalar(const std::string &path,
                     const std::string &default_value) const;

  std::string to_string() const;
};

#endif
