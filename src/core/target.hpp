#ifndef TARGET_HPP
#define TARGET_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <tinyxml2.h>
#include <unordered_map>

namespace fs = std::filesystem;

using StringParams = std::unordered_map<std::string, std::string>;

enum class OutputFormat { Html, Latex, Pdf };

inline std::optional<OutputFormat> parse_format(const std::string &name) {
  if (name == "html")
    return OutputFormat::Html;
  if (name == "latex")
    return OutputFormat::Latex;
  if (name == "pdf")
    return OutputFormat::Pdf;
  return std::nullopt;
}

// Values given on the command line. nullopt means "not provided"; an
// engaged empty string is an explicit empty value and still wins.
struct TargetOverrides {
  std::optional<std::string> format;
  std::optional<fs::path> source;
  std::optional<fs::path> output_dir;
  std::optional<fs::path> publication;
  std::optional<fs::path> xsl;
  StringParams stringparams;
};

// One fully resolved build configuration. Only TargetResolver creates
// these; everything else sees them through const accessors.
class Target {
private:
  std::string name_;
  std::string format_;
  fs::path source_;
  fs::path output_dir_;
  fs::path publication_;
  std::optional<fs::path> xsl_;
  StringParams stringparams_;
  std::shared_ptr<const tinyxml2::XMLDocument> xml_;

  friend class TargetResolver;

  Target() = default;

public:
  const std::string &name() const { return name_; }
  const std::string &format() const { return format_; }
  std::optional<OutputFormat> output_format() const {
    return parse_format(format_);
  }
  const fs::path &source() const { return source_; }
  const fs::path &output_dir() const { return output_dir_; }
  const fs::path &publication() const { return publication_; }
  const std::optional<fs::path> &xsl() const { return xsl_; }
  const StringParams &stringparams() const { return stringparams_; }

  // Copy of the manifest <target> element for fields not modeled above.
  // Null for targets built purely from command-line values.
  const tinyxml2::XMLElement *xml_element() const {
    return xml_ ? xml_->RootElement() : nullptr;
  }
};

#endif
