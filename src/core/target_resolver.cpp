#include "target_resolver.hpp"
#include "manifest_store.hpp"

using tinyxml2::XMLElement;

fs::path TargetResolver::anchor(const std::string &manifest_path) const {
  fs::path path(manifest_path);
  if (path.empty() || path.is_absolute()) {
    return path;
  }
  return project_root / path;
}

static StringParams manifest_stringparams(const XMLElement &node) {
  StringParams params;
  for (const XMLElement *param = node.FirstChildElement("stringparam");
       param != nullptr; param = param->NextSiblingElement("stringparam")) {
    const char *key = param->Attribute("key");
    const char *value = param->Attribute("value");
    if (key == nullptr) {
      continue;
    }
    params[trim(key)] = value ? value : "";
  }
  return params;
}

Target TargetResolver::resolve(const XMLElement &node,
                               const TargetOverrides &overrides) const {
  Target target;

  target.name_ = child_text(node, "alias").value_or("");

  if (overrides.format) {
    target.format_ = *overrides.format;
  } else {
    target.format_ = child_text(node, "format").value_or(kDefaultFormat);
  }

  if (target.name_.empty()) {
    target.name_ = target.format_;
  }

  if (overrides.source) {
    target.source_ = *overrides.source;
  } else if (auto source = child_text(node, "source")) {
    target.source_ = anchor(*source);
  } else {
    target.source_ = project_root / kDefaultSource;
  }

  if (overrides.output_dir) {
    target.output_dir_ = *overrides.output_dir;
  } else if (auto output = child_text(node, "output-dir")) {
    target.output_dir_ = anchor(*output);
  } else {
    target.output_dir_ = project_root / kDefaultOutputRoot / target.name_;
  }

  if (overrides.publication) {
    target.publication_ = *overrides.publication;
  } else if (auto publication = child_text(node, "publication")) {
    target.publication_ = anchor(*publication);
  } else {
    target.publication_ = project_root / kDefaultPublication;
  }

  if (overrides.xsl) {
    target.xsl_ = *overrides.xsl;
  } else if (auto xsl = child_text(node, "xsl")) {
    target.xsl_ = anchor(*xsl);
  }

  target.stringparams_ = manifest_stringparams(node);
  for (const auto &[key, value] : overrides.stringparams) {
    target.stringparams_[key] = value;
  }

  auto doc = std::make_shared<tinyxml2::XMLDocument>();
  doc->InsertEndChild(node.DeepClone(doc.get()));
  target.xml_ = std::move(doc);

  return target;
}

Target TargetResolver::resolve(const TargetOverrides &overrides) const {
  Target target;

  target.format_ = overrides.format.value_or(kDefaultFormat);
  target.name_ = target.format_;
  target.source_ = overrides.source.value_or(project_root / kDefaultSource);
  target.output_dir_ = overrides.output_dir.value_or(
      project_root / kDefaultOutputRoot / target.name_);
  target.publication_ =
      overrides.publication.value_or(project_root / kDefaultPublication);
  target.xsl_ = overrides.xsl;
  target.stringparams_ = overrides.stringparams;

  return target;
}
