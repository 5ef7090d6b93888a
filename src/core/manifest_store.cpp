#include "manifest_store.hpp"
#include "manifest_locator.hpp"
#include <sstream>

using tinyxml2::XMLDocument;
using tinyxml2::XMLElement;

std::string trim(const std::string &text) {
  const char *whitespace = " \t\r\n";
  size_t start = text.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(whitespace);
  return text.substr(start, end - start + 1);
}

std::optional<std::string> child_text(const XMLElement &parent,
                                      const char *name) {
  const XMLElement *child = parent.FirstChildElement(name);
  if (child == nullptr) {
    return std::nullopt;
  }
  const char *text = child->GetText();
  return trim(text ? text : "");
}

ManifestStore::ManifestStore(std::unique_ptr<XMLDocument> doc,
                             std::optional<fs::path> path, Reporter &log)
    : document(std::move(doc)), manifest_path(std::move(path)),
      reporter(&log) {}

static void check_document(const XMLDocument &doc, const std::string &source) {
  if (doc.Error()) {
    std::ostringstream msg;
    msg << "Malformed manifest " << source << " (line " << doc.ErrorLineNum()
        << "): " << doc.ErrorStr();
    throw ManifestError(msg.str());
  }

  const XMLElement *root = doc.RootElement();
  if (root == nullptr || std::string(root->Name()) != "project") {
    throw ManifestError("Malformed manifest " + source +
                        ": root element must be <project>");
  }
}

ManifestStore ManifestStore::load(const std::optional<fs::path> &root,
                                  Reporter &log) {
  auto doc = std::make_unique<XMLDocument>();

  if (!root) {
    doc->InsertEndChild(doc->NewElement("project"));
    return ManifestStore(std::move(doc), std::nullopt, log);
  }

  fs::path file = *root / kManifestFilename;
  doc->LoadFile(file.string().c_str());
  check_document(*doc, file.string());

  log.debug("Loaded project manifest " + file.string());
  return ManifestStore(std::move(doc), file, log);
}

ManifestStore ManifestStore::parse(const std::string &xml,
                                   const std::string &source, Reporter &log) {
  auto doc = std::make_unique<XMLDocument>();
  doc->Parse(xml.c_str(), xml.size());
  check_document(*doc, source);
  return ManifestStore(std::move(doc), fs::path(source), log);
}

const XMLElement *ManifestStore::root_element() const {
  return document->RootElement();
}

std::vector<const XMLElement *> ManifestStore::target_elements() const {
  std::vector<const XMLElement *> result;
  const XMLElement *targets = root_element()->FirstChildElement("targets");
  if (targets == nullptr) {
    return result;
  }
  for (const XMLElement *target = targets->FirstChildElement("target");
       target != nullptr; target = target->NextSiblingElement("target")) {
    result.push_back(target);
  }
  return result;
}

std::optional<const XMLElement *>
ManifestStore::target_element(const std::optional<std::string> &alias) const {
  auto targets = target_elements();

  if (!alias) {
    if (targets.empty()) {
      return std::nullopt;
    }
    return targets.front();
  }

  for (const XMLElement *target : targets) {
    auto name = child_text(*target, "alias");
    if (name && *name == *alias) {
      return target;
    }
  }

  reporter->info("No targets with alias `" + *alias +
                 "` found in project manifest " + kManifestFilename + ".");
  return std::nullopt;
}

std::string ManifestStore::scalar(const std::string &path,
                                  const std::string &default_value) const {
  const XMLElement *node = root_element();

  std::istringstream parts(path);
  std::string part;
  while (node != nullptr && std::getline(parts, part, '/')) {
    if (part.empty()) {
      continue;
    }
    node = node->FirstChildElement(part.c_str());
  }

  if (node == nullptr) {
    return default_value;
  }
  const char *text = node->GetText();
  return trim(text ? text : "");
}

std::string ManifestStore::to_string() const {
  tinyxml2::XMLPrinter printer;
  document->Print(&printer);
  return std::string(printer.CStr(), printer.CStrSize() > 0
                                         ? printer.CStrSize() - 1
                                         : 0);
}
