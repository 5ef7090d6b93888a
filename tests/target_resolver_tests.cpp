#include "core/manifest_locator.hpp"
#include "core/manifest_store.hpp"
#include "core/project.hpp"
#include "core/target_resolver.hpp"
#include "test_helpers.hpp"
#include <doctest/doctest.h>

namespace {

const char *kManifest = R"(<project>
  <targets>
    <target>
      <alias>web</alias>
      <format>html</format>
      <source>main.ptx</source>
      <output-dir>out/web</output-dir>
      <publication>pub/web.ptx</publication>
      <stringparam key="a" value="1"/>
      <stringparam key="b" value="2"/>
      <deploy-dir>site</deploy-dir>
    </target>
    <target>
      <alias>bare</alias>
    </target>
  </targets>
</project>
)";

const tinyxml2::XMLElement &element(const ManifestStore &store,
                                    const std::string &alias) {
  auto found = store.target_element(alias);
  REQUIRE(found.has_value());
  return **found;
}

} // namespace

TEST_CASE("TargetResolver reads manifest fields") {
  MemoryReporter log;
  auto store = ManifestStore::parse(kManifest, "project.ptx", log);
  TargetResolver resolver("/proj");

  Target target = resolver.resolve(element(store, "web"), {});

  CHECK(target.name() == "web");
  CHECK(target.format() == "html");
  CHECK(target.output_format() == OutputFormat::Html);
  CHECK(target.source() == std::filesystem::path("/proj/main.ptx"));
  CHECK(target.output_dir() == std::filesystem::path("/proj/out/web"));
  CHECK(target.publication() == std::filesystem::path("/proj/pub/web.ptx"));
  CHECK_FALSE(target.xsl().has_value());
  CHECK(target.stringparams() == StringParams{{"a", "1"}, {"b", "2"}});

  SUBCASE("unmodeled fields stay reachable through the raw element") {
    REQUIRE(target.xml_element() != nullptr);
    CHECK(*child_text(*target.xml_element(), "deploy-dir") == "site");
  }
}

TEST_CASE("TargetResolver fills defaults for missing children") {
  MemoryReporter log;
  auto store = ManifestStore::parse(kManifest, "project.ptx", log);
  TargetResolver resolver("/proj");

  Target target = resolver.resolve(element(store, "bare"), {});

  CHECK(target.format() == "html");
  CHECK(target.source() == std::filesystem::path("/proj/source/main.ptx"));
  CHECK(target.output_dir() == std::filesystem::path("/proj/output/bare"));
  CHECK(target.publication() ==
        std::filesystem::path("/proj/publication/publication.ptx"));
  CHECK(target.stringparams().empty());
}

TEST_CASE("Overrides win only for the fields they supply") {
  MemoryReporter log;
  auto store = ManifestStore::parse(kManifest, "project.ptx", log);
  TargetResolver resolver("/proj");

  TargetOverrides overrides;
  overrides.format = "pdf";

  Target target = resolver.resolve(element(store, "web"), overrides);

  CHECK(target.format() == "pdf");
  CHECK(target.output_format() == OutputFormat::Pdf);
  CHECK(target.source() == std::filesystem::path("/proj/main.ptx"));
  CHECK(target.output_dir() == std::filesystem::path("/proj/out/web"));
  CHECK(target.name() == "web");
}

TEST_CASE("An explicitly empty override is not the same as no override") {
  MemoryReporter log;
  auto store = ManifestStore::parse(kManifest, "project.ptx", log);
  TargetResolver resolver("/proj");

  TargetOverrides overrides;
  overrides.output_dir = std::filesystem::path();

  Target target = resolver.resolve(element(store, "web"), overrides);
  CHECK(target.output_dir().empty());
  CHECK(target.source() == std::filesystem::path("/proj/main.ptx"));
}

TEST_CASE("String parameters merge key by key") {
  MemoryReporter log;
  auto store = ManifestStore::parse(kManifest, "project.ptx", log);
  TargetResolver resolver("/proj");

  TargetOverrides overrides;
  overrides.stringparams = {{"b", "3"}, {"c", "4"}};

  Target target = resolver.resolve(element(store, "web"), overrides);
  CHECK(target.stringparams() ==
        StringParams{{"a", "1"}, {"b", "3"}, {"c", "4"}});
}

TEST_CASE("Command-line only targets are named after their format") {
  TargetResolver resolver("/work");

  SUBCASE("format given") {
    TargetOverrides overrides;
    overrides.format = "latex";
    overrides.source = std::filesystem::path("/work/doc.ptx");

    Target target = resolver.resolve(overrides);
    CHECK(target.name() == "latex");
    CHECK(target.format() == "latex");
    CHECK(target.source() == std::filesystem::path("/work/doc.ptx"));
    CHECK(target.output_dir() == std::filesystem::path("/work/output/latex"));
    CHECK(target.xml_element() == nullptr);
  }

  SUBCASE("nothing given") {
    Target target = resolver.resolve(TargetOverrides{});
    CHECK(target.name() == "html");
    CHECK(target.format() == "html");
  }
}

TEST_CASE("Project target lookup") {
  TempTestDir temp_dir;
  write_file(temp_dir.path / kManifestFilename, kManifest);
  auto nested = temp_dir.path / "source" / "chapters";
  std::filesystem::create_directories(nested);
  MemoryReporter log;

  Project project = Project::open(nested, log);
  REQUIRE(project.has_manifest());
  CHECK(project.root() == temp_dir.path);

  SUBCASE("targets are listed in manifest order") {
    REQUIRE(project.targets().size() == 2);
    CHECK(project.targets()[0].name() == "web");
    CHECK(project.targets()[1].name() == "bare");
  }

  SUBCASE("no alias gives the first target") {
    auto target = project.target(std::nullopt);
    REQUIRE(target.has_value());
    CHECK(target->name() == "web");
    CHECK(target->source() == temp_dir.path / "main.ptx");
  }

  SUBCASE("missing alias is not found, never a default") {
    CHECK_FALSE(project.target(std::string("nope")).has_value());
  }

  SUBCASE("manifest targets are found for preview") {
    auto target = project.manifest_target(std::string("bare"));
    REQUIRE(target.has_value());
    CHECK(target->name() == "bare");
    CHECK_FALSE(project.manifest_target(std::string("nope")).has_value());
  }

  SUBCASE("overrides apply to the looked-up target") {
    TargetOverrides overrides;
    overrides.format = "latex";
    auto target = project.target(std::string("bare"), overrides);
    REQUIRE(target.has_value());
    CHECK(target->name() == "bare");
    CHECK(target->format() == "latex");
  }
}

TEST_CASE("Project with an empty target list has no default target") {
  TempTestDir temp_dir;
  write_file(temp_dir.path / kManifestFilename, "<project><targets/></project>");
  MemoryReporter log;

  Project project = Project::open(temp_dir.path, log);
  CHECK(project.has_manifest());
  CHECK_FALSE(project.target(std::nullopt).has_value());
}

TEST_CASE("Project without a manifest builds from overrides") {
  TempTestDir temp_dir;
  MemoryReporter log;

  Project project = Project::open(temp_dir.path, log);
  CHECK_FALSE(project.has_manifest());
  CHECK(project.targets().empty());

  TargetOverrides overrides;
  overrides.format = "pdf";
  auto target = project.target(std::nullopt, overrides);
  REQUIRE(target.has_value());
  CHECK(target->name() == "pdf");
  CHECK(target->output_dir() == temp_dir.path / "output" / "pdf");
}

TEST_CASE("Project without a manifest has nothing to preview") {
  TempTestDir temp_dir;
  MemoryReporter log;

  Project project = Project::open(temp_dir.path, log);
  REQUIRE_FALSE(project.has_manifest());

  CHECK_FALSE(project.manifest_target(std::nullopt).has_value());
  CHECK_FALSE(project.manifest_target(std::string("html")).has_value());
}
