#include "bsld/core/bsld_config_file.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/file_fixture.hpp"
#include "bsld/core/config_reader.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bsld::BsldConfigFile;
using bsld::ConfigReader;
using bsld::semantic::ModuleKind;
using bsld::test::FileTestFixture;

namespace {

auto LoadConfig(FileTestFixture& fixture, std::string_view content)
    -> std::optional<BsldConfigFile> {
  auto path = fixture.CreateFile(".bsld", content);
  return BsldConfigFile::LoadFromFile(path);
}

}  // namespace

TEST_CASE("BsldConfigFile loads every section", "[config]") {
  FileTestFixture fixture("bsld_config_sections");
  auto config = LoadConfig(fixture, R"(
SourceDirs: [src, lib]
Modules:
  - Path: forms/formA.bsl
    Ref: DataProcessor.Main.Form.FormA
    Kind: FormModule
  - Path: shared/CommonUtils.bsl
    Ref: CommonModule.CommonUtils
PrivilegedModules: [CommonModule.Privileged]
Diagnostics:
  PrivilegedModuleMethodCall: false
)");

  REQUIRE(config.has_value());
  REQUIRE(config->GetSourceDirs().size() == 2);
  CHECK(config->GetSourceDirs()[0] == "src");
  CHECK(config->GetSourceDirs()[1] == "lib");

  const auto& mappings = config->GetModuleMappings();
  REQUIRE(mappings.size() == 2);
  CHECK(mappings[0].path == "forms/formA.bsl");
  CHECK(mappings[0].module.mdo_ref == "DataProcessor.Main.Form.FormA");
  CHECK(mappings[0].module.kind == ModuleKind::kFormModule);
  CHECK(mappings[1].module.kind == ModuleKind::kCommonModule);

  CHECK(
      config->GetPrivilegedModules() ==
      std::vector<std::string>{"CommonModule.Privileged"});
  CHECK_FALSE(config->IsPrivilegedModuleCallCheckEnabled());
}

TEST_CASE(
    "BsldConfigFile accepts scalars where lists are expected", "[config]") {
  FileTestFixture fixture("bsld_config_scalars");
  auto config = LoadConfig(fixture, R"(
SourceDirs: src
PrivilegedModules: CommonModule.Privileged
)");

  REQUIRE(config.has_value());
  REQUIRE(config->GetSourceDirs().size() == 1);
  CHECK(config->GetPrivilegedModules().size() == 1);
  CHECK(config->IsPrivilegedModuleCallCheckEnabled());
}

TEST_CASE("BsldConfigFile skips invalid module mappings", "[config]") {
  FileTestFixture fixture("bsld_config_mappings");
  auto config = LoadConfig(fixture, R"(
Modules:
  - Path: a.bsl
    Ref: CommonModule.A
    Kind: NotAKind
  - Ref: CommonModule.B
  - Path: c.bsl
    Ref: Catalog.C
    Kind: managermodule
)");

  REQUIRE(config.has_value());
  REQUIRE(config->GetModuleMappings().size() == 1);
  CHECK(config->GetModuleMappings()[0].module.kind == ModuleKind::kManagerModule);
}

TEST_CASE("BsldConfigFile rejects malformed YAML", "[config]") {
  FileTestFixture fixture("bsld_config_malformed");

  CHECK_FALSE(LoadConfig(fixture, "SourceDirs: [src\n"));
  CHECK_FALSE(LoadConfig(
      fixture, "Diagnostics:\n  PrivilegedModuleMethodCall: maybe\n"));
}

TEST_CASE("BsldConfigFile returns nothing for a missing file", "[config]") {
  FileTestFixture fixture("bsld_config_missing");
  CHECK_FALSE(BsldConfigFile::LoadFromFile(fixture.GetTempDir() / ".bsld"));
}

TEST_CASE("BsldConfigFile PathExclude filters matching paths", "[config]") {
  FileTestFixture fixture("bsld_config_exclude");
  auto config = LoadConfig(fixture, R"(
If:
  PathExclude: .*/vendor/.*
)");

  REQUIRE(config.has_value());
  CHECK_FALSE(config->ShouldIncludeFile("src/vendor/Module.bsl"));
  CHECK(config->ShouldIncludeFile("src/CommonModules/Utils/Ext/Module.bsl"));
}

TEST_CASE("BsldConfigFile PathMatch includes only matching paths", "[config]") {
  FileTestFixture fixture("bsld_config_match");
  auto config = LoadConfig(fixture, R"(
If:
  PathMatch:
    - CommonModules/.*
    - Catalogs/.*
  PathExclude: .*/Old/.*
)");

  REQUIRE(config.has_value());
  CHECK(config->ShouldIncludeFile("CommonModules/Utils/Ext/Module.bsl"));
  CHECK(config->ShouldIncludeFile("Catalogs/Goods/Ext/ManagerModule.bsl"));
  CHECK_FALSE(config->ShouldIncludeFile("Documents/Order/Ext/ObjectModule.bsl"));
  CHECK_FALSE(config->ShouldIncludeFile("CommonModules/Old/Ext/Module.bsl"));
}

TEST_CASE(
    "BsldConfigFile includes files when a pattern is invalid", "[config]") {
  FileTestFixture fixture("bsld_config_bad_regex");
  auto config = LoadConfig(fixture, "If:\n  PathExclude: \"[unclosed\"\n");

  REQUIRE(config.has_value());
  CHECK(config->ShouldIncludeFile("anything.bsl"));
}

TEST_CASE("ConfigReader falls back to defaults", "[config]") {
  FileTestFixture fixture("bsld_config_reader");
  ConfigReader reader;

  SECTION("Without a config file") {
    CHECK_FALSE(reader.LoadFromWorkspace(fixture.GetTempDir()));
    auto config = reader.LoadOrDefault(fixture.GetTempDir());
    CHECK(config.GetSourceDirs().empty());
    CHECK(config.GetPrivilegedModules().empty());
    CHECK(config.IsPrivilegedModuleCallCheckEnabled());
  }

  SECTION("With an invalid config file") {
    fixture.CreateFile(".bsld", "SourceDirs: [src\n");
    auto config = reader.LoadOrDefault(fixture.GetTempDir());
    CHECK(config.GetSourceDirs().empty());
  }

  SECTION("With a valid config file") {
    fixture.CreateFile(".bsld", "SourceDirs: [src]\n");
    auto config = reader.LoadOrDefault(fixture.GetTempDir());
    CHECK(config.GetSourceDirs().size() == 1);
  }
}
