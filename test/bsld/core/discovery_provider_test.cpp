#include "bsld/core/discovery_provider.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/file_fixture.hpp"
#include "bsld/utils/path_utils.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bsld::BsldConfigFile;
using bsld::DiscoveryProvider;
using bsld::test::FileTestFixture;

namespace {

auto RelativeNames(
    const std::vector<bsld::CanonicalPath>& files,
    const bsld::CanonicalPath& root) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& file : files) {
    names.push_back(file.RelativeTo(root));
  }
  return names;
}

}  // namespace

TEST_CASE(
    "DiscoveryProvider scans the whole workspace by default", "[discovery]") {
  FileTestFixture fixture("bsld_discovery_default");
  fixture.CreateFile("CommonModules/Utils/Ext/Module.bsl", "");
  fixture.CreateFile("Catalogs/Goods/Ext/ManagerModule.bsl", "");
  fixture.CreateFile("scripts/build.os", "");
  fixture.CreateFile("Catalogs/Goods.xml", "");
  fixture.CreateFile("README.md", "");

  auto files = DiscoveryProvider().DiscoverFiles(
      fixture.GetTempDir(), BsldConfigFile::CreateDefault());

  CHECK(
      RelativeNames(files, fixture.GetTempDir()) ==
      std::vector<std::string>{
          "Catalogs/Goods/Ext/ManagerModule.bsl",
          "CommonModules/Utils/Ext/Module.bsl", "scripts/build.os"});
}

TEST_CASE(
    "DiscoveryProvider honors source dirs and path filters", "[discovery]") {
  FileTestFixture fixture("bsld_discovery_config");
  fixture.CreateFile("src/CommonModules/Utils/Ext/Module.bsl", "");
  fixture.CreateFile("src/vendor/Lib/Ext/Module.bsl", "");
  fixture.CreateFile("tests/Test.bsl", "");
  auto config_path = fixture.CreateFile(
      ".bsld", "SourceDirs: [src, src/CommonModules, missing]\n"
               "If:\n  PathExclude: .*/vendor/.*\n");
  auto config = BsldConfigFile::LoadFromFile(config_path);
  REQUIRE(config.has_value());

  auto files = DiscoveryProvider().DiscoverFiles(fixture.GetTempDir(), *config);

  CHECK(
      RelativeNames(files, fixture.GetTempDir()) ==
      std::vector<std::string>{"src/CommonModules/Utils/Ext/Module.bsl"});
}
