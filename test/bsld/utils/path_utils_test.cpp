#include "bsld/utils/path_utils.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "bsld/utils/canonical_path.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

TEST_CASE("IsBslFile accepts module extensions", "[path_utils]") {
  CHECK(bsld::IsBslFile("CommonModules/Utils/Ext/Module.bsl"));
  CHECK(bsld::IsBslFile("script.os"));
  CHECK(bsld::IsBslFile("LEGACY.BSL"));
  CHECK_FALSE(bsld::IsBslFile("Configuration.xml"));
  CHECK_FALSE(bsld::IsBslFile("Module"));
}

TEST_CASE("URIs and paths convert both ways", "[path_utils]") {
  SECTION("Plain path") {
    CHECK(bsld::PathToUri("/ws/src/Module.bsl") == "file:///ws/src/Module.bsl");
    CHECK(
        bsld::UriToPath("file:///ws/src/Module.bsl") ==
        std::filesystem::path("/ws/src/Module.bsl"));
  }

  SECTION("Spaces and Cyrillic are percent-encoded") {
    auto uri = bsld::PathToUri("/ws/Общие модули/Модуль.bsl");
    CHECK(uri.starts_with("file:///ws/%D0%9E%D0%B1"));
    CHECK(uri.find(' ') == std::string::npos);
    CHECK(
        bsld::UriToPath(uri) ==
        std::filesystem::path("/ws/Общие модули/Модуль.bsl"));
  }

  SECTION("Non-file URIs pass through") {
    CHECK(bsld::NormalizeUri("untitled:Untitled-1") == "untitled:Untitled-1");
  }

  SECTION("Equivalent URIs normalize to one form") {
    CHECK(
        bsld::NormalizeUri("file:///ws/src/../src/%4Dodule.bsl") ==
        "file:///ws/src/Module.bsl");
  }
}

TEST_CASE("RelativeGenericPath uses forward slashes", "[path_utils]") {
  CHECK(
      bsld::RelativeGenericPath(
          "/ws/CommonModules/Utils/Ext/Module.bsl", "/ws") ==
      "CommonModules/Utils/Ext/Module.bsl");
}

TEST_CASE("CanonicalPath checks containment by component", "[path_utils]") {
  auto root = bsld::CanonicalPath(std::filesystem::path("/ws/project"));

  CHECK(bsld::CanonicalPath(std::filesystem::path("/ws/project/src/a.bsl"))
            .IsSubPathOf(root));
  CHECK_FALSE(
      bsld::CanonicalPath(std::filesystem::path("/ws/project2/a.bsl"))
          .IsSubPathOf(root));
  CHECK(root.ToUri() == "file:///ws/project");
  CHECK_FALSE(root.IsSubPathOf(bsld::CanonicalPath()));
}

TEST_CASE("CanonicalPath gives workspace-relative names", "[path_utils]") {
  auto root = bsld::CanonicalPath(std::filesystem::path("/ws"));
  auto module = root / "CommonModules/Utils/Ext/../Ext/Module.bsl";

  CHECK(module.RelativeTo(root) == "CommonModules/Utils/Ext/Module.bsl");
  CHECK(fmt::format("{}", module) == "/ws/CommonModules/Utils/Ext/Module.bsl");
  CHECK(root < module);
  CHECK(module == bsld::CanonicalPath::FromUri(module.ToUri()));
}
