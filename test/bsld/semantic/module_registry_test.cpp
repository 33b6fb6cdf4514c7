#include "bsld/semantic/module_registry.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "../common/index_fixture.hpp"
#include "bsld/semantic/reference_resolver.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bsld::semantic::ModuleId;
using bsld::semantic::ModuleKind;
using bsld::semantic::ReferenceResolver;
using bsld::semantic::SymbolIdentity;
using bsld::test::CommonModule;
using bsld::test::IndexFixture;

namespace {

constexpr auto kUtilsUri = "file:///ws/CommonModules/Utils/Ext/Module.bsl";
constexpr auto kUtilsSource =
    "Procedure DoWork() Export\nEndProcedure\n\n"
    "Procedure Helper()\n  X = 1;\nEndProcedure\n";

}  // namespace

TEST_CASE("ModuleRegistry resolves loaded modules only", "[module_registry]") {
  IndexFixture fixture;
  const auto& registry = *fixture.Registry();

  fixture.Register(kUtilsUri, CommonModule("Utils"));
  CHECK(registry.GetModuleUri(CommonModule("Utils")) == kUtilsUri);
  CHECK(registry.Resolve("CommonModule.Utils", ModuleKind::kCommonModule) ==
        nullptr);

  fixture.Load(kUtilsUri, CommonModule("Utils"), kUtilsSource, 3);
  auto document =
      registry.Resolve("CommonModule.Utils", ModuleKind::kCommonModule);
  REQUIRE(document);
  CHECK(document->Uri() == kUtilsUri);
  CHECK(document->Version() == 3);
  CHECK(document->Content() == kUtilsSource);
  CHECK(registry.GetDocument(kUtilsUri) == document);

  CHECK(registry.Resolve("CommonModule.Utils", ModuleKind::kManagerModule) ==
        nullptr);
}

TEST_CASE(
    "ModuleRegistry finds common modules by short name", "[module_registry]") {
  IndexFixture fixture;
  fixture.Register(kUtilsUri, CommonModule("Utils"));
  fixture.Register(
      "file:///ws/Catalogs/Goods/Ext/ManagerModule.bsl",
      ModuleId{.mdo_ref = "Catalog.Goods", .kind = ModuleKind::kManagerModule});
  const auto& registry = *fixture.Registry();

  auto found = registry.FindCommonModule("utils");
  REQUIRE(found);
  CHECK(*found == CommonModule("Utils"));

  CHECK_FALSE(registry.FindCommonModule("Goods"));
  CHECK_FALSE(registry.FindCommonModule("Missing"));
  CHECK(registry.GetModuleCount() == 2);
}

TEST_CASE(
    "ModuleRegistry keeps layout registrations on unload", "[module_registry]") {
  IndexFixture fixture;
  fixture.Load(kUtilsUri, CommonModule("Utils"), kUtilsSource);
  auto& registry = *fixture.Registry();

  registry.Unload(kUtilsUri);

  CHECK(registry.GetDocument(kUtilsUri) == nullptr);
  CHECK(registry.GetModuleUri(CommonModule("Utils")) == kUtilsUri);
  CHECK(registry.FindCommonModule("Utils"));
  CHECK(registry.GetLoadedDocuments().empty());
}

TEST_CASE(
    "ModuleRegistry forgets unregistered documents on unload", "[module_registry]") {
  IndexFixture fixture;
  auto& registry = *fixture.Registry();

  auto result = bsld::services::DocumentAnalyzer(fixture.Registry())
                    .Analyze("untitled:1", CommonModule("Scratch"), "", 1);
  registry.Load(result.document);
  REQUIRE(registry.FindCommonModule("Scratch"));

  registry.Unload("untitled:1");

  CHECK_FALSE(registry.GetModuleUri(CommonModule("Scratch")));
  CHECK_FALSE(registry.GetModuleForUri("untitled:1"));
  CHECK_FALSE(registry.FindCommonModule("Scratch"));
}

TEST_CASE(
    "ModuleRegistry replaces the document of a reloaded URI", "[module_registry]") {
  IndexFixture fixture;
  fixture.Load(kUtilsUri, CommonModule("Utils"), kUtilsSource, 1);
  fixture.Load(kUtilsUri, CommonModule("Utils"), "", 2);

  auto document = fixture.Registry()->GetDocument(kUtilsUri);
  REQUIRE(document);
  CHECK(document->Version() == 2);
  CHECK(document->Tree().GetMethods().empty());
  CHECK(fixture.Registry()->GetLoadedDocuments().size() == 1);
}

TEST_CASE(
    "ReferenceResolver resolves identities to live symbols", "[module_registry]") {
  IndexFixture fixture;
  fixture.Load(kUtilsUri, CommonModule("Utils"), kUtilsSource);
  ReferenceResolver resolver(fixture.Registry());

  auto method = resolver.ResolveSymbol(
      SymbolIdentity(CommonModule("Utils"), "DOWORK"));
  REQUIRE(method);
  CHECK(method->name == "DoWork");
  CHECK(method->is_export);

  CHECK_FALSE(resolver.ResolveSymbol(
      SymbolIdentity(CommonModule("Utils"), "Missing")));
  CHECK_FALSE(resolver.ResolveSymbol(
      SymbolIdentity(CommonModule("Other"), "DoWork")));

  SECTION("Resolved symbols keep their document alive") {
    fixture.Registry()->Unload(kUtilsUri);
    CHECK(method->name == "DoWork");
    CHECK_FALSE(resolver.ResolveSymbol(
        SymbolIdentity(CommonModule("Utils"), "DoWork")));
  }
}

TEST_CASE(
    "ReferenceResolver finds the enclosing method of a site", "[module_registry]") {
  IndexFixture fixture;
  fixture.Load(kUtilsUri, CommonModule("Utils"), kUtilsSource);
  ReferenceResolver resolver(fixture.Registry());

  auto from = resolver.FindFromSymbol(kUtilsUri, {.line = 4, .character = 2});
  REQUIRE(from);
  CHECK(from->name == "Helper");

  auto module = resolver.FindFromSymbol(kUtilsUri, {.line = 2, .character = 0});
  REQUIRE(module);
  CHECK(module->kind == lsp::SymbolKind::Module);

  CHECK_FALSE(resolver.FindFromSymbol("file:///other.bsl", {}));
}
