#include "bsld/syntax/symbol_tree_builder.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "bsld/syntax/lexer.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bsld::semantic::ModuleId;
using bsld::semantic::ModuleKind;
using bsld::semantic::SymbolTree;
using bsld::syntax::Lexer;
using bsld::syntax::SymbolTreeBuilder;

namespace {

const ModuleId kModule{
    .mdo_ref = "CommonModule.Utils", .kind = ModuleKind::kCommonModule};

auto BuildTree(std::string_view source) -> SymbolTree {
  auto tokens = Lexer(source).Tokenize();
  return SymbolTreeBuilder(kModule).Build(tokens);
}

auto MakePosition(int line, int character) -> lsp::Position {
  return lsp::Position{.line = line, .character = character};
}

constexpr auto kSource = R"(#Region Public

&AtServer
Procedure DoWork(Val First, Second = 1) Export
  Result = Catalogs.Products.GetDefault();
EndProcedure

#EndRegion

Var Counter Export, Hidden;

Function Compute()
  Return 1;
EndFunction

Процедура Обработать()
КонецПроцедуры
)";

}  // namespace

TEST_CASE("SymbolTreeBuilder creates the module symbol", "[symbol_tree]") {
  auto tree = BuildTree(kSource);
  const auto& module = tree.GetModule();

  CHECK(module.name == "CommonModule.Utils");
  CHECK(module.kind == lsp::SymbolKind::Module);
  CHECK(module.owner == kModule);
  CHECK(module.range.start == MakePosition(0, 0));
  CHECK(module.range.end == MakePosition(17, 0));
}

TEST_CASE("SymbolTreeBuilder extracts methods", "[symbol_tree]") {
  auto tree = BuildTree(kSource);

  auto methods = tree.GetMethods();
  REQUIRE(methods.size() == 3);
  CHECK(methods[0]->name == "DoWork");
  CHECK(methods[1]->name == "Compute");
  CHECK(methods[2]->name == "Обработать");

  const auto& do_work = *methods[0];
  CHECK(do_work.kind == lsp::SymbolKind::Method);
  CHECK(do_work.is_export);
  CHECK_FALSE(do_work.is_function);
  CHECK(do_work.parameters == std::vector<std::string>{"First", "Second"});
  CHECK(do_work.directives == std::vector<std::string>{"&AtServer"});
  CHECK(do_work.range.start == MakePosition(3, 0));
  CHECK(do_work.range.end == MakePosition(5, 12));
  CHECK(do_work.selection_range.start == MakePosition(3, 10));
  CHECK(do_work.selection_range.end == MakePosition(3, 16));

  const auto& compute = *methods[1];
  CHECK(compute.is_function);
  CHECK_FALSE(compute.is_export);
  CHECK(compute.parameters.empty());
  CHECK(compute.directives.empty());
  CHECK(compute.range.end == MakePosition(13, 11));

  CHECK(methods[2]->range.end == MakePosition(16, 14));
}

TEST_CASE("SymbolTreeBuilder nests methods under regions", "[symbol_tree]") {
  auto tree = BuildTree(kSource);
  const auto& module = tree.GetModule();

  REQUIRE(module.children.size() == 5);
  const auto& region = *module.children[0];
  CHECK(region.kind == lsp::SymbolKind::Namespace);
  CHECK(region.name == "Public");
  CHECK(region.range.start == MakePosition(0, 0));
  CHECK(region.range.end == MakePosition(7, 10));

  REQUIRE(region.children.size() == 1);
  CHECK(region.children[0]->name == "DoWork");
  CHECK(region.children[0]->parent == &region);

  auto flat = tree.GetChildrenFlat();
  REQUIRE(flat.size() == 6);
  CHECK(flat[0]->name == "Public");
  CHECK(flat[1]->name == "DoWork");
  CHECK(flat[2]->name == "Counter");
}

TEST_CASE("SymbolTreeBuilder extracts module variables", "[symbol_tree]") {
  auto tree = BuildTree(kSource);
  auto flat = tree.GetChildrenFlat();
  REQUIRE(flat.size() == 6);

  CHECK(flat[2]->kind == lsp::SymbolKind::Variable);
  CHECK(flat[2]->is_export);
  CHECK(flat[3]->name == "Hidden");
  CHECK(flat[3]->kind == lsp::SymbolKind::Variable);
  CHECK_FALSE(flat[3]->is_export);
}

TEST_CASE("SymbolTree finds methods case-insensitively", "[symbol_tree]") {
  auto tree = BuildTree(kSource);

  const auto* do_work = tree.GetMethodSymbol("dowork");
  REQUIRE(do_work != nullptr);
  CHECK(do_work->name == "DoWork");

  const auto* cyrillic = tree.GetMethodSymbol("ОБРАБОТАТЬ");
  REQUIRE(cyrillic != nullptr);
  CHECK(cyrillic->name == "Обработать");

  CHECK(tree.GetMethodSymbol("Counter") == nullptr);
  CHECK(tree.GetMethodSymbol("Public") == nullptr);
}

TEST_CASE("SymbolTree finds the enclosing symbol", "[symbol_tree]") {
  auto tree = BuildTree(kSource);

  CHECK(tree.FindEnclosingSymbol(MakePosition(4, 5)).name == "DoWork");
  CHECK(tree.FindEnclosingSymbol(MakePosition(12, 2)).name == "Compute");

  // Regions and variables are never reported
  CHECK(tree.FindEnclosingSymbol(MakePosition(1, 0)).name == "CommonModule.Utils");
  CHECK(tree.FindEnclosingSymbol(MakePosition(9, 5)).name == "CommonModule.Utils");
}

TEST_CASE("SymbolTree finds declarations by name token", "[symbol_tree]") {
  auto tree = BuildTree(kSource);

  const auto* declared = tree.FindDeclarationAt(MakePosition(3, 12));
  REQUIRE(declared != nullptr);
  CHECK(declared->name == "DoWork");

  CHECK(tree.FindDeclarationAt(MakePosition(3, 2)) == nullptr);
  CHECK(tree.FindDeclarationAt(MakePosition(3, 16)) == nullptr);
}

TEST_CASE("SymbolTreeBuilder recovers from malformed input", "[symbol_tree]") {
  SECTION("Unterminated method extends to the end of the document") {
    auto tree = BuildTree("Procedure Broken()\n  X = 1;\n");
    auto methods = tree.GetMethods();
    REQUIRE(methods.size() == 1);
    CHECK(methods[0]->range.end == MakePosition(2, 0));
  }

  SECTION("Unclosed region extends to the end of the document") {
    auto tree = BuildTree("#Область Служебные\nПроцедура А()\nКонецПроцедуры");
    const auto& module = tree.GetModule();
    REQUIRE(module.children.size() == 1);
    CHECK(module.children[0]->name == "Служебные");
    CHECK(module.children[0]->range.end == MakePosition(2, 14));
    CHECK(module.children[0]->children.size() == 1);
  }

  SECTION("Unmatched end region is ignored") {
    auto tree = BuildTree("#EndRegion\nProcedure A()\nEndProcedure");
    CHECK(tree.GetModule().children.size() == 1);
  }

  SECTION("Keywords after a dot are member names") {
    auto tree = BuildTree("Object.Procedure = 1;\nQuery.Var = 2;");
    CHECK(tree.GetChildrenFlat().empty());
  }

  SECTION("Method without a name is skipped") {
    auto tree = BuildTree("Procedure (\nProcedure Named()\nEndProcedure");
    auto methods = tree.GetMethods();
    REQUIRE(methods.size() == 1);
    CHECK(methods[0]->name == "Named");
  }
}

TEST_CASE(
    "SymbolTreeBuilder keeps the first of duplicate methods", "[symbol_tree]") {
  auto tree = BuildTree(
      "Procedure Twice()\nEndProcedure\n\nProcedure TWICE()\nEndProcedure");

  CHECK(tree.GetMethods().size() == 2);
  const auto* method = tree.GetMethodSymbol("twice");
  REQUIRE(method != nullptr);
  CHECK(method->selection_range.start.line == 0);
}

TEST_CASE("SymbolTree records the declaring document", "[symbol_tree]") {
  bsld::semantic::Symbol module{.name = "Utils", .owner = kModule};
  CHECK(module.kind == lsp::SymbolKind::Module);
  CHECK(module.uri.empty());

  SymbolTree tree(module);
  tree.AddSymbol(
      bsld::semantic::Symbol{
          .name = "Run", .kind = lsp::SymbolKind::Method, .owner = kModule});
  tree.AssignUri("file:///ws/Utils.bsl");

  CHECK(tree.GetModule().uri == "file:///ws/Utils.bsl");
  REQUIRE(tree.GetMethodSymbol("run") != nullptr);
  CHECK(tree.GetMethodSymbol("run")->uri == "file:///ws/Utils.bsl");
}
