#pragma once

#include <memory>

#include "index_fixture.hpp"

namespace bsld::test {

// Three modules calling each other:
//   FormA.OnOpen  -> CommonUtils.DoWork, CommonUtils.Compute
//   FormA.Refresh -> CommonUtils.DoWork, Privileged.Elevate
//   CommonUtils.Compute -> Privileged.Elevate
constexpr auto kUtilsUri =
    "file:///ws/CommonModules/CommonUtils/Ext/Module.bsl";
constexpr auto kPrivilegedUri =
    "file:///ws/CommonModules/Privileged/Ext/Module.bsl";
constexpr auto kFormUri =
    "file:///ws/DataProcessors/Main/Forms/FormA/Ext/Form/Module.bsl";

constexpr auto kUtilsSource = R"(Procedure DoWork() Export
EndProcedure

Function Compute(Value) Export
  Return Privileged.Elevate(Value);
EndFunction
)";

constexpr auto kPrivilegedSource = R"(Function Elevate(Value) Export
  Return Value;
EndFunction
)";

constexpr auto kFormSource = R"(&AtServer
Procedure OnOpen()
  CommonUtils.DoWork();
  Result = CommonUtils.Compute(1);
EndProcedure

&AtServer
Procedure Refresh()
  CommonUtils.DoWork();
  Privileged.Elevate(2);
EndProcedure
)";

inline auto FormModule() -> semantic::ModuleId {
  return semantic::ModuleId{
      .mdo_ref = "DataProcessor.Main.Form.FormA",
      .kind = semantic::ModuleKind::kFormModule};
}

inline auto MakeSampleWorkspace() -> std::unique_ptr<IndexFixture> {
  auto fixture = std::make_unique<IndexFixture>();
  fixture->Register(kUtilsUri, CommonModule("CommonUtils"));
  fixture->Register(kPrivilegedUri, CommonModule("Privileged"));
  fixture->Register(kFormUri, FormModule());

  fixture->Index(kUtilsUri, CommonModule("CommonUtils"), kUtilsSource);
  fixture->Index(kPrivilegedUri, CommonModule("Privileged"), kPrivilegedSource);
  fixture->Index(kFormUri, FormModule(), kFormSource);
  return fixture;
}

inline auto MakeRange(int line, int start, int end) -> lsp::Range {
  return lsp::Range{
      .start = {.line = line, .character = start},
      .end = {.line = line, .character = end}};
}

}  // namespace bsld::test
