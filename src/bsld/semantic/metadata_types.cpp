#include "bsld/semantic/metadata_types.hpp"

#include <array>

#include "bsld/utils/text_utils.hpp"

namespace bsld::semantic {

namespace {

constexpr std::array<MetadataCollection, 18> kCollections = {{
    {"Catalogs", "Справочники", "Catalog", true},
    {"Documents", "Документы", "Document", true},
    {"DataProcessors", "Обработки", "DataProcessor", true},
    {"Reports", "Отчеты", "Report", true},
    {"InformationRegisters", "РегистрыСведений", "InformationRegister", true},
    {"AccumulationRegisters", "РегистрыНакопления", "AccumulationRegister",
     true},
    {"Enums", "Перечисления", "Enum", true},
    {"ExchangePlans", "ПланыОбмена", "ExchangePlan", true},
    {"BusinessProcesses", "БизнесПроцессы", "BusinessProcess", true},
    {"Tasks", "Задачи", "Task", true},
    {"ChartsOfCharacteristicTypes", "ПланыВидовХарактеристик",
     "ChartOfCharacteristicTypes", true},
    {"ChartsOfAccounts", "ПланыСчетов", "ChartOfAccounts", false},
    {"AccountingRegisters", "РегистрыБухгалтерии", "AccountingRegister",
     false},
    {"CalculationRegisters", "РегистрыРасчета", "CalculationRegister", false},
    {"DocumentJournals", "ЖурналыДокументов", "DocumentJournal", false},
    {"Constants", "Константы", "Constant", false},
    {"HTTPServices", "HTTPСервисы", "HTTPService", false},
    {"WebServices", "WebСервисы", "WebService", false},
}};

}  // namespace

auto AllMetadataCollections() -> std::span<const MetadataCollection> {
  return kCollections;
}

auto FindManagerCollection(std::string_view word)
    -> const MetadataCollection* {
  auto folded = utils::FoldCase(word);
  for (const auto& collection : kCollections) {
    if (!collection.has_manager_access) {
      continue;
    }
    if (folded == utils::FoldCase(collection.en) ||
        folded == utils::FoldCase(collection.ru)) {
      return &collection;
    }
  }
  return nullptr;
}

auto FindCollectionByDirectory(std::string_view directory)
    -> const MetadataCollection* {
  for (const auto& collection : kCollections) {
    if (collection.en == directory) {
      return &collection;
    }
  }
  return nullptr;
}

}  // namespace bsld::semantic
