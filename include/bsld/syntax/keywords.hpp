#pragma once

#include <string_view>

#include "bsld/syntax/token.hpp"

namespace bsld::syntax {

// A BSL keyword in its English and Russian spelling
struct Keyword {
  std::string_view en;
  std::string_view ru;
};

inline constexpr Keyword kProcedure{"Procedure", "Процедура"};
inline constexpr Keyword kFunction{"Function", "Функция"};
inline constexpr Keyword kEndProcedure{"EndProcedure", "КонецПроцедуры"};
inline constexpr Keyword kEndFunction{"EndFunction", "КонецФункции"};
inline constexpr Keyword kVar{"Var", "Перем"};
inline constexpr Keyword kVal{"Val", "Знач"};
inline constexpr Keyword kExport{"Export", "Экспорт"};
inline constexpr Keyword kRegion{"Region", "Область"};
inline constexpr Keyword kEndRegion{"EndRegion", "КонецОбласти"};

// Case-insensitive match of an identifier against either spelling
[[nodiscard]] auto Matches(std::string_view word, const Keyword& keyword)
    -> bool;
[[nodiscard]] auto IsKeyword(const Token& token, const Keyword& keyword)
    -> bool;

}  // namespace bsld::syntax
