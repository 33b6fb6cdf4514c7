#pragma once

#include <expected>
#include <string>
#include <utility>

namespace lsp::error {

enum class LspErrorCode {
  // Malformed request data, e.g. an unknown module or a bad hierarchy item
  kInvalidParams,

  // The document is neither indexed nor open
  kDocumentNotFound,

  kUnknownError,
};

namespace detail {

inline auto DefaultMessageFor(LspErrorCode code) -> std::string {
  switch (code) {
    case LspErrorCode::kInvalidParams:
      return "Invalid params";
    case LspErrorCode::kDocumentNotFound:
      return "Document not found";
    case LspErrorCode::kUnknownError:
      break;
  }
  return "Unknown error";
}

}  // namespace detail

class LspError {
 public:
  explicit LspError(LspErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Code() const -> LspErrorCode {
    return code_;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }

  static auto FromCode(LspErrorCode code, const std::string& message = "")
      -> LspError {
    return LspError(
        code, message.empty() ? detail::DefaultMessageFor(code) : message);
  }

  static auto UnexpectedFromCode(
      LspErrorCode code, const std::string& details = "")
      -> std::unexpected<LspError> {
    return std::unexpected<LspError>(FromCode(code, details));
  }

 private:
  LspErrorCode code_;
  std::string message_;
};

inline auto Ok() -> std::expected<void, LspError> {
  return {};
}

}  // namespace lsp::error
