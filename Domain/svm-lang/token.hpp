#pragma once
#include <cstddef>
#include <string>

namespace svm {

  enum class TokenKind {
    Eof,
    Word, // any non-whitespace run; classified by codegen
  };

  struct Token {
    TokenKind kind{};
    std::string lexeme{};
    std::size_t line{1};
    std::size_t col{1};
  };

} // namespace svm
