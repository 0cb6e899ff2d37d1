#pragma once
#include "token.hpp"
#include <string>
#include <utility>
#include <vector>

namespace svm {

  class Lexer {
  public:
    explicit Lexer(std::string src) : src_(std::move(src)) {}
    std::vector<Token> Lex();

  private:
    char peek() const {
      return pos_ < src_.size() ? src_[pos_] : '\0';
    }
    char get() {
      return pos_ < src_.size() ? src_[pos_++] : '\0';
    }
    bool at_end() const {
      return pos_ >= src_.size();
    }
    void skip_ws();

    std::string src_;
    std::size_t pos_{0};
    std::size_t line_{1};
    std::size_t col_{1};
  };

} // namespace svm
