#include "lexer.hpp"

namespace svm {

  static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
  }

  void Lexer::skip_ws() {
    while (!at_end()) {
      char c = peek();
      if (c == '\n') {
        get();
        ++line_;
        col_ = 1;
      } else if (is_space(c)) {
        get();
        ++col_;
      } else {
        break;
      }
    }
  }

  std::vector<Token> Lexer::Lex() {
    std::vector<Token> out;
    while (true) {
      skip_ws();
      std::size_t tok_line = line_, tok_col = col_;
      if (at_end()) {
        out.push_back(Token{TokenKind::Eof, "", tok_line, tok_col});
        break;
      }

      std::size_t start = pos_;
      while (!at_end() && !is_space(peek())) {
        get();
        ++col_;
      }
      out.push_back(Token{TokenKind::Word, src_.substr(start, pos_ - start), tok_line, tok_col});
    }
    return out;
  }

} // namespace svm
