#pragma once
#include "../../Domain/svm-lang/token.hpp"
#include "instruction.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace svm {

  struct CompileResult {
    Program program;
    std::vector<std::string> diags;
  };

  class CompileError : public std::runtime_error {
  public:
    explicit CompileError(std::vector<std::string> diags);
    const std::vector<std::string> &diagnostics() const {
      return diags_;
    }

  private:
    std::vector<std::string> diags_;
  };

  class Compiler {
  public:
    CompileResult compile(const std::vector<Token> &toks);
    CompileResult compile(const std::string &src);

  private:
    void compileToken(const Token &t);
    void error_at(const Token &t, const std::string &m);

    Program program_;
    std::vector<std::string> diags_;
  };

  // Throws CompileError when the source has any malformed token.
  Program compileOrThrow(const std::string &src);

  // Decimal integer with an optional sign; the whole text must be consumed.
  std::optional<long long> parse_literal(const std::string &text);
  // `<decimal>:` with a non-negative id.
  std::optional<uint32_t> parse_label(const std::string &text);

} // namespace svm
