#include "compiler.hpp"
#include "../../Domain/svm-lang/lexer.hpp"
#include <charconv>
#include <sstream>

namespace svm {

  static const std::unordered_map<std::string, Op> kOpcodes = {
      {"+", Op::Add},
      {"-", Op::Sub},
      {"*", Op::Mul},
      {"/", Op::Div},
      {"load", Op::Load},
      {"store", Op::Store},
      {"jmp", Op::Jmp},
      {"cjmp", Op::CJmp},
      {".", Op::Put},
      {"dup", Op::Dup},
      {"swap", Op::Swap},
      {"=", Op::Eq},
      {"<", Op::Lt},
      {">", Op::Gt},
  };

  static std::string join_diags(const std::vector<std::string> &diags) {
    std::string out = "compilation failed";
    for (const auto &d : diags) out += "\n  " + d;
    return out;
  }

  CompileError::CompileError(std::vector<std::string> diags)
      : std::runtime_error(join_diags(diags)), diags_(std::move(diags)) {}

  std::optional<long long> parse_literal(const std::string &text) {
    if (text.empty())
      return std::nullopt;
    const char *first = text.data();
    const char *last  = text.data() + text.size();
    // from_chars takes '-' but not '+'
    if (*first == '+') {
      ++first;
      if (first == last || *first == '-')
        return std::nullopt;
    }
    long long v = 0;
    auto res    = std::from_chars(first, last, v, 10);
    if (res.ec != std::errc() || res.ptr != last)
      return std::nullopt;
    return v;
  }

  std::optional<uint32_t> parse_label(const std::string &text) {
    if (text.size() < 2 || text.back() != ':')
      return std::nullopt;
    const char *first = text.data();
    const char *last  = text.data() + text.size() - 1;
    if (*first == '+')
      ++first;
    if (first == last || *first == '-')
      return std::nullopt;
    uint32_t id = 0;
    auto res    = std::from_chars(first, last, id, 10);
    if (res.ec != std::errc() || res.ptr != last)
      return std::nullopt;
    return id;
  }

  void Compiler::error_at(const Token &t, const std::string &m) {
    std::ostringstream os;
    os << "[line " << t.line << ":" << t.col << "] " << m;
    diags_.push_back(os.str());
  }

  void Compiler::compileToken(const Token &t) {
    auto it = kOpcodes.find(t.lexeme);
    if (it != kOpcodes.end()) {
      program_.push_back(Instruction{it->second, 0});
      return;
    }
    if (auto v = parse_literal(t.lexeme)) {
      program_.push_back(Instruction::lit(*v));
      return;
    }
    if (auto id = parse_label(t.lexeme)) {
      program_.push_back(Instruction::label(*id));
      return;
    }
    error_at(t, "malformed token '" + t.lexeme + "'");
  }

  CompileResult Compiler::compile(const std::vector<Token> &toks) {
    for (const auto &t : toks) {
      if (t.kind == TokenKind::Eof)
        break;
      compileToken(t);
    }
    return CompileResult{std::move(program_), std::move(diags_)};
  }

  CompileResult Compiler::compile(const std::string &src) {
    Lexer lx(src);
    return compile(lx.Lex());
  }

  Program compileOrThrow(const std::string &src) {
    Compiler c;
    auto res = c.compile(src);
    if (!res.diags.empty())
      throw CompileError(std::move(res.diags));
    return std::move(res.program);
  }

} // namespace svm
