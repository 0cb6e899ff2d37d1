#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace svm {

enum class Op : uint8_t {
  Add, Sub, Mul, Div,
  Lit,
  Load, Store,
  Label,
  Jmp, CJmp,
  Put,
  Dup, Swap,
  Eq, Lt, Gt,
};

// Lit carries the literal in `arg`, Label carries the label id; every other
// opcode ignores it.
struct Instruction {
  Op op{Op::Lit};
  long long arg{0};

  static Instruction lit(long long v) { return Instruction{Op::Lit, v}; }
  static Instruction label(uint32_t id) { return Instruction{Op::Label, (long long)id}; }

  bool operator==(const Instruction &o) const { return op == o.op && arg == o.arg; }
  bool operator!=(const Instruction &o) const { return !(*this == o); }
};

using Program = std::vector<Instruction>;

inline const char *mnemonic(Op op) {
  switch (op) {
  case Op::Add:   return "add";
  case Op::Sub:   return "sub";
  case Op::Mul:   return "mul";
  case Op::Div:   return "div";
  case Op::Lit:   return "lit";
  case Op::Load:  return "load";
  case Op::Store: return "store";
  case Op::Label: return "label";
  case Op::Jmp:   return "jmp";
  case Op::CJmp:  return "cjmp";
  case Op::Put:   return "put";
  case Op::Dup:   return "dup";
  case Op::Swap:  return "swap";
  case Op::Eq:    return "eq";
  case Op::Lt:    return "lt";
  case Op::Gt:    return "gt";
  }
  return "?";
}

// Source spelling, so a listing can be fed back to the compiler.
inline std::string to_string(const Instruction &ins) {
  switch (ins.op) {
  case Op::Add:   return "+";
  case Op::Sub:   return "-";
  case Op::Mul:   return "*";
  case Op::Div:   return "/";
  case Op::Lit:   return std::to_string(ins.arg);
  case Op::Load:  return "load";
  case Op::Store: return "store";
  case Op::Label: return std::to_string(ins.arg) + ":";
  case Op::Jmp:   return "jmp";
  case Op::CJmp:  return "cjmp";
  case Op::Put:   return ".";
  case Op::Dup:   return "dup";
  case Op::Swap:  return "swap";
  case Op::Eq:    return "=";
  case Op::Lt:    return "<";
  case Op::Gt:    return ">";
  }
  return "?";
}

inline std::string to_source(const Program &p) {
  std::string out;
  for (size_t i = 0; i < p.size(); ++i) {
    if (i) out += ' ';
    out += to_string(p[i]);
  }
  return out;
}

inline nlohmann::json dump_program_json(const Program &p) {
  auto out = nlohmann::json::array();
  for (size_t i = 0; i < p.size(); ++i) {
    nlohmann::json j;
    j["ip"] = i;
    j["op"] = mnemonic(p[i].op);
    if (p[i].op == Op::Lit || p[i].op == Op::Label)
      j["arg"] = p[i].arg;
    out.push_back(std::move(j));
  }
  return out;
}

} // namespace svm
