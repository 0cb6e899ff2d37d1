#include "vm.hpp"
#include <fmt/core.h>
#include <limits>

namespace svm {

  const char *to_string(VmErrorKind k) {
    switch (k) {
    case VmErrorKind::DivisionByZero:     return "division by zero";
    case VmErrorKind::ArithmeticOverflow: return "arithmetic overflow";
    case VmErrorKind::MemoryOutOfBounds:  return "memory access out of bounds";
    case VmErrorKind::UndefinedLabel:     return "undefined label";
    case VmErrorKind::LabelOutOfOrder:    return "label defined out of order";
    case VmErrorKind::StepLimitExceeded:  return "step limit exceeded";
    }
    return "vm error";
  }

  VmError::VmError(VmErrorKind kind, size_t ip, Op op, const std::string &what)
      : std::runtime_error(fmt::format("[ip {}] {}: {} ({})", ip, to_string(kind), what, mnemonic(op))),
        kind_(kind), ip_(ip), op_(op) {}

  // two's complement wraparound without signed overflow UB
  static long long wrap_add(long long a, long long b) {
    return (long long)((unsigned long long)a + (unsigned long long)b);
  }
  static long long wrap_sub(long long a, long long b) {
    return (long long)((unsigned long long)a - (unsigned long long)b);
  }
  static long long wrap_mul(long long a, long long b) {
    return (long long)((unsigned long long)a * (unsigned long long)b);
  }

  void VM::reset() {
    stack_.clear();
    memory_.clear();
    jump_table_.clear();
  }

  void VM::buildJumpTable(const Program &program) {
    for (size_t i = 0; i < program.size(); ++i) {
      const auto &ins = program[i];
      if (ins.op != Op::Label)
        continue;
      auto id = (size_t)ins.arg;
      if (id < jump_table_.size()) {
        jump_table_[id] = i;
      } else if (id == jump_table_.size()) {
        jump_table_.push_back(i);
      } else {
        throw VmError(VmErrorKind::LabelOutOfOrder, i, ins.op,
                      fmt::format("label {} introduced while only {} label(s) exist", id, jump_table_.size()));
      }
    }
  }

  size_t VM::target(long long label, size_t ip, Op op) const {
    if (label < 0 || (unsigned long long)label >= jump_table_.size())
      throw VmError(VmErrorKind::UndefinedLabel, ip, op, fmt::format("label {} is not defined", label));
    return jump_table_[(size_t)label];
  }

  void VM::trace(size_t ip, const Instruction &ins) {
    if (trace_limit_ && traced_ >= trace_limit_)
      return;
    ++traced_;
    if (ins.op == Op::Lit || ins.op == Op::Label)
      fmt::print(stderr, "[vm] ip={} op={} {} stack={}\n", ip, mnemonic(ins.op), ins.arg, stack_.size());
    else
      fmt::print(stderr, "[vm] ip={} op={} stack={}\n", ip, mnemonic(ins.op), stack_.size());
  }

  std::optional<long long> VM::execute(const Program &program) {
    steps_  = 0;
    traced_ = 0;
    buildJumpTable(program);

    size_t ip = 0;
    try {
      while (ip < program.size()) {
        const auto &ins = program[ip];
        if (step_limit_ && steps_ >= step_limit_)
          throw VmError(VmErrorKind::StepLimitExceeded, ip, ins.op,
                        fmt::format("more than {} instructions dispatched", step_limit_));
        ++steps_;
        if (trace_)
          trace(ip, ins);

        switch (ins.op) {
        case Op::Add: {
          auto a = pop();
          auto b = pop();
          push(wrap_add(a, b));
          break;
        }
        case Op::Sub: {
          auto a = pop();
          auto b = pop();
          push(wrap_sub(a, b));
          break;
        }
        case Op::Mul: {
          auto a = pop();
          auto b = pop();
          push(wrap_mul(a, b));
          break;
        }
        case Op::Div: {
          auto a = pop();
          auto b = pop();
          if (b == 0)
            throw VmError(VmErrorKind::DivisionByZero, ip, ins.op, fmt::format("{} / 0", a));
          if (a == std::numeric_limits<long long>::min() && b == -1)
            throw VmError(VmErrorKind::ArithmeticOverflow, ip, ins.op, fmt::format("{} / -1", a));
          push(a / b);
          break;
        }
        case Op::Lit:
          push(ins.arg);
          break;
        case Op::Load: {
          auto addr = pop();
          if (addr < 0 || (unsigned long long)addr >= memory_.size())
            throw VmError(VmErrorKind::MemoryOutOfBounds, ip, ins.op,
                          fmt::format("load from {} with memory length {}", addr, memory_.size()));
          push(memory_[(size_t)addr]);
          break;
        }
        case Op::Store: {
          auto addr = pop();
          auto v    = pop();
          if (addr < 0 || (unsigned long long)addr > memory_.size())
            throw VmError(VmErrorKind::MemoryOutOfBounds, ip, ins.op,
                          fmt::format("store to {} with memory length {}", addr, memory_.size()));
          if ((size_t)addr == memory_.size())
            memory_.push_back(v);
          else
            memory_[(size_t)addr] = v;
          break;
        }
        case Op::Label:
          break;
        case Op::Jmp: {
          auto label = pop();
          ip         = target(label, ip, ins.op);
          continue;
        }
        case Op::CJmp: {
          auto label = pop();
          auto cond  = pop();
          if (cond != 0) {
            ip = target(label, ip, ins.op);
            continue;
          }
          break;
        }
        case Op::Put:
          out_ << pop() << '\n';
          break;
        case Op::Dup: {
          auto a = pop();
          push(a);
          push(a);
          break;
        }
        case Op::Swap: {
          auto a = pop();
          auto b = pop();
          push(a);
          push(b);
          break;
        }
        case Op::Eq: {
          auto a = pop();
          auto b = pop();
          push(a == b ? 1 : 0);
          break;
        }
        case Op::Lt: {
          auto a = pop();
          auto b = pop();
          push(a < b ? 1 : 0);
          break;
        }
        case Op::Gt: {
          auto a = pop();
          auto b = pop();
          push(a > b ? 1 : 0);
          break;
        }
        }
        ++ip;
      }
      return pop();
    } catch (const StackEmpty &) {
      if (trace_)
        fmt::print(stderr, "[vm] stack exhausted at ip={}, no result\n", ip);
      return std::nullopt;
    }
  }

  nlohmann::json VM::dumpJson() const {
    nlohmann::json j;
    j["stack"]      = stack_;
    j["memory"]     = memory_;
    j["jump_table"] = jump_table_;
    return j;
  }

} // namespace svm
