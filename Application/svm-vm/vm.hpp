#pragma once
#include "../svm-compiler/instruction.hpp"
#include <cstdint>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace svm {

  enum class VmErrorKind {
    DivisionByZero,
    ArithmeticOverflow,
    MemoryOutOfBounds,
    UndefinedLabel,
    LabelOutOfOrder,
    StepLimitExceeded,
  };

  const char *to_string(VmErrorKind k);

  // Programmer error in the executed program. Not recoverable; the VM state is
  // left as it was at the faulting instruction.
  class VmError : public std::runtime_error {
  public:
    VmError(VmErrorKind kind, size_t ip, Op op, const std::string &what);
    VmErrorKind kind() const {
      return kind_;
    }
    size_t ip() const {
      return ip_;
    }
    Op op() const {
      return op_;
    }

  private:
    VmErrorKind kind_;
    size_t ip_;
    Op op_;
  };

  class VM {
  public:
    explicit VM(std::ostream &out = std::cout) : out_(out) {}

    // Builds the jump table, then dispatches until the end of the program or
    // until a pop finds the stack empty. Returns the popped stack top, or
    // nullopt when there is none.
    std::optional<long long> execute(const Program &program);

    // Clears stack, memory and jump table.
    void reset();

    const std::vector<long long> &stack() const {
      return stack_;
    }
    const std::vector<long long> &memory() const {
      return memory_;
    }
    const std::vector<size_t> &jumpTable() const {
      return jump_table_;
    }
    uint64_t steps() const {
      return steps_;
    }

    nlohmann::json dumpJson() const;

    void setTrace(bool on) {
      trace_ = on;
    }
    void setTraceLimit(uint64_t n) {
      trace_limit_ = n;
    }
    void setStepLimit(uint64_t n) {
      step_limit_ = n;
    }

  private:
    struct StackEmpty {};

    void buildJumpTable(const Program &program);
    size_t target(long long label, size_t ip, Op op) const;
    void trace(size_t ip, const Instruction &ins);

    void push(long long x) {
      stack_.push_back(x);
    }
    long long pop() {
      if (stack_.empty())
        throw StackEmpty{};
      auto v = stack_.back();
      stack_.pop_back();
      return v;
    }

    std::ostream &out_;
    std::vector<long long> stack_;
    std::vector<long long> memory_;
    std::vector<size_t> jump_table_;

    uint64_t steps_{0};
    bool trace_{false};
    uint64_t trace_limit_{0};
    uint64_t traced_{0};
    uint64_t step_limit_{0};
  };

} // namespace svm
