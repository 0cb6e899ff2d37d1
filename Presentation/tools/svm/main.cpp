#include "../../../Application/svm-compiler/compiler.hpp"
#include "../../../Application/svm-vm/vm.hpp"
#include <cerrno>
#include <cstdlib>
#include <fmt/core.h>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

  bool g_verbose = false;

  template <typename... Args>
  void log_cli(fmt::format_string<Args...> fmtstr, Args &&...args) {
    if (!g_verbose)
      return;
    fmt::print(stderr, "[cli] {}\n", fmt::format(fmtstr, std::forward<Args>(args)...));
  }

  bool env_logging() {
    const char *v = std::getenv("SVM_LOG");
    return v && *v && std::string(v) != "0";
  }

  void print_usage() {
    fmt::print("Usage: svm [--run|--check|--disasm|--dump] [--trace] [--trace-limit N] [--step-limit N] "
               "[--no-result] [--verbose] <file>\n");
  }

  // Whole-string decimal count; false on empty, trailing garbage or a sign.
  bool parse_count(const std::string &s, uint64_t &out) {
    if (s.empty() || s[0] == '-' || s[0] == '+')
      return false;
    char *end = nullptr;
    errno     = 0;
    auto v    = std::strtoull(s.c_str(), &end, 10);
    if (errno == ERANGE || end != s.c_str() + s.size())
      return false;
    out = v;
    return true;
  }

  struct Options {
    std::string mode{"--run"};
    std::string file;
    bool trace{false};
    uint64_t traceLimit{0};
    uint64_t stepLimit{0};
    bool printResult{true};
  };

  int run(const Options &o, const svm::Program &program) {
    svm::VM vm;
    vm.setTrace(o.trace);
    vm.setTraceLimit(o.traceLimit);
    vm.setStepLimit(o.stepLimit);
    try {
      auto result = vm.execute(program);
      log_cli("ran {} instruction(s)", vm.steps());
      if (o.mode == "--dump") {
        fmt::print("{}\n", vm.dumpJson().dump(2));
      } else if (o.printResult) {
        if (result)
          fmt::print("{}\n", *result);
        else
          log_cli("no result");
      }
      return 0;
    } catch (const svm::VmError &e) {
      std::cout.flush();
      fmt::print(stderr, "Runtime error: {}\n", e.what());
      if (o.mode == "--dump")
        fmt::print("{}\n", vm.dumpJson().dump(2));
      return 1;
    }
  }

} // namespace

int main(int argc, char **argv) {
  Options o;
  g_verbose = env_logging();

  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) {
    print_usage();
    return 2;
  }
  std::vector<std::string> positional;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &a = args[i];
    if (a == "--help") { print_usage(); return 0; }
    if (a == "--version") { fmt::print("svm 0.1.0\n"); return 0; }
    if (a == "--run" || a == "--check" || a == "--disasm" || a == "--dump") { o.mode = a; continue; }
    if (a == "--trace") { o.trace = true; continue; }
    if ((a == "--trace-limit" || a == "--step-limit") && i + 1 < args.size()) {
      uint64_t n = 0;
      if (!parse_count(args[++i], n)) {
        fmt::print(stderr, "invalid count for {}: {}\n", a, args[i]);
        print_usage();
        return 2;
      }
      (a == "--trace-limit" ? o.traceLimit : o.stepLimit) = n;
      continue;
    }
    if (a == "--no-result") { o.printResult = false; continue; }
    if (a == "--verbose") { g_verbose = true; continue; }
    if (!a.empty() && a[0] == '-' && a.size() > 1) {
      fmt::print(stderr, "unknown option: {}\n", a);
      print_usage();
      return 2;
    }
    positional.push_back(a);
  }
  if (positional.size() != 1) {
    print_usage();
    return 2;
  }
  o.file = positional.front();

  log_cli("mode:  {}", o.mode);
  log_cli("input: {}", o.file);

  std::ifstream ifs(o.file);
  if (!ifs) {
    if (o.mode == "--check") {
      nlohmann::json j;
      j["diagnostics"] = nlohmann::json::array({fmt::format("cannot open file: {}", o.file)});
      fmt::print("{}\n", j.dump());
      return 1;
    }
    fmt::print(stderr, "cannot open file: {}\n", o.file);
    return 1;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();

  log_cli("before compile");
  svm::Compiler c;
  auto res = c.compile(ss.str());
  log_cli("after compile: {} instruction(s), {} diagnostic(s)", res.program.size(), res.diags.size());

  if (o.mode == "--check") {
    nlohmann::json j;
    j["diagnostics"] = res.diags;
    fmt::print("{}\n", j.dump());
    return res.diags.empty() ? 0 : 1;
  }
  if (!res.diags.empty()) {
    for (const auto &d : res.diags) fmt::print(stderr, "compile: {}\n", d);
    return 1;
  }
  if (o.mode == "--disasm") {
    fmt::print("{}\n", svm::dump_program_json(res.program).dump(2));
    return 0;
  }
  return run(o, res.program);
}
