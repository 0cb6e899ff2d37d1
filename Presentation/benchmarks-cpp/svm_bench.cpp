#include <benchmark/benchmark.h>
#include "../../Application/svm-compiler/compiler.hpp"
#include "../../Application/svm-vm/vm.hpp"
#include <sstream>
#include <string>

// Counts memory cell 0 down from N; one `.` per iteration.
static std::string countdown_src(long long n, bool print) {
  return std::to_string(n) + " 0 store 0: " + (print ? "0 load . " : "") +
         "1 0 load - 0 store 0 load 0 cjmp 0";
}

static void BM_CompileOnly(benchmark::State& state) {
  auto src = countdown_src(10, true);
  for (auto _ : state) {
    svm::Compiler c;
    auto res = c.compile(src);
    benchmark::DoNotOptimize(res.program.size());
  }
}

BENCHMARK(BM_CompileOnly);

static void BM_RunCountdown(benchmark::State& state) {
  auto program = svm::compileOrThrow(countdown_src(state.range(0), false));
  std::ostringstream sink;
  for (auto _ : state) {
    svm::VM vm(sink);
    auto v = vm.execute(program);
    benchmark::DoNotOptimize(v);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_RunCountdown)->Arg(100)->Arg(10000);

static void BM_CompileAndRun(benchmark::State& state) {
  auto src = countdown_src(100, true);
  for (auto _ : state) {
    std::ostringstream sink;
    svm::VM vm(sink);
    auto v = vm.execute(svm::compileOrThrow(src));
    benchmark::DoNotOptimize(v);
  }
}

BENCHMARK(BM_CompileAndRun);

BENCHMARK_MAIN();
