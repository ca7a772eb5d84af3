/**
 * @file select_benchmark.cpp
 * @brief Benchmarks for streaming and in-memory column selection
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <sstream>
#include <string>

#include <csvcols/csvcols.hpp>

#include "bench_utils.hpp"

namespace {

constexpr int64_t kColumns = 32;

void SkipWithStatus(benchmark::State &state, const csvcols::Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

void RunSelect(benchmark::State &state, bool in_memory, int round) {
    const int64_t rows = state.range(0);
    const std::string table = csvcols::bench::make_table(rows, kColumns);

    csvcols::SelectOptions options;
    options.columns = csvcols::bench::every_other_column(kColumns);
    options.in_memory = in_memory;
    options.round = round;

    for (auto _ : state) {
        std::istringstream in(table);
        std::ostringstream out;
        auto status = csvcols::select_columns(in, out, options);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(out.str().size());
    }

    state.SetItemsProcessed(state.iterations() * rows);
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(table.size()));
}

static void BM_Select_Streaming(benchmark::State &state) {
    RunSelect(state, false, -1);
}

static void BM_Select_InMemory(benchmark::State &state) {
    RunSelect(state, true, -1);
}

static void BM_Select_Streaming_Round(benchmark::State &state) {
    RunSelect(state, false, 3);
}

static void BM_Select_InMemory_Round(benchmark::State &state) {
    RunSelect(state, true, 3);
}

BENCHMARK(BM_Select_Streaming)->Arg(1000)->Arg(10000);
BENCHMARK(BM_Select_InMemory)->Arg(1000)->Arg(10000);
BENCHMARK(BM_Select_Streaming_Round)->Arg(1000)->Arg(10000);
BENCHMARK(BM_Select_InMemory_Round)->Arg(1000)->Arg(10000);

}  // namespace

BENCHMARK_MAIN();
