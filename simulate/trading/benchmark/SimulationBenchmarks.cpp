/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "PriceTimeBook.hpp"
#include "Simulation.hpp"
#include "util.hpp"

#include <cstdlib>
#include <random>

//-------------------------------------------------------------------------

static const fs::path kTestDataPath{
    fs::path{__FILE__}.parent_path().parent_path() / "test" / "cpp-tests" / "data"};

static const fs::path kConfigPaths[]{kTestDataPath / "noise.xml", kTestDataPath / "replay.xml"};

//-------------------------------------------------------------------------

struct BookFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        book = std::make_unique<PriceTimeBook>("BENCH");
        nextId = 0;

        const auto depth = state.range(0);
        for (int64_t level = 1; level <= depth; ++level) {
            book->placeLimitOrder(
                LimitOrder{OrderDirection::BUY, 0, "BENCH", 0, 10, 10'000 - level, nextId++}, 0);
            book->placeLimitOrder(
                LimitOrder{OrderDirection::SELL, 1, "BENCH", 0, 10, 10'000 + level, nextId++}, 0);
        }
    }

    void TearDown(benchmark::State&) override { book.reset(); }

    std::unique_ptr<PriceTimeBook> book;
    OrderID nextId{};
};

//-------------------------------------------------------------------------

struct MemoryManager : benchmark::MemoryManager
{
    benchmark::MemoryManager::Result stats;

    void Start() override
    {
        stats.num_allocs = 0;
        stats.max_bytes_used = 0;
        stats.total_allocated_bytes = 0;
        stats.net_heap_growth = 0;
    }

    void Stop(benchmark::MemoryManager::Result& result) override { result = stats; }
};

static MemoryManager s_mngr;

void* operator new(size_t size)
{
    void* ptr = malloc(size);
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }
    auto& stats = s_mngr.stats;
    stats.num_allocs++;
    stats.total_allocated_bytes += size;
    stats.net_heap_growth += size;
    stats.max_bytes_used = std::max(stats.max_bytes_used, stats.net_heap_growth);
    return ptr;
}

void operator delete(void* ptr) noexcept
{
    free(ptr);
}

void operator delete(void* ptr, size_t size) noexcept
{
    s_mngr.stats.net_heap_growth -= static_cast<int64_t>(size);
    free(ptr);
}

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(BookFixture, RestAndCancel)(benchmark::State& state)
{
    std::mt19937 rng{42};
    std::uniform_int_distribution<Price> offset{1, state.range(0)};

    for (auto _ : state) {
        const OrderID id = nextId++;
        book->placeLimitOrder(
            LimitOrder{OrderDirection::BUY, 2, "BENCH", 0, 1, 10'000 - offset(rng), id}, 0);
        benchmark::DoNotOptimize(book->cancelOrder(id));
    }
}
BENCHMARK_REGISTER_F(BookFixture, RestAndCancel)->Arg(10)->Arg(100)->Arg(1000);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(BookFixture, SweepAndRefill)(benchmark::State& state)
{
    const auto depth = state.range(0);

    for (auto _ : state) {
        const auto result = book->placeMarketOrder(
            MarketOrder{OrderDirection::BUY, 2, "BENCH", 0, 10 * depth, nextId++}, 0);
        benchmark::DoNotOptimize(result.executions.data());

        state.PauseTiming();
        for (int64_t level = 1; level <= depth; ++level) {
            book->placeLimitOrder(
                LimitOrder{OrderDirection::SELL, 1, "BENCH", 0, 10, 10'000 + level, nextId++}, 0);
        }
        state.ResumeTiming();
    }
}
BENCHMARK_REGISTER_F(BookFixture, SweepAndRefill)->Arg(10)->Arg(100);

//-------------------------------------------------------------------------

static void SimpleRun(benchmark::State& state)
{
    const auto& kConfigPath = kConfigPaths[state.range(0)];

    for (auto _ : state) {
        state.PauseTiming();
        const auto nodes = mktsim::util::parseSimulationFile(kConfigPath);
        auto simulation = Simulation::fromXML(nodes.simulation);
        state.ResumeTiming();

        simulation->simulate();
        benchmark::DoNotOptimize(simulation->currentTimestamp());
    }
}
BENCHMARK(SimpleRun)->Arg(0)->Arg(1);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::RegisterMemoryManager(&s_mngr);
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::RegisterMemoryManager(nullptr);
}

//-------------------------------------------------------------------------
