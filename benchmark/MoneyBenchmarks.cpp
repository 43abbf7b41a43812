/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>

#include "finmoney/money/Money.hpp"
#include "finmoney/money/serialization/Money.hpp"

#include <cstdlib>
#include <iterator>
#include <new>
#include <vector>

//-------------------------------------------------------------------------

using namespace finmoney;
using namespace finmoney::literals;

//-------------------------------------------------------------------------

static const decimal_t kTicks[]{DEC(0.01), DEC(0.25), DEC(0.33), 5_dec};

struct PriceFixture : benchmark::Fixture
{
    void SetUp(benchmark::State&) override
    {
        prices.clear();
        for (int32_t i = 0; i < 1024; ++i) {
            prices.emplace_back(
                DEC(10.567) + util::scaleByPowerOf10(decimal_t{i * 37}, -3), Currency::USD);
        }
    }

    std::vector<Money> prices;
};

struct MemoryManager : benchmark::MemoryManager
{
    benchmark::MemoryManager::Result stats;

    void Start() override
    {
        stats.num_allocs = 0;
        stats.total_allocated_bytes = 0;
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
    s_mngr.stats.num_allocs++;
    s_mngr.stats.total_allocated_bytes += static_cast<int64_t>(size);
    return ptr;
}

void operator delete(void* ptr) noexcept
{
    free(ptr);
}

void operator delete(void* ptr, size_t) noexcept
{
    free(ptr);
}

//-------------------------------------------------------------------------

static void BM_CurrencyCreate(benchmark::State& state)
{
    for (auto _ : state) {
        benchmark::DoNotOptimize(Currency::create(1, "usdt", "Tether USD", 6));
    }
}
BENCHMARK(BM_CurrencyCreate);

static void BM_MoneyParse(benchmark::State& state)
{
    for (auto _ : state) {
        benchmark::DoNotOptimize(Money::parse("12345.6789", Currency::USD));
    }
}
BENCHMARK(BM_MoneyParse);

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(PriceFixture, Add)(benchmark::State& state)
{
    Money total = Money::zero(Currency::USD);
    for (auto _ : state) {
        for (const Money& price : prices) {
            total = total.add(price).value_or(total);
        }
        benchmark::DoNotOptimize(total);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(prices.size()));
}
BENCHMARK_REGISTER_F(PriceFixture, Add);

BENCHMARK_DEFINE_F(PriceFixture, DivideByDecimal)(benchmark::State& state)
{
    for (auto _ : state) {
        for (const Money& price : prices) {
            benchmark::DoNotOptimize(price.divideByDecimal(3_dec));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(prices.size()));
}
BENCHMARK_REGISTER_F(PriceFixture, DivideByDecimal);

BENCHMARK_DEFINE_F(PriceFixture, Compare)(benchmark::State& state)
{
    for (auto _ : state) {
        for (const Money& price : prices) {
            benchmark::DoNotOptimize(price.isGreaterThan(prices.front()));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(prices.size()));
}
BENCHMARK_REGISTER_F(PriceFixture, Compare);

BENCHMARK_DEFINE_F(PriceFixture, Rounded)(benchmark::State& state)
{
    const auto strategy = static_cast<RoundingStrategy>(state.range(0));
    for (auto _ : state) {
        for (const Money& price : prices) {
            benchmark::DoNotOptimize(price.roundToPlaces(1, strategy));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(prices.size()));
}
BENCHMARK_REGISTER_F(PriceFixture, Rounded)->DenseRange(
    0, static_cast<int64_t>(RoundingStrategy::CEILING));

BENCHMARK_DEFINE_F(PriceFixture, ToTickNearest)(benchmark::State& state)
{
    const decimal_t tick = kTicks[state.range(0)];
    for (auto _ : state) {
        for (const Money& price : prices) {
            benchmark::DoNotOptimize(price.toTickNearest(tick));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(prices.size()));
}
BENCHMARK_REGISTER_F(PriceFixture, ToTickNearest)->DenseRange(
    0, static_cast<int64_t>(std::size(kTicks)) - 1);

BENCHMARK_DEFINE_F(PriceFixture, PackUnpack)(benchmark::State& state)
{
    serialization::BinaryStream stream;
    for (auto _ : state) {
        for (const Money& price : prices) {
            stream.clear();
            msgpack::pack(stream, price);
            benchmark::DoNotOptimize(serialization::unpackMoney(stream.data(), stream.size()));
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(prices.size()));
}
BENCHMARK_REGISTER_F(PriceFixture, PackUnpack);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::RegisterMemoryManager(&s_mngr);
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::RegisterMemoryManager(nullptr);
}

//-------------------------------------------------------------------------
