// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 callbridge Contributors
//
// Call bridge overhead benchmarks

#include <benchmark/benchmark.h>
#include <callbridge/call_bridge.h>
#include <callbridge/handle_allocator.h>
#include <callbridge/pending_call_registry.h>

#include <cstdint>
#include <string>

using namespace callbridge;

// ═══════════════════════════════════════════════════════════════════════════
// Handle allocation and registry
// ═══════════════════════════════════════════════════════════════════════════

static void BM_HandleAllocatorNext(benchmark::State& state) {
    HandleAllocator allocator;
    for (auto _ : state) {
        benchmark::DoNotOptimize(allocator.next());
    }
}
BENCHMARK(BM_HandleAllocatorNext);
BENCHMARK(BM_HandleAllocatorNext)->Threads(4);

static void BM_RegistryInsertTake(benchmark::State& state) {
    PendingCallRegistry registry;
    HandleAllocator allocator;
    for (auto _ : state) {
        CommandHandle handle = allocator.next();
        registry.insert(handle, UserClosure<EmptyResult>{[](ErrorCode) {}});
        benchmark::DoNotOptimize(registry.take(handle));
    }
}
BENCHMARK(BM_RegistryInsertTake);

// ═══════════════════════════════════════════════════════════════════════════
// Full round trips (native completes inline)
// ═══════════════════════════════════════════════════════════════════════════

static void BM_BlockingCallInlineCompletion(benchmark::State& state) {
    CallBridge& bridge = CallBridge::global();
    for (auto _ : state) {
        auto result = bridge.call<HandleResult>([](CommandHandle h, callbridge_handle_cb cb) {
            cb(h, CALLBRIDGE_OK, 1);
            return CALLBRIDGE_OK;
        });
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_BlockingCallInlineCompletion);

static void BM_AsyncCallInlineCompletion(benchmark::State& state) {
    CallBridge& bridge = CallBridge::global();
    int64_t completed = 0;
    for (auto _ : state) {
        ErrorCode status = bridge.call_async<EmptyResult>(
            [](CommandHandle h, callbridge_empty_cb cb) {
                cb(h, CALLBRIDGE_OK);
                return CALLBRIDGE_OK;
            },
            [&completed](ErrorCode) { ++completed; });
        benchmark::DoNotOptimize(status);
    }
    state.counters["completed"] = static_cast<double>(completed);
}
BENCHMARK(BM_AsyncCallInlineCompletion);

static void BM_StringCallPayload(benchmark::State& state) {
    CallBridge& bridge = CallBridge::global();
    const std::string payload(static_cast<size_t>(state.range(0)), 'p');
    for (auto _ : state) {
        auto result = bridge.call<StringResult>([&payload](CommandHandle h, callbridge_string_cb cb) {
            cb(h, CALLBRIDGE_OK, payload.c_str());
            return CALLBRIDGE_OK;
        });
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_StringCallPayload)->Arg(16)->Arg(1024)->Arg(64 * 1024);

BENCHMARK_MAIN();
