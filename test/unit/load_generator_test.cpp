/*
Load generator tests
*/

#include "rerank_bench/client_pool.hpp"
#include "rerank_bench/errors.hpp"
#include "rerank_bench/load_generator.hpp"
#include "address_space_limit.hpp"
#include "fake_client.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdlib>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;
using rerank_bench::ClientConfig;
using rerank_bench::ClientHandle;
using rerank_bench::ClientPool;
using rerank_bench::LoadGenerator;
using test_support::FactoryProbe;

namespace {
const ClientConfig kCfg{"http://127.0.0.1:11438/v1", 5s};
}

TEST(LoadGenerator, Run_CollectsEveryOutcome) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());
    LoadGenerator gen(pool, kCfg);

    std::atomic<int> calls{0};
    auto result = gen.Run(50, 5, [&](ClientHandle&) {
        if (calls.fetch_add(1) % 3 == 0) {
            throw std::runtime_error("flaky");
        }
    });

    ASSERT_EQ(result.outcomes.size(), 250u);
    EXPECT_EQ(result.setup_failures, 0u);
    EXPECT_GT(result.wall_time.count(), 0);

    std::size_t ok = 0;
    std::size_t failed = 0;
    for (const auto& o : result.outcomes) {
        if (o.success) {
            ++ok;
            EXPECT_FALSE(o.error.has_value());
        } else {
            ++failed;
            EXPECT_EQ(o.error.value_or(""), "flaky");
        }
    }
    EXPECT_EQ(ok + failed, 250u);
    EXPECT_EQ(failed, 84u);   // ceil(250 / 3)
}

TEST(LoadGenerator, Run_WorkerPrivateHandles) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());
    LoadGenerator gen(pool, kCfg);

    std::mutex m;
    std::set<const ClientHandle*> handles;
    auto result = gen.Run(8, 4, [&](ClientHandle& h) {
        EXPECT_EQ(h.Config(), kCfg);
        std::lock_guard<std::mutex> lk(m);
        handles.insert(&h);
    });

    EXPECT_EQ(result.outcomes.size(), 32u);
    EXPECT_EQ(handles.size(), 8u);
    EXPECT_EQ(probe.created.load(), 8);
    EXPECT_EQ(probe.released.load(), 8);
    // Worker handles never land in the shared slot.
    EXPECT_FALSE(pool.Current().has_value());
}

TEST(LoadGenerator, Run_WorkersOverlap) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());
    LoadGenerator gen(pool, kCfg);

    auto result = gen.Run(8, 1, [](ClientHandle&) {
        std::this_thread::sleep_for(100ms);
    });

    ASSERT_EQ(result.outcomes.size(), 8u);
    // Serial execution would need 800ms.
    EXPECT_LT(result.wall_time, 600ms);
    for (const auto& o : result.outcomes) {
        EXPECT_TRUE(o.success);
        EXPECT_GE(o.latency, 100ms);
    }
}

TEST(LoadGenerator, Run_SetupFailureAbortsWorkers) {
    FactoryProbe probe;
    probe.fail_create = true;
    ClientPool pool(probe.Factory());
    LoadGenerator gen(pool, kCfg);

    std::atomic<int> calls{0};
    auto result = gen.Run(4, 3, [&](ClientHandle&) { calls.fetch_add(1); });

    EXPECT_TRUE(result.outcomes.empty());
    EXPECT_EQ(result.setup_failures, 4u);
    EXPECT_EQ(calls.load(), 0);
}

TEST(LoadGenerator, Run_EmptyShape) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());
    LoadGenerator gen(pool, kCfg);

    auto none = [](ClientHandle&) {};
    EXPECT_TRUE(gen.Run(0, 5, none).outcomes.empty());
    EXPECT_TRUE(gen.Run(5, 0, none).outcomes.empty());
    EXPECT_EQ(probe.created.load(), 0);
}

TEST(LoadGenerator, Warmup_FailuresAreNotFatal) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());
    LoadGenerator gen(pool, kCfg);

    std::atomic<int> calls{0};
    auto boom = [&](ClientHandle&) {
        calls.fetch_add(1);
        throw std::runtime_error("cold");
    };
    EXPECT_EQ(gen.Warmup(3, boom), 3u);
    EXPECT_EQ(calls.load(), 3);
    // Warm-up runs on the shared slot.
    ASSERT_TRUE(pool.Current().has_value());
    EXPECT_EQ(*pool.Current(), kCfg);

    auto result = gen.Run(2, 2, [](ClientHandle&) {});
    EXPECT_EQ(result.outcomes.size(), 4u);
    EXPECT_EQ(probe.created.load(), 3);
}

TEST(LoadGenerator, Warmup_NoClient) {
    FactoryProbe probe;
    probe.fail_create = true;
    ClientPool pool(probe.Factory());
    LoadGenerator gen(pool, kCfg);

    EXPECT_EQ(gen.Warmup(2, [](ClientHandle&) {}), 2u);
    EXPECT_EQ(gen.Warmup(0, [](ClientHandle&) {}), 0u);
}

namespace {
// Exit codes: 0 = every worker was reported as a setup failure and no call ran.
int RunUnderMemoryCap() {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());
    LoadGenerator gen(pool, kCfg);
    if (!test_support::CapAddressSpace(64u << 20)) {
        return 3;
    }
    std::atomic<int> calls{0};
    auto result = gen.Run(400, 1, [&](ClientHandle&) { calls.fetch_add(1); });
    if (!result.outcomes.empty() || calls.load() != 0) {
        return 1;
    }
    return result.setup_failures == 400 ? 0 : 2;
}
}

// Not enough memory for the worker threads: the run reports setup failures
// instead of taking the process down.
TEST(LoadGeneratorDeathTest, Run_ThreadStartFailureIsSetupFailure) {
    EXPECT_EXIT(std::exit(RunUnderMemoryCap()), ::testing::ExitedWithCode(0), "");
}
