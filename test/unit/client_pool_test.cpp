/*
Shared client slot tests
*/

#include "rerank_bench/client_pool.hpp"
#include "rerank_bench/errors.hpp"
#include "fake_client.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using rerank_bench::ClientConfig;
using rerank_bench::ClientPool;
using test_support::FactoryProbe;
using test_support::FakeHandle;

namespace {
const ClientConfig kA{"http://127.0.0.1:11438/v1", 30s};
const ClientConfig kB{"http://127.0.0.1:11439/v1", 30s};
}

TEST(ClientConfig, NormalizesEndpoint) {
    EXPECT_EQ(ClientConfig("http://host:1/v1/"), ClientConfig("http://host:1/v1"));
    EXPECT_EQ(ClientConfig("").Endpoint(), ClientConfig::kDefaultEndpoint);
    EXPECT_EQ(ClientConfig().Timeout(), ClientConfig::kDefaultTimeout);
    EXPECT_NE(ClientConfig("http://host:1/v1", 1s), ClientConfig("http://host:1/v1", 2s));
}

TEST(ClientPool, SameConfig_ReusesHandle) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());

    auto h1 = pool.Acquire(kA);
    auto h2 = pool.Acquire(ClientConfig("http://127.0.0.1:11438/v1/", 30s));
    EXPECT_EQ(h1.get(), h2.get());
    EXPECT_EQ(probe.created.load(), 1);
    ASSERT_TRUE(pool.Current().has_value());
    EXPECT_EQ(*pool.Current(), kA);
}

TEST(ClientPool, ConcurrentAcquire_CreatesOnce) {
    FactoryProbe probe;
    probe.create_delay = 5ms;
    ClientPool pool(probe.Factory());

    constexpr int callers = 100;
    std::atomic<bool> go{false};
    std::vector<rerank_bench::ClientHandle*> seen(callers, nullptr);
    std::vector<std::thread> threads;
    threads.reserve(callers);
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }
            seen[i] = pool.Acquire(kA).get();
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(probe.created.load(), 1);
    EXPECT_EQ(probe.released.load(), 0);
    std::set<rerank_bench::ClientHandle*> distinct(seen.begin(), seen.end());
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_NE(*distinct.begin(), nullptr);
}

TEST(ClientPool, ConfigChange_ReleasesOldHandle) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());

    auto a = pool.Acquire(kA);
    auto b = pool.Acquire(kB);
    EXPECT_EQ(probe.created.load(), 2);
    EXPECT_EQ(probe.released.load(), 1);
    EXPECT_TRUE(static_cast<FakeHandle&>(*a).Released());
    EXPECT_FALSE(static_cast<FakeHandle&>(*b).Released());

    // Going back to A builds a fresh handle instead of reviving the retired one.
    auto a2 = pool.Acquire(kA);
    EXPECT_EQ(probe.created.load(), 3);
    EXPECT_EQ(probe.released.load(), 2);
    EXPECT_NE(a2.get(), a.get());
    EXPECT_FALSE(static_cast<FakeHandle&>(*a2).Released());
    EXPECT_TRUE(static_cast<FakeHandle&>(*b).Released());
}

TEST(ClientPool, ReleaseFailure_IsNotPropagated) {
    FactoryProbe probe;
    probe.fail_release = true;
    ClientPool pool(probe.Factory());

    (void)pool.Acquire(kA);
    EXPECT_NO_THROW((void)pool.Acquire(kB));
    ASSERT_TRUE(pool.Current().has_value());
    EXPECT_EQ(*pool.Current(), kB);
    EXPECT_NO_THROW(pool.ReleaseAll());
    EXPECT_FALSE(pool.Current().has_value());
}

TEST(ClientPool, CreationFailure_Propagates) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());

    (void)pool.Acquire(kA);
    probe.fail_create = true;
    EXPECT_THROW((void)pool.Acquire(kB), rerank_bench::ClientCreationError);
    // The old handle is already retired; nothing stale is left behind.
    EXPECT_FALSE(pool.Current().has_value());
    EXPECT_EQ(probe.released.load(), 1);

    probe.fail_create = false;
    auto b = pool.Acquire(kB);
    EXPECT_NE(b, nullptr);
    EXPECT_EQ(probe.created.load(), 2);
}

TEST(ClientPool, ReleaseAll_Idempotent) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());

    pool.ReleaseAll();
    EXPECT_EQ(probe.released.load(), 0);

    (void)pool.Acquire(kA);
    pool.ReleaseAll();
    pool.ReleaseAll();
    EXPECT_EQ(probe.released.load(), 1);
    EXPECT_FALSE(pool.Current().has_value());

    (void)pool.Acquire(kA);
    EXPECT_EQ(probe.created.load(), 2);
}

TEST(ClientPool, Detached_NotCached) {
    FactoryProbe probe;
    ClientPool pool(probe.Factory());

    auto d1 = pool.CreateDetached(kA);
    auto d2 = pool.CreateDetached(kA);
    EXPECT_NE(d1.get(), d2.get());
    EXPECT_EQ(probe.created.load(), 2);
    EXPECT_FALSE(pool.Current().has_value());

    auto shared = pool.Acquire(kA);
    EXPECT_NE(shared.get(), d1.get());
    EXPECT_EQ(probe.created.load(), 3);
}

TEST(ClientPool, Destructor_ReleasesCachedHandle) {
    FactoryProbe probe;
    std::shared_ptr<rerank_bench::ClientHandle> kept;
    {
        ClientPool pool(probe.Factory());
        kept = pool.Acquire(kA);
    }
    EXPECT_EQ(probe.released.load(), 1);
    EXPECT_TRUE(static_cast<FakeHandle&>(*kept).Released());
}
