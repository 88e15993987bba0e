#include "rerank_bench/call_executor.hpp"
#include "rerank_bench/errors.hpp"
#include "fake_client.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace std::chrono_literals;
using rerank_bench::CallExecutor;
using rerank_bench::ClientHandle;

TEST(CallExecutor, Success) {
    test_support::FakeHandle handle{rerank_bench::ClientConfig{}};
    auto out = CallExecutor::Execute(handle, [](ClientHandle& h) {
        (void)h.Post("/rerank", "{}", 1s);
        std::this_thread::sleep_for(5ms);
    });
    EXPECT_TRUE(out.success);
    EXPECT_FALSE(out.error.has_value());
    EXPECT_GE(out.latency, 5ms);
    EXPECT_EQ(handle.posts.load(), 1);
}

TEST(CallExecutor, ExceptionBecomesOutcome) {
    test_support::FakeHandle handle{rerank_bench::ClientConfig{}};
    auto out = CallExecutor::Execute(handle, [](ClientHandle&) {
        std::this_thread::sleep_for(5ms);
        throw rerank_bench::TransportError("POST http://x/rerank: Timeout was reached");
    });
    EXPECT_FALSE(out.success);
    ASSERT_TRUE(out.error.has_value());
    EXPECT_NE(out.error->find("Timeout was reached"), std::string::npos);
    // Latency is measured on failure too.
    EXPECT_GE(out.latency, 5ms);
}

TEST(CallExecutor, NonStandardThrow) {
    test_support::FakeHandle handle{rerank_bench::ClientConfig{}};
    auto out = CallExecutor::Execute(handle, [](ClientHandle&) { throw 42; });
    EXPECT_FALSE(out.success);
    EXPECT_EQ(out.error.value_or(""), "unknown error");
}
