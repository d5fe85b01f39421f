#include <gtest/gtest.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mesh_cpp/discovery/discovery_queue.hpp"

using namespace mesh_cpp;
using namespace std::chrono_literals;

namespace {

    using Queue = DiscoveryQueue<std::string, int>;

    // Resolves to out after delay, counting invocations
    Discover<std::string, int> delayed(boost::asio::io_context& io,
                                       int& calls,
                                       std::chrono::milliseconds delay,
                                       Result<int> out) {
        return [&io, &calls, delay,
                out](std::string) -> boost::asio::awaitable<Result<int>> {
            ++calls;
            boost::asio::steady_timer t(io, delay);
            co_await t.async_wait(boost::asio::use_awaitable);
            co_return out;
        };
    }

    void spawn_call(boost::asio::io_context& io, std::shared_ptr<Queue> q,
                    std::vector<Result<int>>& results) {
        boost::asio::co_spawn(
            io,
            [q, &results]() -> boost::asio::awaitable<void> {
                results.push_back(co_await q->call());
            },
            boost::asio::detached);
    }

    TEST(DiscoveryQueueTest, ConcurrentCallersShareOneLookup) {
        boost::asio::io_context io;
        int calls = 0;
        auto q = std::make_shared<Queue>(
            io.get_executor(), "svc",
            delayed(io, calls, 10ms, Result<int>::ok(42)));
        EXPECT_EQ(q->status(), Queue::Status::Idle);

        std::vector<Result<int>> results;
        for (int i = 0; i < 3; ++i) spawn_call(io, q, results);

        io.poll();
        EXPECT_EQ(q->status(), Queue::Status::Resolving);
        EXPECT_EQ(q->waiting(), 3u);

        io.restart();
        io.run();
        EXPECT_EQ(calls, 1);
        EXPECT_EQ(q->status(), Queue::Status::Ready);
        EXPECT_EQ(q->waiting(), 0u);
        ASSERT_EQ(results.size(), 3u);
        for (auto const& r : results) {
            ASSERT_TRUE(r.has_value());
            EXPECT_EQ(r.value(), 42);
        }
    }

    TEST(DiscoveryQueueTest, WaitersWakeInArrivalOrder) {
        boost::asio::io_context io;
        int calls = 0;
        auto q = std::make_shared<Queue>(
            io.get_executor(), "svc",
            delayed(io, calls, 5ms, Result<int>::ok(1)));

        std::vector<int> order;
        for (int i = 0; i < 5; ++i) {
            boost::asio::co_spawn(
                io,
                [q, i, &order]() -> boost::asio::awaitable<void> {
                    auto r = co_await q->call();
                    EXPECT_TRUE(r.has_value());
                    order.push_back(i);
                },
                boost::asio::detached);
        }
        io.run();

        EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    }

    TEST(DiscoveryQueueTest, FullQueueRejectsWithNotReady) {
        boost::asio::io_context io;
        int calls = 0;
        auto metrics = std::make_shared<DiscoveryMetrics>();
        auto q = std::make_shared<Queue>(
            io.get_executor(), "svc",
            delayed(io, calls, 10ms, Result<int>::ok(7)), 2, metrics);
        EXPECT_EQ(q->capacity(), 2u);

        std::vector<Result<int>> results;
        for (int i = 0; i < 3; ++i) spawn_call(io, q, results);
        io.run();

        ASSERT_EQ(results.size(), 3u);
        // The rejected caller returns first, without waiting
        ASSERT_TRUE(results[0].has_error());
        EXPECT_EQ(results[0].error().code, Error::Code::NotReady);
        EXPECT_EQ(results[1].value_or(-1), 7);
        EXPECT_EQ(results[2].value_or(-1), 7);
        EXPECT_EQ(metrics->calls_rejected.load(), 1u);

        // Once resolved there is nothing to wait for
        results.clear();
        for (int i = 0; i < 3; ++i) spawn_call(io, q, results);
        io.restart();
        io.run();
        ASSERT_EQ(results.size(), 3u);
        for (auto const& r : results) EXPECT_EQ(r.value_or(-1), 7);
        EXPECT_EQ(calls, 1);
    }

    TEST(DiscoveryQueueTest, FailureIsStickyAndVerbatim) {
        boost::asio::io_context io;
        int calls = 0;
        auto metrics = std::make_shared<DiscoveryMetrics>();
        auto q = std::make_shared<Queue>(
            io.get_executor(), "svc",
            delayed(io, calls, 1ms,
                    Result<int>::err(Error::Code::DiscoveryFailed,
                                     "profile not found")),
            kDiscoveryQueueCapacity, metrics);

        std::vector<Result<int>> results;
        spawn_call(io, q, results);
        spawn_call(io, q, results);
        io.run();

        spawn_call(io, q, results);
        io.restart();
        io.run();

        EXPECT_EQ(calls, 1);
        EXPECT_EQ(q->status(), Queue::Status::Failed);
        ASSERT_EQ(results.size(), 3u);
        for (auto const& r : results) {
            ASSERT_TRUE(r.has_error());
            EXPECT_EQ(r.error().code, Error::Code::DiscoveryFailed);
            EXPECT_EQ(r.error().message, "profile not found");
        }
        EXPECT_EQ(metrics->discoveries_started.load(), 1u);
        EXPECT_EQ(metrics->discoveries_failed.load(), 1u);
        EXPECT_EQ(metrics->calls_served.load(), 3u);
    }

    TEST(DiscoveryQueueTest, ThrowingLookupBecomesDiscoveryFailed) {
        boost::asio::io_context io;
        bool fail = true;
        auto q = std::make_shared<Queue>(
            io.get_executor(), "svc",
            [&fail](std::string key) -> boost::asio::awaitable<Result<int>> {
                if (fail) throw std::runtime_error("resolver crashed: " + key);
                co_return Result<int>::ok(0);
            });

        std::vector<Result<int>> results;
        spawn_call(io, q, results);
        io.run();

        ASSERT_EQ(results.size(), 1u);
        ASSERT_TRUE(results[0].has_error());
        EXPECT_EQ(results[0].error().code, Error::Code::DiscoveryFailed);
        EXPECT_EQ(results[0].error().message, "resolver crashed: svc");
    }

    TEST(DiscoveryQueueTest, QueueIsReleasedOnceLookupSettles) {
        boost::asio::io_context io;
        int calls = 0;
        auto q = std::make_shared<Queue>(
            io.get_executor(), "svc",
            delayed(io, calls, 5ms, Result<int>::ok(3)));
        std::weak_ptr<Queue> weak = q;

        std::vector<Result<int>> results;
        spawn_call(io, q, results);
        q.reset();

        io.run();
        EXPECT_EQ(calls, 1);
        ASSERT_EQ(results.size(), 1u);
        EXPECT_EQ(results[0].value_or(-1), 3);
        EXPECT_TRUE(weak.expired());
    }

    TEST(DiscoveryQueueTest, CallersOnManyThreadsAllWake) {
        constexpr int kQueues = 2000;
        constexpr int kCallers = 4;
        constexpr int kThreads = 4;

        boost::asio::io_context io(kThreads);
        auto metrics = std::make_shared<DiscoveryMetrics>();
        std::atomic<int> completed{0};
        std::atomic<int> wrong{0};

        // Lookups settle at once, so wakeups race with waiters registering
        std::vector<std::shared_ptr<Queue>> queues;
        for (int i = 0; i < kQueues; ++i) {
            auto q = std::make_shared<Queue>(
                io.get_executor(), "svc-" + std::to_string(i),
                [](std::string) -> boost::asio::awaitable<Result<int>> {
                    co_return Result<int>::ok(7);
                },
                kDiscoveryQueueCapacity, metrics);
            queues.push_back(q);
            for (int c = 0; c < kCallers; ++c) {
                boost::asio::co_spawn(
                    io,
                    [q, &completed, &wrong]() -> boost::asio::awaitable<void> {
                        auto r = co_await q->call();
                        if (!r.has_value() || r.value() != 7) wrong.fetch_add(1);
                        completed.fetch_add(1);
                    },
                    boost::asio::detached);
            }
        }

        std::vector<std::thread> threads;
        for (int i = 0; i < kThreads; ++i) {
            threads.emplace_back([&io] { io.run_for(10s); });
        }
        for (auto& t : threads) t.join();

        EXPECT_EQ(completed.load(), kQueues * kCallers);
        EXPECT_EQ(wrong.load(), 0);
        EXPECT_EQ(metrics->discoveries_started.load(),
                  static_cast<std::uint64_t>(kQueues));
        EXPECT_EQ(metrics->calls_served.load(),
                  static_cast<std::uint64_t>(kQueues * kCallers));
        for (auto const& q : queues) {
            EXPECT_EQ(q->status(), Queue::Status::Ready);
            EXPECT_EQ(q->waiting(), 0u);
        }
    }

    TEST(DiscoveryQueueTest, ZeroCapacityThrows) {
        boost::asio::io_context io;
        int calls = 0;
        EXPECT_THROW(Queue(io.get_executor(), "svc",
                           delayed(io, calls, 1ms, Result<int>::ok(0)), 0),
                     std::invalid_argument);
    }

}  // namespace
