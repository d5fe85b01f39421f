#include <gtest/gtest.h>

#include <algorithm>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mesh_cpp/config.hpp"
#include "mesh_cpp/discovery/cached_discover.hpp"
#include "mesh_cpp/distribute/backend_cache.hpp"
#include "mesh_cpp/distribute/distribute.hpp"
#include "mesh_cpp/distribute/distribution.hpp"

namespace net = boost::asio;
using namespace std::chrono_literals;

static void print_result(const char* label, int iters,
                         std::chrono::nanoseconds total,
                         std::chrono::nanoseconds min,
                         std::chrono::nanoseconds max) {
    const double total_ms =
        std::chrono::duration<double, std::milli>(total).count();
    const double avg_us =
        std::chrono::duration<double, std::micro>(total).count() / iters;
    const double min_us =
        std::chrono::duration<double, std::micro>(min).count();
    const double max_us =
        std::chrono::duration<double, std::micro>(max).count();

    std::cout << "\n[ PERF ] " << label << "\n"
              << "        iters=" << iters << " total_ms=" << std::fixed
              << std::setprecision(2) << total_ms << " avg_us=" << std::fixed
              << std::setprecision(2) << avg_us << " min_us=" << std::fixed
              << std::setprecision(2) << min_us << " max_us=" << std::fixed
              << std::setprecision(2) << max_us << "\n";
}

// Running totals for one timed loop
struct Timings {
    std::chrono::nanoseconds total{0};
    std::chrono::nanoseconds min = std::chrono::nanoseconds::max();
    std::chrono::nanoseconds max{0};

    void add(std::chrono::nanoseconds dt) {
        total += dt;
        min = std::min(min, dt);
        max = std::max(max, dt);
    }
};

namespace {

    using Keys = mesh_cpp::BackendSet<std::string>;
    using Svc = mesh_cpp::ServicePtr<std::string, std::string>;

    class Null : public mesh_cpp::Service<std::string, std::string> {
       public:
        net::awaitable<mesh_cpp::Result<std::string>> call(
            std::string req) override {
            co_return mesh_cpp::Result<std::string>::ok(std::move(req));
        }
    };

    struct Route {
        Keys backends;
        mesh_cpp::Distribution<std::string> dist;
    };

    using Backends = mesh_cpp::NewBackendCache<Route, std::string, Svc>;

    Backends make_backends() {
        return Backends([](Route const& r) { return r.backends; },
                        [](Route const&) {
                            return [](std::string const&) -> Svc {
                                return std::make_shared<Null>();
                            };
                        });
    }

    Route make_route(int first, int count) {
        Route r;
        std::vector<std::pair<std::string, std::uint32_t>> weighted;
        for (int i = first; i < first + count; ++i) {
            auto key = "backend-" + std::to_string(i);
            r.backends.insert(key);
            weighted.emplace_back(key, static_cast<std::uint32_t>(i + 1));
        }
        r.dist = mesh_cpp::Distribution<std::string>::random_available(
            std::move(weighted));
        return r;
    }

}  // namespace

TEST(CachePerf, ReconcileUnchangedBackends) {
    constexpr int iters = 20000;
    Backends backends = make_backends();
    Route route = make_route(0, 32);
    (void)backends.new_service(route);

    using clock = std::chrono::steady_clock;
    Timings t;
    for (int i = 0; i < iters; ++i) {
        const auto t0 = clock::now();
        auto snap = backends.new_service(route);
        const auto t1 = clock::now();
        ASSERT_EQ(snap.size(), 32u);
        t.add(std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0));
    }

    print_result("Reconcile (32 backends, no change)", iters, t.total, t.min,
                 t.max);
}

TEST(CachePerf, ReconcileChurningBackends) {
    constexpr int iters = 20000;
    Backends backends = make_backends();
    const Route a = make_route(0, 32);
    const Route b = make_route(16, 32);

    using clock = std::chrono::steady_clock;
    Timings t;
    for (int i = 0; i < iters; ++i) {
        Route const& route = (i % 2 == 0) ? a : b;
        const auto t0 = clock::now();
        auto snap = backends.new_service(route);
        const auto t1 = clock::now();
        ASSERT_EQ(snap.size(), 32u);
        t.add(std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0));
    }

    print_result("Reconcile (32 backends, half replaced each time)", iters,
                 t.total, t.min, t.max);
}

TEST(CachePerf, DistributeSelect) {
    constexpr int iters = 200000;
    Backends backends = make_backends();
    mesh_cpp::NewDistribute<Route, std::string, std::string, std::string>
        router([](Route const& r) { return r.dist; },
               [&backends](Route const& r) { return backends.new_service(r); });
    auto dist = router.new_service(make_route(0, 8));

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();
    for (int i = 0; i < iters; ++i) {
        auto r = dist->select();
        ASSERT_TRUE(r.has_value());
    }
    const auto t1 = clock::now();

    const auto total =
        std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0);
    print_result("Weighted select (8 backends)", iters, total,
                 total / iters, total / iters);
}

TEST(CachePerf, WarmCachedDiscovery) {
    constexpr int iters = 20000;
    net::io_context io;

    struct Target {
        std::string authority;
    };
    mesh_cpp::DiscoveryCacheConfiguration cfg;
    cfg.idle_timeout = 10ms;
    mesh_cpp::NewCachedDiscover<Target, std::string, int, std::string>
        discovery(
            io.get_executor(), [](Target const& t) { return t.authority; },
            [](std::string) -> net::awaitable<mesh_cpp::Result<int>> {
                co_return mesh_cpp::Result<int>::ok(1);
            },
            [](Target const& t, int v) {
                return t.authority + "@" + std::to_string(v);
            },
            cfg);

    Timings t;
    int failures = 0;
    net::co_spawn(
        io,
        [&]() -> net::awaitable<void> {
            using clock = std::chrono::steady_clock;
            // Warm-up resolves the entry once
            auto warm = co_await discovery.new_service({"web.ns.svc"});
            if (!warm) ++failures;

            for (int i = 0; i < iters; ++i) {
                const auto t0 = clock::now();
                auto r = co_await discovery.new_service({"web.ns.svc"});
                const auto t1 = clock::now();
                if (!r) ++failures;
                t.add(std::chrono::duration_cast<std::chrono::nanoseconds>(
                    t1 - t0));
            }
        },
        net::detached);
    io.run_for(30s);

    EXPECT_EQ(failures, 0);
    print_result("Cached discovery (warm entry)", iters, t.total, t.min,
                 t.max);
}
