#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

#include "mesh_cpp/cache/cache_handle.hpp"
#include "mesh_cpp/cache/cache_types.hpp"
#include "mesh_cpp/cache/idle_cache.hpp"
#include "mesh_cpp/config.hpp"
#include "mesh_cpp/discovery/discovery_queue.hpp"
#include "mesh_cpp/result.hpp"
#include "mesh_cpp/service.hpp"

namespace mesh_cpp {

    /**
     * Builds services from the result of a cached discovery lookup.
     *
     * new_service() extracts a key from the target, takes a handle on that
     * key's cache entry and waits on the entry's DiscoveryQueue. The
     * discovered value is passed with the target to the inner builder, and
     * the service it returns is wrapped in a Cached<S> carrying the same
     * handle. While any returned service is alive its entry cannot go idle,
     * even though the lookup itself finished long ago.
     *
     * On discovery failure the error is returned as is and the handle is
     * dropped right away, so the entry may be evicted after the idle timeout
     * and the next caller gets a fresh lookup.
     *
     * Copies share the same cache.
     *
     * @tparam T target type
     * @tparam K discovery key type
     * @tparam V discovered value type; copied for each caller
     * @tparam S service type produced by the inner builder
     */
    template <typename T, typename K, typename V, typename S,
              typename Hash = std::hash<K>>
    class NewCachedDiscover {
       public:
        using Queue = DiscoveryQueue<K, V>;
        using NewInner = std::function<S(T const&, V)>;

        NewCachedDiscover(boost::asio::any_io_executor ex,
                          Extract<K, T> extract, Discover<K, V> discover,
                          NewInner inner, DiscoveryCacheConfiguration cfg)
            : extract_(std::move(extract)),
              inner_(std::move(inner)),
              metrics_(std::make_shared<DiscoveryMetrics>()),
              cache_(ex, cfg.idle_timeout,
                     make_queue_factory_(ex, std::move(discover), metrics_)) {
            if (!extract_ || !inner_) {
                throw std::invalid_argument(
                    "NewCachedDiscover requires an extractor and an inner "
                    "builder");
            }
        }

        /// @brief Discover the target's key and build the inner service
        /// @return The inner service bound to the cache handle, or the
        /// discovery error
        boost::asio::awaitable<Result<Cached<S>>> new_service(T target) {
            K key = extract_(target);
            Cached<std::shared_ptr<Queue>> cached = cache_.get(key);

            Result<V> discovered = co_await (*cached)->call();
            if (discovered.has_error()) {
                co_return Result<Cached<S>>::err(
                    std::move(discovered).error());
            }

            S svc = inner_(target, std::move(discovered).value());
            co_return Result<Cached<S>>::ok(
                std::move(cached).with(std::move(svc)));
        }

        /// @brief The underlying cache, for introspection
        IdleCache<K, std::shared_ptr<Queue>, Hash> const& cache() const noexcept {
            return cache_;
        }

        DiscoveryMetrics const& discovery_metrics() const noexcept {
            return *metrics_;
        }

       private:
        static typename IdleCache<K, std::shared_ptr<Queue>, Hash>::NewValue
        make_queue_factory_(boost::asio::any_io_executor ex,
                            Discover<K, V> discover,
                            std::shared_ptr<DiscoveryMetrics> metrics) {
            if (!discover) {
                throw std::invalid_argument(
                    "NewCachedDiscover requires a discovery operation");
            }
            return [ex = std::move(ex), discover = std::move(discover),
                    metrics = std::move(metrics)](K const& key) {
                return std::make_shared<Queue>(ex, key, discover,
                                               kDiscoveryQueueCapacity,
                                               metrics);
            };
        }

        Extract<K, T> extract_;
        NewInner inner_;
        std::shared_ptr<DiscoveryMetrics> metrics_;
        IdleCache<K, std::shared_ptr<Queue>, Hash> cache_;
    };

}  // namespace mesh_cpp
