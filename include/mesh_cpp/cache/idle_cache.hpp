#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "mesh_cpp/cache/cache_handle.hpp"
#include "mesh_cpp/cache/cache_types.hpp"
#include "mesh_cpp/logging.hpp"

namespace mesh_cpp {

    /**
     * Per-key cache whose entries are evicted after sitting idle.
     *
     * get() builds the value for a key on first use and hands out a
     * Cached<V> carrying a CacheHandle. An entry is idle when no handle
     * references it; its idle timer is armed when the last handle is
     * released and disarmed by the next get(). Only an entry that stayed
     * idle for the whole idle timeout is evicted, the next get() then builds
     * a fresh value.
     *
     * SAFETY:
     * - All public methods are thread-safe
     * - The value factory runs under the cache lock, it must be cheap and
     *   must not call back into the cache
     * - Copies share one underlying cache
     *
     * INVARIANTS:
     * 1. At most one entry per key
     * 2. An entry with handles > 0 is never evicted
     * 3. metrics().entries == number of entries in the map
     *
     * @tparam K key type; hashable, equality comparable, formattable by fmt
     * @tparam V cached value type; copied into each Cached<V>
     */
    template <typename K, typename V, typename Hash = std::hash<K>>
    class IdleCache {
        struct State;

       public:
        using key_type = K;
        using value_type = V;
        using NewValue = std::function<V(K const&)>;

        IdleCache(boost::asio::any_io_executor ex,
                  std::chrono::steady_clock::duration idle, NewValue new_value)
            : state_(std::make_shared<State>(std::move(ex), idle,
                                             std::move(new_value))) {}

        /// @brief Look up or build the entry for key and take a handle on it
        /// @note Cancels a pending idle eviction for the entry
        Cached<V> get(K const& key) {
            std::shared_ptr<Entry> e;
            {
                std::lock_guard<std::mutex> lk(state_->mu);
                auto it = state_->entries.find(key);
                if (it == state_->entries.end()) {
                    e = std::make_shared<Entry>(state_, key,
                                                state_->new_value(key));
                    state_->entries.emplace(key, e);
                    state_->metrics.entries.fetch_add(
                        1, std::memory_order_relaxed);
                    state_->metrics.entries_created.fetch_add(
                        1, std::memory_order_relaxed);
                    logger()->debug("Caching new entry key={}", key);
                } else {
                    e = it->second;
                }
                e->retain_locked_();
            }

            V value = e->value;
            return Cached<V>(std::move(value), CacheHandle(std::move(e)));
        }

        /// @brief Number of live entries
        std::size_t size() const {
            std::lock_guard<std::mutex> lk(state_->mu);
            return state_->entries.size();
        }

        bool contains(K const& key) const {
            std::lock_guard<std::mutex> lk(state_->mu);
            return state_->entries.find(key) != state_->entries.end();
        }

        /// @brief Number of live handles on key's entry, 0 if absent
        std::size_t handles(K const& key) const {
            std::lock_guard<std::mutex> lk(state_->mu);
            auto it = state_->entries.find(key);
            return it == state_->entries.end() ? 0 : it->second->handles;
        }

        std::chrono::steady_clock::duration idle_timeout() const noexcept {
            return state_->idle;
        }

        IdleCacheMetrics const& metrics() const noexcept {
            return state_->metrics;
        }

       private:
        struct Entry final : detail::CacheEntryBase,
                             std::enable_shared_from_this<Entry> {
            Entry(std::shared_ptr<State> const& st, K k, V v)
                : state(st),
                  key(std::move(k)),
                  value(std::move(v)),
                  timer(st->ex) {}

            void retain() noexcept override {
                auto st = state.lock();
                if (!st) return;
                std::lock_guard<std::mutex> lk(st->mu);
                retain_locked_();
            }

            void release() noexcept override {
                auto st = state.lock();
                if (!st) return;  // cache is gone, nothing to evict from
                try {
                    std::lock_guard<std::mutex> lk(st->mu);
                    st->metrics.live_handles.fetch_sub(
                        1, std::memory_order_relaxed);
                    st->metrics.handles_released.fetch_add(
                        1, std::memory_order_relaxed);
                    if (--handles > 0) return;
                    try {
                        arm_idle_timer_locked_(st);
                    } catch (std::exception const& ex) {
                        // Without a timer nothing would ever evict us
                        logger()->error(
                            "Failed to arm idle timer key={}, evicting: {}",
                            key, ex.what());
                        st->evict_locked_(*this);
                    }
                } catch (std::exception const& ex) {
                    logger()->error("Failed to release cache entry key={}: {}",
                                    key, ex.what());
                }
            }

            /// @brief Count a new handle, disarming the idle timer
            /// @note Caller holds the state lock
            void retain_locked_() noexcept {
                if (handles++ == 0) {
                    // Invalidate any timer that is already queued to fire
                    ++idle_epoch;
                    timer.cancel();
                }
                if (auto st = state.lock()) {
                    st->metrics.live_handles.fetch_add(
                        1, std::memory_order_relaxed);
                    st->metrics.handles_acquired.fetch_add(
                        1, std::memory_order_relaxed);
                }
            }

            /// @brief Start the idle countdown after the last release
            /// @note Caller holds the state lock
            void arm_idle_timer_locked_(std::shared_ptr<State> const& st) {
                const std::uint64_t epoch = ++idle_epoch;
                timer.expires_after(st->idle);
                timer.async_wait(
                    [weak_state = std::weak_ptr<State>(st),
                     weak_entry = this->weak_from_this(),
                     epoch](boost::system::error_code ec) {
                        if (ec) return;  // cancelled by retain or shutdown
                        auto s = weak_state.lock();
                        auto e = weak_entry.lock();
                        if (!s || !e) return;
                        s->evict_if_idle(e, epoch);
                    });
            }

            std::weak_ptr<State> state;
            const K key;
            const V value;
            boost::asio::steady_timer timer;

            // Guarded by State::mu
            std::size_t handles{0};
            std::uint64_t idle_epoch{0};
        };

        struct State {
            State(boost::asio::any_io_executor e,
                  std::chrono::steady_clock::duration i, NewValue nv)
                : ex(std::move(e)), idle(i), new_value(std::move(nv)) {
                if (!new_value) {
                    throw std::invalid_argument(
                        "IdleCache requires a value factory");
                }
            }

            ~State() {
                // Leftover handles must not keep timers that point at us
                for (auto& [_, e] : entries) e->timer.cancel();
            }

            void evict_if_idle(std::shared_ptr<Entry> const& e,
                               std::uint64_t epoch) {
                std::lock_guard<std::mutex> lk(mu);
                if (e->idle_epoch != epoch) return;
                evict_locked_(*e);
            }

            /// @brief Drop e from the map if it is still the cached entry for
            /// its key and holds no handles
            /// @note Caller holds mu
            void evict_locked_(Entry const& e) {
                if (e.handles != 0) return;

                auto it = entries.find(e.key);
                if (it == entries.end() || it->second.get() != &e) return;

                logger()->debug("Evicting idle entry key={}", e.key);
                metrics.entries.fetch_sub(1, std::memory_order_relaxed);
                metrics.entries_evicted.fetch_add(1,
                                                  std::memory_order_relaxed);
                entries.erase(it);
            }

            boost::asio::any_io_executor ex;
            std::chrono::steady_clock::duration idle;
            NewValue new_value;

            mutable std::mutex mu;
            std::unordered_map<K, std::shared_ptr<Entry>, Hash> entries;
            IdleCacheMetrics metrics;
        };

        std::shared_ptr<State> state_;
    };

}  // namespace mesh_cpp
