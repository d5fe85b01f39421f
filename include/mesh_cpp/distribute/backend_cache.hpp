#pragma once

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "mesh_cpp/error.hpp"
#include "mesh_cpp/logging.hpp"
#include "mesh_cpp/service.hpp"

namespace mesh_cpp {

    /// @brief The set of backend keys a target wants to reach.
    template <typename K, typename Hash = std::hash<K>>
    using BackendSet = std::unordered_set<K, Hash>;

    /**
     * @brief Immutable snapshot of a backend cache.
     *
     * Cheap to copy; lookups never lock. Asking for a key that the snapshot
     * does not hold means the backend set and the caller disagree about the
     * target, and throws Defect.
     */
    template <typename K, typename S, typename Hash = std::hash<K>>
    class BackendCache {
       public:
        using Map = std::unordered_map<K, S, Hash>;

        explicit BackendCache(std::shared_ptr<const Map> backends)
            : backends_(std::move(backends)) {}

        /// @brief The service built for key
        /// @throws Defect if key is not in the snapshot
        S const& get(K const& key) const {
            auto it = backends_->find(key);
            if (it == backends_->end()) {
                auto msg = fmt::format("backend {} must be in cache", key);
                logger()->error("{}", msg);
                throw Defect(msg);
            }
            return it->second;
        }

        /// @brief Copy of the service built for key
        /// @throws Defect if key is not in the snapshot
        S new_service(K const& key) const { return get(key); }

        bool contains(K const& key) const {
            return backends_->find(key) != backends_->end();
        }

        std::size_t size() const noexcept { return backends_->size(); }

        /// @brief Snapshot keys, in no particular order
        BackendSet<K, Hash> keys() const {
            BackendSet<K, Hash> out;
            out.reserve(backends_->size());
            for (auto const& [k, _] : *backends_) out.insert(k);
            return out;
        }

       private:
        std::shared_ptr<const Map> backends_;
    };

    /**
     * Reconciling cache of backend services.
     *
     * Each new_service() call extracts the desired BackendSet from the
     * target and brings the shared map in line with it under a mutex:
     * backends that are no longer wanted are dropped, wanted backends that
     * are missing are built with the per-target builder, and backends that
     * are already present are kept as they are, never rebuilt. The result is
     * an immutable BackendCache snapshot whose key set equals the desired set.
     *
     * Backend construction happens under the lock and must be synchronous
     * and cheap; asynchronous work belongs inside the built service.
     *
     * Copies share the same backends.
     *
     * @tparam T target type
     * @tparam K backend key type; hashable, formattable by fmt
     * @tparam S backend service type; copied into each snapshot
     */
    template <typename T, typename K, typename S, typename Hash = std::hash<K>>
    class NewBackendCache {
       public:
        using Snapshot = BackendCache<K, S, Hash>;
        using NewBackend = std::function<S(K const&)>;
        using NewInner = std::function<NewBackend(T const&)>;

        NewBackendCache(Extract<BackendSet<K, Hash>, T> extract, NewInner inner)
            : extract_(std::move(extract)),
              inner_(std::move(inner)),
              shared_(std::make_shared<Shared>()) {
            if (!extract_ || !inner_) {
                throw std::invalid_argument(
                    "NewBackendCache requires an extractor and an inner "
                    "builder");
            }
        }

        /// @brief Reconcile the cache with target's backends and snapshot it
        Snapshot new_service(T const& target) const {
            BackendSet<K, Hash> backends = extract_(target);
            NewBackend newk = inner_(target);

            std::lock_guard<std::mutex> lk(shared_->mu);
            auto& cache = shared_->backends;

            // Remove all backends that aren't in the updated set.
            for (auto it = cache.begin(); it != cache.end();) {
                if (backends.find(it->first) != backends.end()) {
                    ++it;
                    continue;
                }
                logger()->debug("Removing backend={}", it->first);
                it = cache.erase(it);
            }

            // Every remaining entry is wanted, so there are only additions
            // left when the desired set is larger.
            if (backends.size() > cache.size()) {
                cache.reserve(backends.size());
                for (auto const& backend : backends) {
                    if (cache.find(backend) != cache.end()) {
                        logger()->trace("Retaining backend={}", backend);
                        continue;
                    }
                    logger()->debug("Adding backend={}", backend);
                    cache.emplace(backend, newk(backend));
                }
            }

            return Snapshot(
                std::make_shared<const typename Snapshot::Map>(cache));
        }

        /// @brief Number of backends currently cached
        std::size_t size() const {
            std::lock_guard<std::mutex> lk(shared_->mu);
            return shared_->backends.size();
        }

       private:
        struct Shared {
            mutable std::mutex mu;
            typename Snapshot::Map backends;
        };

        Extract<BackendSet<K, Hash>, T> extract_;
        NewInner inner_;
        std::shared_ptr<Shared> shared_;
    };

}  // namespace mesh_cpp
