#pragma once

#include <spdlog/fmt/ranges.h>

#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include "mesh_cpp/distribute/backend_cache.hpp"
#include "mesh_cpp/distribute/distribution.hpp"
#include "mesh_cpp/error.hpp"
#include "mesh_cpp/logging.hpp"
#include "mesh_cpp/result.hpp"
#include "mesh_cpp/service.hpp"

namespace mesh_cpp {

    /**
     * A service that dispatches each request to one of its backends.
     *
     * The backend is picked per call according to the Distribution:
     * FirstAvailable takes the first ready backend in declared order,
     * RandomAvailable draws among ready backends in proportion to their
     * weights. A distribution with one backend always picks it.
     */
    template <typename K, typename Req, typename Rsp>
    class Distribute : public Service<Req, Rsp> {
       public:
        using Backend = std::pair<K, ServicePtr<Req, Rsp>>;

        /// @param backends one entry per distribution key, in the same order
        /// @throws Defect if backends do not line up with dist.keys()
        Distribute(std::vector<Backend> backends, Distribution<K> dist)
            : backends_(std::move(backends)), dist_(std::move(dist)) {
            auto const& keys = dist_.keys();
            bool aligned = keys.size() == backends_.size();
            for (std::size_t i = 0; aligned && i < keys.size(); ++i) {
                aligned = backends_[i].first == keys[i] && backends_[i].second;
            }
            if (!aligned) {
                logger()->error("Distribution does not match its backends");
                throw Defect("Distribution does not match its backends");
            }
        }

        bool ready() const noexcept override {
            for (auto const& [_, svc] : backends_) {
                if (svc->ready()) return true;
            }
            return false;
        }

        /// @brief Pick the backend for the next request
        /// @return Unavailable for an empty distribution, NotReady when no
        /// backend is ready
        Result<ServicePtr<Req, Rsp>> select() const {
            using R = Result<ServicePtr<Req, Rsp>>;

            switch (dist_.kind()) {
                case Distribution<K>::Kind::Empty:
                    return R::err(Error::Code::Unavailable,
                                  "Distribution has no backends");

                case Distribution<K>::Kind::FirstAvailable:
                    for (auto const& [_, svc] : backends_) {
                        if (svc->ready()) return R::ok(svc);
                    }
                    return R::err(Error::Code::NotReady,
                                  "No backend is ready");

                case Distribution<K>::Kind::RandomAvailable:
                    return select_weighted_();
            }
            return R::err(Error::Code::Unknown, "Unknown distribution kind");
        }

        boost::asio::awaitable<Result<Rsp>> call(Req req) override {
            auto selected = select();
            if (selected.has_error()) {
                co_return Result<Rsp>::err(std::move(selected).error());
            }
            ServicePtr<Req, Rsp> svc = std::move(selected).value();
            co_return co_await svc->call(std::move(req));
        }

        Distribution<K> const& distribution() const noexcept { return dist_; }

        std::vector<Backend> const& backends() const noexcept {
            return backends_;
        }

       private:
        Result<ServicePtr<Req, Rsp>> select_weighted_() const {
            using R = Result<ServicePtr<Req, Rsp>>;

            auto const& declared = dist_.weights();
            std::vector<std::uint32_t> weights(declared.size(), 0);
            std::size_t live = 0;
            std::size_t last = 0;
            for (std::size_t i = 0; i < backends_.size(); ++i) {
                if (!backends_[i].second->ready()) continue;
                weights[i] = declared[i];
                ++live;
                last = i;
            }

            if (live == 0) {
                return R::err(Error::Code::NotReady, "No backend is ready");
            }
            if (live == 1) return R::ok(backends_[last].second);

            thread_local std::mt19937 rng{std::random_device{}()};
            std::discrete_distribution<std::size_t> pick(weights.begin(),
                                                         weights.end());
            return R::ok(backends_[pick(rng)].second);
        }

        std::vector<Backend> backends_;
        Distribution<K> dist_;
    };

    /**
     * Builds a Distribute service for each target.
     *
     * The distribution and the backend snapshot are both taken from the same
     * target, so every distribution key is expected to be in the snapshot. A
     * key that is missing is a Defect: it is never dropped or replaced.
     *
     * @tparam T target type
     * @tparam K backend key type
     */
    template <typename T, typename K, typename Req, typename Rsp,
              typename Hash = std::hash<K>>
    class NewDistribute {
       public:
        using Snapshot = BackendCache<K, ServicePtr<Req, Rsp>, Hash>;
        using NewInner = std::function<Snapshot(T const&)>;

        NewDistribute(Extract<Distribution<K>, T> extract, NewInner inner)
            : extract_(std::move(extract)), inner_(std::move(inner)) {
            if (!extract_ || !inner_) {
                throw std::invalid_argument(
                    "NewDistribute requires an extractor and an inner "
                    "builder");
            }
        }

        /// @brief Build the distribution for target
        /// @throws Defect if the distribution names a backend that the
        /// snapshot does not hold
        std::shared_ptr<Distribute<K, Req, Rsp>> new_service(
            T const& target) const {
            Distribution<K> dist = extract_(target);
            logger()->debug("New distribution backends=[{}]",
                            fmt::join(dist.keys(), ", "));

            // Keep declared order so weights line up with backends
            Snapshot newk = inner_(target);
            std::vector<typename Distribute<K, Req, Rsp>::Backend> backends;
            backends.reserve(dist.keys().size());
            for (auto const& k : dist.keys()) {
                backends.emplace_back(k, newk.new_service(k));
            }

            return std::make_shared<Distribute<K, Req, Rsp>>(
                std::move(backends), std::move(dist));
        }

       private:
        Extract<Distribution<K>, T> extract_;
        NewInner inner_;
    };

}  // namespace mesh_cpp
