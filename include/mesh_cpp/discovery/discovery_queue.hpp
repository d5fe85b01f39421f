#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "mesh_cpp/cache/cache_types.hpp"
#include "mesh_cpp/logging.hpp"
#include "mesh_cpp/result.hpp"

namespace mesh_cpp {

    /// @brief Waiters a single discovery queue holds before it rejects calls.
    inline constexpr std::size_t kDiscoveryQueueCapacity = 10;

    /// @brief The raw discovery operation, usually a control-plane client.
    template <typename K, typename V>
    using Discover = std::function<boost::asio::awaitable<Result<V>>(K)>;

    /**
     * Single-flight pipeline in front of one discovery lookup.
     *
     * The first call() starts the lookup for the queue's key. Callers that
     * arrive while it is in flight wait in a bounded FIFO and are woken in
     * arrival order once it resolves. After that every call() returns a copy
     * of the same outcome, a value or the discovery error, without waiting.
     *
     * No timeout is applied: a stalled lookup keeps its waiters until it
     * completes. Outer layers own timeouts and load shedding.
     *
     * SAFETY:
     * - call() is thread-safe; coroutines may resume on any executor thread
     * - Waiter timers are armed and cancelled only under the queue mutex
     * - The lookup runs on a detached coroutine that keeps the queue alive, so
     *   it completes even when every caller has gone away
     */
    template <typename K, typename V>
    class DiscoveryQueue
        : public std::enable_shared_from_this<DiscoveryQueue<K, V>> {
       public:
        enum class Status {
            Idle,       ///< No lookup yet
            Resolving,  ///< Lookup in flight
            Ready,      ///< Holds a value
            Failed      ///< Holds an error
        };

        DiscoveryQueue(boost::asio::any_io_executor ex, K key,
                       Discover<K, V> discover,
                       std::size_t capacity = kDiscoveryQueueCapacity,
                       std::shared_ptr<DiscoveryMetrics> metrics = {})
            : ex_(std::move(ex)),
              key_(std::move(key)),
              discover_(std::move(discover)),
              capacity_(capacity),
              metrics_(metrics ? std::move(metrics)
                               : std::make_shared<DiscoveryMetrics>()) {
            if (capacity_ == 0) {
                throw std::invalid_argument(
                    "DiscoveryQueue capacity must be positive");
            }
        }

        DiscoveryQueue(DiscoveryQueue const&) = delete;
        DiscoveryQueue& operator=(DiscoveryQueue const&) = delete;

        /// @brief Obtain the discovered value, starting the lookup if needed
        /// @return A copy of the value, the discovery error verbatim, or
        /// NotReady when the queue is full
        /// @note Suspends only while the lookup is in flight
        boost::asio::awaitable<Result<V>> call() {
            std::shared_ptr<boost::asio::steady_timer> t;
            bool start = false;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (auto r = completed_locked_()) co_return std::move(*r);

                if (waiters_.size() >= capacity_) {
                    metrics_->calls_rejected.fetch_add(
                        1, std::memory_order_relaxed);
                    co_return Result<V>::err(Error::Code::NotReady,
                                             "Discovery queue is full");
                }

                t = std::make_shared<boost::asio::steady_timer>(ex_);
                t->expires_at(std::chrono::steady_clock::time_point::max());
                waiters_.push_back(t);

                if (status_ == Status::Idle) {
                    status_ = Status::Resolving;
                    start = true;
                }
            }

            if (start) {
                metrics_->discoveries_started.fetch_add(
                    1, std::memory_order_relaxed);
                boost::asio::co_spawn(
                    ex_,
                    [self = this->shared_from_this()]()
                        -> boost::asio::awaitable<void> {
                        co_await self->resolve_();
                    },
                    boost::asio::detached);
            }

            // The wait is registered under mu_, so it either sees the settled
            // outcome or is pending when resolve_() cancels it.
            boost::system::error_code ec;
            auto token =
                boost::asio::redirect_error(boost::asio::use_awaitable, ec);
            auto initiate_wait = [this, t](auto handler) {
                std::lock_guard<std::mutex> lk(mu_);
                if (status_ == Status::Ready || status_ == Status::Failed) {
                    t->expires_at(std::chrono::steady_clock::time_point::min());
                }
                t->async_wait(std::move(handler));
            };
            co_await boost::asio::async_initiate<
                decltype(token), void(boost::system::error_code)>(
                initiate_wait, token);

            std::lock_guard<std::mutex> lk(mu_);
            if (auto r = completed_locked_()) co_return std::move(*r);

            // Only a timer failure can wake us before completion
            co_return Result<V>::err(
                Error::Code::Unknown,
                "Discovery wait interrupted: " + ec.message());
        }

        Status status() const {
            std::lock_guard<std::mutex> lk(mu_);
            return status_;
        }

        /// @brief Callers currently waiting for the lookup
        std::size_t waiting() const {
            std::lock_guard<std::mutex> lk(mu_);
            return waiters_.size();
        }

        std::size_t capacity() const noexcept { return capacity_; }

        K const& key() const noexcept { return key_; }

       private:
        /// @brief The settled outcome, or nullopt while not resolved
        /// @note Caller holds mu_
        std::optional<Result<V>> completed_locked_() {
            if (status_ == Status::Ready) {
                metrics_->calls_served.fetch_add(1, std::memory_order_relaxed);
                return Result<V>::ok(*value_);
            }
            if (status_ == Status::Failed) {
                metrics_->calls_served.fetch_add(1, std::memory_order_relaxed);
                return Result<V>::err(*error_);
            }
            return std::nullopt;
        }

        /// @brief Run the lookup once and wake every waiter in FIFO order
        boost::asio::awaitable<void> resolve_() {
            std::optional<Result<V>> out;
            try {
                out.emplace(co_await discover_(key_));
            } catch (std::exception const& ex) {
                out.emplace(Result<V>::err(Error::Code::DiscoveryFailed,
                                           ex.what()));
            }

            std::lock_guard<std::mutex> lk(mu_);
            if (out->has_value()) {
                value_.emplace(std::move(*out).value());
                status_ = Status::Ready;
            } else {
                error_.emplace(std::move(*out).error());
                status_ = Status::Failed;
                metrics_->discoveries_failed.fetch_add(
                    1, std::memory_order_relaxed);
                logger()->debug("Discovery failed key={}: {}", key_,
                                error_->message);
            }

            // Waiter timers are only touched under mu_. cancel() posts the
            // completions, in arrival order; a waiter whose wait is not yet
            // registered sees the settled status instead.
            for (auto& w : waiters_) w->cancel();
            waiters_.clear();
        }

        boost::asio::any_io_executor ex_;
        const K key_;
        Discover<K, V> discover_;
        const std::size_t capacity_;
        std::shared_ptr<DiscoveryMetrics> metrics_;

        mutable std::mutex mu_;
        Status status_{Status::Idle};
        std::optional<V> value_;
        std::optional<Error> error_;
        std::deque<std::shared_ptr<boost::asio::steady_timer>> waiters_;
    };

}  // namespace mesh_cpp
