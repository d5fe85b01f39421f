#pragma once

#include <boost/asio/awaitable.hpp>
#include <functional>
#include <memory>

#include "mesh_cpp/result.hpp"

namespace mesh_cpp {

    /**
     * @brief An asynchronous request handler.
     *
     * Backends, distributors and whatever the outer routing layers build on
     * top of them all implement this interface.
     */
    template <typename Req, typename Rsp>
    class Service {
       public:
        using request_type = Req;
        using response_type = Rsp;

        virtual ~Service() = default;

        /// @brief Whether the service can take a request right now.
        /// @note Distributors skip backends that are not ready.
        virtual bool ready() const noexcept { return true; }

        /// @brief Handle a single request.
        virtual boost::asio::awaitable<Result<Rsp>> call(Req req) = 0;
    };

    template <typename Req, typename Rsp>
    using ServicePtr = std::shared_ptr<Service<Req, Rsp>>;

    /// @brief Extraction strategy: pulls a P-typed parameter out of a target.
    /// @note Must be pure; the caches call it once per new_service().
    template <typename P, typename T>
    using Extract = std::function<P(T const&)>;

    /// @brief Builds an S for each target (or key).
    template <typename T, typename S>
    using NewService = std::function<S(T const&)>;

}  // namespace mesh_cpp
