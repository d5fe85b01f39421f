#pragma once

#include <cstdint>
#include <utility>
#include <vector>

namespace mesh_cpp {

    /**
     * @brief How requests are split across a set of backend keys.
     *
     * Keys keep their declared order; weights()[i] belongs to keys()[i].
     * Every key must be present in the backend cache snapshot that the
     * distribution is built against.
     */
    template <typename K>
    class Distribution {
       public:
        enum class Kind : std::uint8_t {
            Empty,           ///< No backends, requests fail
            FirstAvailable,  ///< First ready backend in declared order
            RandomAvailable  ///< Weighted random pick among ready backends
        };

        /// @brief A distribution with no backends
        Distribution() = default;

        static Distribution empty() { return Distribution{}; }

        /// @brief Prefer keys in the given order
        static Distribution first_available(std::vector<K> keys) {
            if (keys.empty()) return empty();
            std::vector<std::uint32_t> weights(keys.size(), 1);
            return Distribution(Kind::FirstAvailable, std::move(keys),
                                std::move(weights));
        }

        /// @brief Split requests by weight
        /// @note Zero weights are dropped. With fewer than two keys left there
        /// is nothing to split and the result is first_available().
        static Distribution random_available(
            std::vector<std::pair<K, std::uint32_t>> weighted) {
            std::vector<K> keys;
            std::vector<std::uint32_t> weights;
            keys.reserve(weighted.size());
            weights.reserve(weighted.size());
            for (auto& [k, w] : weighted) {
                if (w == 0) continue;
                keys.push_back(std::move(k));
                weights.push_back(w);
            }
            if (keys.size() < 2) return first_available(std::move(keys));
            return Distribution(Kind::RandomAvailable, std::move(keys),
                                std::move(weights));
        }

        Kind kind() const noexcept { return kind_; }

        std::vector<K> const& keys() const noexcept { return keys_; }

        std::vector<std::uint32_t> const& weights() const noexcept {
            return weights_;
        }

        bool is_empty() const noexcept { return keys_.empty(); }

        friend bool operator==(Distribution const& a, Distribution const& b) {
            return a.kind_ == b.kind_ && a.keys_ == b.keys_ &&
                   a.weights_ == b.weights_;
        }

       private:
        Distribution(Kind kind, std::vector<K> keys,
                     std::vector<std::uint32_t> weights)
            : kind_(kind), keys_(std::move(keys)), weights_(std::move(weights)) {}

        Kind kind_{Kind::Empty};
        std::vector<K> keys_;
        std::vector<std::uint32_t> weights_;
    };

}  // namespace mesh_cpp
