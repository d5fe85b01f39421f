#pragma once

#include <memory>
#include <utility>

namespace mesh_cpp {

    namespace detail {
        /// @brief Reference-counted cache slot as seen by a CacheHandle.
        class CacheEntryBase {
           public:
            virtual ~CacheEntryBase() = default;

            virtual void retain() noexcept = 0;
            virtual void release() noexcept = 0;
        };
    }  // namespace detail

    /**
     * Shared ownership of one cache entry.
     *
     * Every live handle counts towards its entry's reference count: copying
     * a handle retains the entry, destroying or resetting it releases the
     * entry. The owning cache starts the entry's idle timer when the count
     * drops to zero. Moves transfer the reference without touching the count.
     *
     * A handle that outlives its cache stays valid but no longer counts.
     */
    class CacheHandle {
       public:
        CacheHandle() = default;

        /// @brief Adopt a reference that the cache has already counted
        explicit CacheHandle(
            std::shared_ptr<detail::CacheEntryBase> entry) noexcept
            : entry_(std::move(entry)) {}

        CacheHandle(CacheHandle const& other) noexcept : entry_(other.entry_) {
            if (entry_) entry_->retain();
        }

        CacheHandle(CacheHandle&& other) noexcept
            : entry_(std::exchange(other.entry_, {})) {}

        CacheHandle& operator=(CacheHandle const& other) noexcept {
            if (this != &other) {
                reset();
                entry_ = other.entry_;
                if (entry_) entry_->retain();
            }
            return *this;
        }

        CacheHandle& operator=(CacheHandle&& other) noexcept {
            if (this != &other) {
                reset();
                entry_ = std::exchange(other.entry_, {});
            }
            return *this;
        }

        ~CacheHandle() { reset(); }

        /// @brief Release the reference early
        void reset() noexcept {
            if (auto e = std::exchange(entry_, {})) e->release();
        }

        explicit operator bool() const noexcept { return entry_ != nullptr; }

        /// @brief True if both handles reference the same entry
        bool same_entry(CacheHandle const& other) const noexcept {
            return entry_ == other.entry_;
        }

       private:
        std::shared_ptr<detail::CacheEntryBase> entry_;
    };

    /**
     * @brief A value carried together with the cache handle it came from.
     *
     * Holding a Cached<T> keeps the originating entry alive, so a service
     * built from a cached lookup delays that entry's eviction for as long as
     * the service is in use.
     */
    template <typename T>
    class Cached {
       public:
        Cached(T value, CacheHandle handle)
            : value_(std::move(value)), handle_(std::move(handle)) {}

        T& operator*() noexcept { return value_; }
        T const& operator*() const noexcept { return value_; }

        T* operator->() noexcept { return &value_; }
        T const* operator->() const noexcept { return &value_; }

        T& get() noexcept { return value_; }
        T const& get() const noexcept { return value_; }

        CacheHandle const& handle() const noexcept { return handle_; }

        /// @brief Wrap another value with a copy of this handle
        template <typename U>
        Cached<U> with(U value) const& {
            return Cached<U>(std::move(value), handle_);
        }

        /// @brief Wrap another value, moving this handle over
        template <typename U>
        Cached<U> with(U value) && {
            return Cached<U>(std::move(value), std::move(handle_));
        }

       private:
        T value_;
        CacheHandle handle_;
    };

}  // namespace mesh_cpp
