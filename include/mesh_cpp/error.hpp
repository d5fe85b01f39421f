#pragma once
#include <stdexcept>
#include <string>

namespace mesh_cpp {
    /**
     * @brief Represents a recoverable error produced while building or
     * calling a service.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            DiscoveryFailed, /**< The discovery source failed to resolve a key. */
            NotReady,        /**< No capacity or no ready backend right now. */
            Unavailable,     /**< There is nothing to dispatch to. */
            InvalidConfig,   /**< A configuration value could not be parsed. */
            Unknown,         /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert Error::Code to string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::DiscoveryFailed:
                return "DiscoveryFailed";
            case Error::Code::NotReady:
                return "NotReady";
            case Error::Code::Unavailable:
                return "Unavailable";
            case Error::Code::InvalidConfig:
                return "InvalidConfig";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /**
     * @brief Thrown when an internal contract is broken, e.g. a distribution
     * names a backend that the backend cache never built.
     *
     * A Defect is not recoverable at this layer and is never caught inside
     * the library. It is a separate category from Error, which callers are
     * expected to handle.
     */
    class Defect : public std::logic_error {
       public:
        explicit Defect(const std::string& what) : std::logic_error(what) {}
    };
}  // namespace mesh_cpp
