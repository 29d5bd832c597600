#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace vellum {

// ============================================================================
// Error taxonomy
// ============================================================================

enum class ResourceErrorKind : u8 {
    TransientIO,    // network failure, timeout, undecodable payload; retried
    Capacity,       // pool or cache still full after cleanup
    Configuration,  // unsupported type, malformed parameters
    Cancelled,      // cooperative cancellation
};

[[nodiscard]] constexpr std::string_view to_string(ResourceErrorKind kind) {
    switch (kind) {
        case ResourceErrorKind::TransientIO: return "TransientIOError";
        case ResourceErrorKind::Capacity: return "CapacityError";
        case ResourceErrorKind::Configuration: return "ConfigurationError";
        case ResourceErrorKind::Cancelled: return "CancellationError";
    }
    return "UnknownError";
}

struct ResourceError {
    ResourceErrorKind kind{ResourceErrorKind::TransientIO};
    std::string message;
    i32 status{0};  // HTTP status when the failure came from a response

    [[nodiscard]] bool is_retryable() const {
        return kind == ResourceErrorKind::TransientIO;
    }

    [[nodiscard]] bool is_cancelled() const {
        return kind == ResourceErrorKind::Cancelled;
    }

    [[nodiscard]] std::string describe() const {
        std::string text(to_string(kind));
        text += ": ";
        text += message;
        return text;
    }

    static ResourceError transient(std::string message, i32 status = 0) {
        return {ResourceErrorKind::TransientIO, std::move(message), status};
    }

    static ResourceError capacity(std::string message) {
        return {ResourceErrorKind::Capacity, std::move(message), 0};
    }

    static ResourceError configuration(std::string message) {
        return {ResourceErrorKind::Configuration, std::move(message), 0};
    }

    static ResourceError cancelled() {
        return {ResourceErrorKind::Cancelled, "Loading cancelled", 0};
    }
};

template<typename T>
using ResourceResult = Result<T, ResourceError>;

// ============================================================================
// Synchronous errors
// ============================================================================

class CapacityError : public std::runtime_error {
public:
    explicit CapacityError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace vellum
