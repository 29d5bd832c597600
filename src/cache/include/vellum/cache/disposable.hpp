#pragma once

#include "vellum/core/disposable.hpp"
#include <memory>
#include <type_traits>

namespace vellum::cache {

// Calls dispose() when the pointed-to value exposes the capability
template<typename T>
bool dispose_if_capable(const std::shared_ptr<T>& value) {
    if (!value) {
        return false;
    }
    if constexpr (std::is_base_of_v<Disposable, T>) {
        value->dispose();
        return true;
    } else if constexpr (std::is_polymorphic_v<T>) {
        if (auto* disposable = dynamic_cast<Disposable*>(value.get())) {
            disposable->dispose();
            return true;
        }
    }
    return false;
}

template<typename T>
bool exposes_dispose(const std::shared_ptr<T>& value) {
    if (!value) {
        return false;
    }
    if constexpr (std::is_base_of_v<Disposable, T>) {
        return true;
    } else if constexpr (std::is_polymorphic_v<T>) {
        return dynamic_cast<Disposable*>(value.get()) != nullptr;
    } else {
        return false;
    }
}

} // namespace vellum::cache
