#pragma once

namespace vellum {

// Capability for values that own GPU or other external resources
class Disposable {
public:
    virtual ~Disposable() = default;
    virtual void dispose() = 0;
    [[nodiscard]] virtual bool is_disposed() const = 0;
};

} // namespace vellum
