#include "vellum/gpu/gpu_context.hpp"

namespace vellum::gpu {

namespace {

constexpr u32 ZERO = 0;
constexpr u32 ONE = 1;
constexpr u32 SRC_ALPHA = 0x0302;
constexpr u32 ONE_MINUS_SRC_ALPHA = 0x0303;
constexpr u32 DST_COLOR = 0x0306;
constexpr u32 ONE_MINUS_DST_COLOR = 0x0307;

} // anonymous namespace

std::string_view to_string(BlendMode mode) {
    switch (mode) {
        case BlendMode::Normal: return "normal";
        case BlendMode::Add: return "add";
        case BlendMode::Multiply: return "multiply";
        case BlendMode::Screen: return "screen";
    }
    return "unknown";
}

BlendFunc blend_func(BlendMode mode) {
    switch (mode) {
        case BlendMode::Normal: return {SRC_ALPHA, ONE_MINUS_SRC_ALPHA};
        case BlendMode::Add: return {SRC_ALPHA, ONE};
        case BlendMode::Multiply: return {DST_COLOR, ZERO};
        case BlendMode::Screen: return {ONE_MINUS_DST_COLOR, ONE};
    }
    return {SRC_ALPHA, ONE_MINUS_SRC_ALPHA};
}

} // namespace vellum::gpu
