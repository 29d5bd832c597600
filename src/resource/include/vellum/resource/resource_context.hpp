#pragma once

#include "vellum/cache/memory_pressure.hpp"
#include "vellum/core/event_loop.hpp"
#include "vellum/gpu/texture_pool.hpp"
#include "vellum/network/decoder.hpp"
#include "vellum/network/transport.hpp"

namespace vellum::resource {

/**
 * Collaborators shared by the resource subsystem. Everything referenced
 * here must outlive the managers constructed from it.
 */
struct ResourceContext {
    EventLoop& loop;
    network::Transport& transport;
    const network::DecoderRegistry& decoders;
    cache::MemoryPressureSource& memory_pressure;

    // Decoded images are uploaded here when set
    gpu::TexturePool* texture_pool{nullptr};
};

} // namespace vellum::resource
