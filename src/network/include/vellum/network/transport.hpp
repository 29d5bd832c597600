#pragma once

#include "http.hpp"
#include "vellum/core/cancellation.hpp"
#include "vellum/core/event_loop.hpp"
#include <deque>
#include <functional>

namespace vellum::network {

using FetchCallback = std::function<void(ResourceResult<FetchResponse>)>;

/**
 * Fetch capability consumed by the resource loader.
 *
 * fetch() must invoke the callback exactly once, on the event loop thread,
 * with either a response (whose headers are complete and whose body may
 * still be streaming) or an error. Cancelling the token aborts the request;
 * a cancelled request fails with ResourceErrorKind::Cancelled.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual void fetch(const FetchRequest& request, CancellationToken token,
                       FetchCallback callback) = 0;
};

// ============================================================================
// In-memory body
// ============================================================================

/**
 * BodyReader over chunks that are already in memory. Each read is delivered
 * as a microtask; cancellation fails the next read.
 */
class MemoryBodyReader : public BodyReader {
public:
    MemoryBodyReader(EventLoop& loop, std::deque<std::vector<u8>> chunks,
                     CancellationToken token = {});

    void read(ChunkCallback callback) override;

private:
    EventLoop& m_loop;
    std::deque<std::vector<u8>> m_chunks;
    CancellationToken m_token;
};

} // namespace vellum::network
