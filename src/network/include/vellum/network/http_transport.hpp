#pragma once

#include "transport.hpp"
#include <memory>
#include <string>

namespace vellum::network {

/**
 * libcurl transport. Each fetch runs a blocking transfer on a worker
 * thread; the response, body chunks and failures are marshalled back to
 * the event loop with EventLoop::post_external(). Cancelling the token
 * aborts the transfer from its progress callback.
 */
class HttpTransport : public Transport {
public:
    explicit HttpTransport(EventLoop& loop);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    void fetch(const FetchRequest& request, CancellationToken token,
               FetchCallback callback) override;

    void set_user_agent(const std::string& user_agent);
    void set_default_headers(const HttpHeaders& headers);

    // Number of transfers still running on worker threads
    [[nodiscard]] usize active_transfers() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace vellum::network
