#pragma once

#include "vellum/network/transport.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vellum::test_support {

// Scripted transport; replies per URL are consumed in order and the last
// one repeats. URLs without a script answer 404.
class FakeTransport : public network::Transport {
public:
    struct Reply {
        i32 status{200};
        network::HttpHeaders headers;
        std::vector<std::string> chunks;
        std::optional<ResourceError> error;
        bool hang{false};
        f64 delay_ms{0.0};
        bool content_length{true};
    };

    explicit FakeTransport(EventLoop& loop) : m_loop(loop) {}

    void respond(const std::string& url, Reply reply) {
        m_replies[url].push_back(std::move(reply));
    }

    void respond_body(const std::string& url, std::vector<std::string> chunks, i32 status = 200) {
        Reply reply;
        reply.status = status;
        reply.chunks = std::move(chunks);
        respond(url, std::move(reply));
    }

    void respond_status(const std::string& url, i32 status) {
        Reply reply;
        reply.status = status;
        respond(url, std::move(reply));
    }

    void respond_hang(const std::string& url) {
        Reply reply;
        reply.hang = true;
        respond(url, std::move(reply));
    }

    void fetch(const network::FetchRequest& request, CancellationToken token,
               network::FetchCallback callback) override {
        requests.push_back(request);
        Reply reply = next_reply(request.url);

        // Shared so that a cancellation and a late reply answer at most once
        auto pending = std::make_shared<network::FetchCallback>(std::move(callback));
        auto cancelled = [this, pending] {
            if (*pending) {
                ++cancelled_count;
                auto cb = std::move(*pending);
                *pending = nullptr;
                m_loop.post([cb] { cb(make_error(ResourceError::cancelled())); });
            }
        };
        token.on_cancel(cancelled);

        if (reply.hang) {
            return;
        }

        auto answer = [this, pending, reply, token] {
            if (!*pending) {
                return;
            }
            auto cb = std::move(*pending);
            *pending = nullptr;
            if (reply.error) {
                cb(make_error(*reply.error));
                return;
            }

            network::FetchResponse response;
            response.status = reply.status;
            response.status_text = std::string(network::status_text_for(reply.status));
            response.headers = reply.headers;

            std::deque<std::vector<u8>> chunks;
            usize length = 0;
            for (const auto& chunk : reply.chunks) {
                chunks.emplace_back(chunk.begin(), chunk.end());
                length += chunk.size();
            }
            if (reply.content_length && !response.headers.has("Content-Length")) {
                response.headers.set("Content-Length", std::to_string(length));
            }
            response.body = std::make_shared<network::MemoryBodyReader>(
                m_loop, std::move(chunks), token);
            cb(std::move(response));
        };

        if (reply.delay_ms > 0.0) {
            m_loop.schedule(reply.delay_ms, answer);
        } else {
            m_loop.post(answer);
        }
    }

    [[nodiscard]] usize request_count(const std::string& url) const {
        usize count = 0;
        for (const auto& request : requests) {
            if (request.url == url) {
                ++count;
            }
        }
        return count;
    }

    std::vector<network::FetchRequest> requests;
    usize cancelled_count{0};

private:
    Reply next_reply(const std::string& url) {
        auto it = m_replies.find(url);
        if (it == m_replies.end() || it->second.empty()) {
            Reply missing;
            missing.status = 404;
            return missing;
        }
        auto& queue = it->second;
        Reply reply = queue.front();
        if (queue.size() > 1) {
            queue.erase(queue.begin());
        }
        return reply;
    }

    EventLoop& m_loop;
    std::map<std::string, std::vector<Reply>> m_replies;
};

} // namespace vellum::test_support
