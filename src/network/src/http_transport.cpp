/**
 * libcurl transport implementation
 */

#include "vellum/network/http_transport.hpp"
#include "vellum/core/logger.hpp"
#include <atomic>
#include <curl/curl.h>
#include <deque>
#include <mutex>
#include <thread>

namespace vellum::network {

namespace {

Logger& log() {
    return logging::get("loader");
}

// Loop-thread side of a streaming body
struct StreamState {
    std::deque<std::vector<u8>> chunks;
    bool finished{false};
    std::optional<ResourceError> error;
    ChunkCallback pending;
};

// Hands the next chunk, the end marker or the error to a waiting reader
void deliver(const std::shared_ptr<StreamState>& stream) {
    if (!stream->pending) {
        return;
    }
    if (!stream->chunks.empty()) {
        auto callback = std::move(stream->pending);
        stream->pending = nullptr;
        auto chunk = std::move(stream->chunks.front());
        stream->chunks.pop_front();
        callback(ResourceResult<BodyChunk>(BodyChunk(std::move(chunk))));
    } else if (stream->error) {
        auto callback = std::move(stream->pending);
        stream->pending = nullptr;
        callback(make_error(*stream->error));
    } else if (stream->finished) {
        auto callback = std::move(stream->pending);
        stream->pending = nullptr;
        callback(ResourceResult<BodyChunk>(BodyChunk()));
    }
}

class StreamBodyReader : public BodyReader {
public:
    StreamBodyReader(EventLoop& loop, std::shared_ptr<StreamState> stream)
        : m_loop(loop), m_stream(std::move(stream)) {}

    void read(ChunkCallback callback) override {
        m_stream->pending = std::move(callback);
        m_loop.post([stream = m_stream] { deliver(stream); });
    }

private:
    EventLoop& m_loop;
    std::shared_ptr<StreamState> m_stream;
};

// Worker-thread side of one transfer
struct Transfer {
    EventLoop* loop{nullptr};
    FetchRequest request;
    std::shared_ptr<std::atomic<bool>> aborted;
    std::shared_ptr<StreamState> stream;
    FetchCallback callback;
    CURL* curl{nullptr};

    i32 status{0};
    std::string status_text;
    HttpHeaders headers;
    bool response_posted{false};

    void post_response() {
        if (response_posted) {
            return;
        }
        response_posted = true;

        long status_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

        FetchResponse response;
        response.status = static_cast<i32>(status_code);
        response.status_text = status_text.empty()
            ? std::string(status_text_for(response.status)) : status_text;
        response.headers = headers;
        response.body = std::make_shared<StreamBodyReader>(*loop, stream);

        loop->post_external([cb = std::move(callback), response = std::move(response)]() mutable {
            cb(ResourceResult<FetchResponse>(std::move(response)));
        });
        callback = nullptr;
    }

    void post_failure(ResourceError error) {
        if (!response_posted) {
            response_posted = true;
            loop->post_external([cb = std::move(callback), error = std::move(error)] {
                cb(make_error(error));
            });
            callback = nullptr;
            return;
        }
        loop->post_external([stream = stream, error = std::move(error)] {
            stream->error = error;
            deliver(stream);
        });
    }

    void post_finished() {
        post_response();
        loop->post_external([stream = stream] {
            stream->finished = true;
            deliver(stream);
        });
    }
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    size_t total = size * nmemb;

    transfer->post_response();
    std::vector<u8> chunk(reinterpret_cast<u8*>(ptr), reinterpret_cast<u8*>(ptr) + total);
    transfer->loop->post_external([stream = transfer->stream, chunk = std::move(chunk)]() mutable {
        stream->chunks.push_back(std::move(chunk));
        deliver(stream);
    });
    return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    size_t total = size * nitems;

    std::string line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.rfind("HTTP/", 0) == 0) {
        transfer->headers = HttpHeaders();
        transfer->status_text.clear();
        usize code_start = line.find(' ');
        if (code_start != std::string::npos) {
            usize text_start = line.find(' ', code_start + 1);
            if (text_start != std::string::npos) {
                transfer->status_text = line.substr(text_start + 1);
            }
        }
        return total;
    }

    usize colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.erase(value.begin());
        }
        transfer->headers.add(name, value);
    }
    return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* transfer = static_cast<Transfer*>(userdata);
    return transfer->aborted->load() ? 1 : 0;
}

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // anonymous namespace

// ============================================================================
// HttpTransport implementation
// ============================================================================

struct HttpTransport::Impl {
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
        std::shared_ptr<std::atomic<bool>> aborted;
    };

    explicit Impl(EventLoop& event_loop) : loop(event_loop) {}

    void reap_finished() {
        std::lock_guard lock(mutex);
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->done->load()) {
                it->thread.join();
                it = workers.erase(it);
            } else {
                ++it;
            }
        }
    }

    EventLoop& loop;
    mutable std::mutex mutex;
    std::vector<Worker> workers;
    std::string user_agent{"Vellum/1.0"};
    HttpHeaders default_headers;
};

namespace {

void run_transfer(Transfer& transfer, const std::string& user_agent) {
    transfer.curl = curl_easy_init();
    if (!transfer.curl) {
        transfer.post_failure(ResourceError::transient("CURL not initialized"));
        return;
    }

    CURL* curl = transfer.curl;
    const FetchRequest& request = transfer.request;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string header = name + ": " + value;
        headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    if (request.credentials == Credentials::Include) {
        // Enables the cookie engine without reading a cookie file
        curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    if (request.timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    }

    CURLcode res = curl_easy_perform(curl);

    if (headers) {
        curl_slist_free_all(headers);
    }

    if (transfer.aborted->load()) {
        transfer.post_failure(ResourceError::cancelled());
    } else if (res != CURLE_OK) {
        transfer.post_failure(ResourceError::transient(
            request.url + ": " + curl_easy_strerror(res)));
    } else {
        transfer.post_finished();
    }

    curl_easy_cleanup(curl);
    transfer.curl = nullptr;
}

} // anonymous namespace

HttpTransport::HttpTransport(EventLoop& loop) : m_impl(std::make_unique<Impl>(loop)) {
    ensure_curl_initialized();
}

HttpTransport::~HttpTransport() {
    std::vector<Impl::Worker> workers;
    {
        std::lock_guard lock(m_impl->mutex);
        workers.swap(m_impl->workers);
    }
    for (auto& worker : workers) {
        worker.aborted->store(true);
    }
    for (auto& worker : workers) {
        worker.thread.join();
    }
}

void HttpTransport::fetch(const FetchRequest& request, CancellationToken token,
                          FetchCallback callback) {
    m_impl->reap_finished();

    if (token.is_cancelled()) {
        m_impl->loop.post([cb = std::move(callback)] {
            cb(make_error(ResourceError::cancelled()));
        });
        return;
    }

    auto transfer = std::make_shared<Transfer>();
    transfer->loop = &m_impl->loop;
    transfer->request = request;
    transfer->aborted = std::make_shared<std::atomic<bool>>(false);
    transfer->stream = std::make_shared<StreamState>();
    transfer->callback = std::move(callback);

    token.on_cancel([aborted = transfer->aborted] { aborted->store(true); });

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::string user_agent;
    {
        std::lock_guard lock(m_impl->mutex);
        user_agent = m_impl->user_agent;
        transfer->request.headers = m_impl->default_headers;
    }
    transfer->request.headers.merge(request.headers);

    log().debug_fmt("GET {}", request.url);

    std::thread thread([transfer, done, user_agent] {
        run_transfer(*transfer, user_agent);
        done->store(true);
    });

    std::lock_guard lock(m_impl->mutex);
    m_impl->workers.push_back({std::move(thread), done, transfer->aborted});
}

void HttpTransport::set_user_agent(const std::string& user_agent) {
    std::lock_guard lock(m_impl->mutex);
    m_impl->user_agent = user_agent;
}

void HttpTransport::set_default_headers(const HttpHeaders& headers) {
    std::lock_guard lock(m_impl->mutex);
    m_impl->default_headers = headers;
}

usize HttpTransport::active_transfers() const {
    std::lock_guard lock(m_impl->mutex);
    usize active = 0;
    for (const auto& worker : m_impl->workers) {
        if (!worker.done->load()) {
            ++active;
        }
    }
    return active;
}

} // namespace vellum::network
