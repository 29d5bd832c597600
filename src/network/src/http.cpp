#include "vellum/network/http.hpp"
#include "vellum/network/transport.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace vellum::network {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

// ============================================================================
// HttpHeaders implementation
// ============================================================================

HttpHeaders::HttpHeaders(std::initializer_list<std::pair<std::string, std::string>> entries) {
    for (const auto& [name, value] : entries) {
        set(name, value);
    }
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    remove(name);
    m_headers.emplace_back(name, value);
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    m_headers.emplace_back(name, value);
}

void HttpHeaders::remove(const std::string& name) {
    m_headers.erase(std::remove_if(m_headers.begin(), m_headers.end(),
        [&name](const auto& entry) { return iequals(entry.first, name); }), m_headers.end());
}

void HttpHeaders::merge(const HttpHeaders& other) {
    for (const auto& [name, value] : other) {
        remove(name);
    }
    for (const auto& [name, value] : other) {
        add(name, value);
    }
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    for (const auto& [key, value] : m_headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::vector<std::string> HttpHeaders::get_all(const std::string& name) const {
    std::vector<std::string> values;
    for (const auto& [key, value] : m_headers) {
        if (iequals(key, name)) {
            values.push_back(value);
        }
    }
    return values;
}

bool HttpHeaders::has(const std::string& name) const {
    return get(name).has_value();
}

// ============================================================================
// Request / response helpers
// ============================================================================

std::string_view to_string(Credentials credentials) {
    switch (credentials) {
        case Credentials::Omit: return "omit";
        case Credentials::SameOrigin: return "same-origin";
        case Credentials::Include: return "include";
    }
    return "same-origin";
}

usize FetchResponse::content_length() const {
    auto header = headers.get("Content-Length");
    if (!header) {
        return 0;
    }
    usize length = 0;
    const char* first = header->data();
    const char* last = first + header->size();
    while (first < last && std::isspace(static_cast<unsigned char>(*first))) {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, length);
    if (ec != std::errc() || ptr == first) {
        return 0;
    }
    return length;
}

std::string_view status_text_for(i32 status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 408: return "Request Timeout";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

// ============================================================================
// MemoryBodyReader implementation
// ============================================================================

MemoryBodyReader::MemoryBodyReader(EventLoop& loop, std::deque<std::vector<u8>> chunks,
                                   CancellationToken token)
    : m_loop(loop)
    , m_chunks(std::move(chunks))
    , m_token(std::move(token)) {}

void MemoryBodyReader::read(ChunkCallback callback) {
    if (m_token.is_cancelled()) {
        m_loop.post([cb = std::move(callback)] {
            cb(make_error(ResourceError::cancelled()));
        });
        return;
    }

    BodyChunk chunk;
    if (!m_chunks.empty()) {
        chunk = std::move(m_chunks.front());
        m_chunks.pop_front();
    }
    m_loop.post([cb = std::move(callback), chunk = std::move(chunk)]() mutable {
        cb(ResourceResult<BodyChunk>(std::move(chunk)));
    });
}

} // namespace vellum::network
