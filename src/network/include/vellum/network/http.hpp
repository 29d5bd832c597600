#pragma once

#include "vellum/core/error.hpp"
#include "vellum/core/types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vellum::network {

// ============================================================================
// HTTP Headers
// ============================================================================

// Ordered header list with case-insensitive names
class HttpHeaders {
public:
    HttpHeaders() = default;
    HttpHeaders(std::initializer_list<std::pair<std::string, std::string>> entries);

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    // Copies every header of other, replacing same-named ones
    void merge(const HttpHeaders& other);

    [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> get_all(const std::string& name) const;
    [[nodiscard]] bool has(const std::string& name) const;
    [[nodiscard]] usize size() const { return m_headers.size(); }
    [[nodiscard]] bool empty() const { return m_headers.empty(); }

    [[nodiscard]] auto begin() const { return m_headers.begin(); }
    [[nodiscard]] auto end() const { return m_headers.end(); }

private:
    std::vector<std::pair<std::string, std::string>> m_headers;
};

// ============================================================================
// Request
// ============================================================================

enum class Credentials : u8 {
    Omit,
    SameOrigin,
    Include,
};

[[nodiscard]] std::string_view to_string(Credentials credentials);

struct FetchRequest {
    std::string url;
    HttpHeaders headers;
    Credentials credentials{Credentials::SameOrigin};

    // Transport-level timeout in milliseconds (0 = none)
    u32 timeout_ms{0};
};

// ============================================================================
// Response body
// ============================================================================

// A chunk of body bytes, or nullopt once the body is exhausted
using BodyChunk = std::optional<std::vector<u8>>;
using ChunkCallback = std::function<void(ResourceResult<BodyChunk>)>;

/**
 * Sequential reader over a response body. read() delivers exactly one
 * chunk (or end of body, or an error) per call, always from the event loop
 * that owns the request. Only one read may be outstanding at a time.
 */
class BodyReader {
public:
    virtual ~BodyReader() = default;
    virtual void read(ChunkCallback callback) = 0;
};

// ============================================================================
// Response
// ============================================================================

struct FetchResponse {
    i32 status{0};
    std::string status_text;
    HttpHeaders headers;
    std::shared_ptr<BodyReader> body;

    [[nodiscard]] bool ok() const { return status >= 200 && status < 300; }

    // Parsed Content-Length, 0 when absent or malformed
    [[nodiscard]] usize content_length() const;
};

[[nodiscard]] std::string_view status_text_for(i32 status);

} // namespace vellum::network
