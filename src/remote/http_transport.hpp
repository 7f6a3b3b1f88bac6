#pragma once

#include <cstdint>
#include <string>

#include "core/config.hpp"

namespace blastbridge {

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Minimal HTTP client seam used by the remote backend.
// Returns false when no HTTP response was obtained (connection, DNS,
// timeout); any HTTP status, including errors, returns true.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // POST an application/x-www-form-urlencoded body.
    virtual bool post_form(const std::string& url, const std::string& body,
                           HttpResponse& resp, std::string& error_msg) = 0;

    virtual bool get(const std::string& url, HttpResponse& resp,
                     std::string& error_msg) = 0;
};

struct CurlTransportOptions {
    uint32_t timeout_sec = REMOTE_HTTP_TIMEOUT_SEC;
    uint32_t retries = REMOTE_HTTP_RETRIES;  // extra attempts on 429/503/transport errors
    uint32_t initial_backoff_ms = 1000;      // doubled after each retry
};

// libcurl implementation. Without BLASTBRIDGE_ENABLE_REMOTE every call
// fails with a "not compiled in" message.
class CurlHttpTransport : public HttpTransport {
public:
    explicit CurlHttpTransport(const CurlTransportOptions& opts = CurlTransportOptions());

    bool post_form(const std::string& url, const std::string& body,
                   HttpResponse& resp, std::string& error_msg) override;
    bool get(const std::string& url, HttpResponse& resp,
             std::string& error_msg) override;

private:
    CurlTransportOptions opts_;

    bool perform(const std::string& url, const std::string* post_body,
                 HttpResponse& resp, std::string& error_msg);
};

bool is_retryable_http_status(long status_code);

// Percent-encode for a form body or query string (space -> "+").
std::string url_encode(const std::string& s);

} // namespace blastbridge
