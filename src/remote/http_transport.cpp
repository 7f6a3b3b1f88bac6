#include "remote/http_transport.hpp"

#include <cstdio>

#include "core/version.hpp"

#ifdef BLASTBRIDGE_ENABLE_REMOTE
#include <chrono>
#include <thread>
#include <curl/curl.h>
#endif

namespace blastbridge {

bool is_retryable_http_status(long status_code) {
    return status_code == 429 || status_code == 502 || status_code == 503 ||
           status_code == 504;
}

std::string url_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

CurlHttpTransport::CurlHttpTransport(const CurlTransportOptions& opts)
    : opts_(opts) {}

bool CurlHttpTransport::post_form(const std::string& url, const std::string& body,
                                  HttpResponse& resp, std::string& error_msg) {
    return perform(url, &body, resp, error_msg);
}

bool CurlHttpTransport::get(const std::string& url, HttpResponse& resp,
                            std::string& error_msg) {
    return perform(url, nullptr, resp, error_msg);
}

#ifdef BLASTBRIDGE_ENABLE_REMOTE

// libcurl write callback: append received data to a std::string.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buf = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buf->append(ptr, total);
    return total;
}

bool CurlHttpTransport::perform(const std::string& url, const std::string* post_body,
                                HttpResponse& resp, std::string& error_msg) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        error_msg = "curl_easy_init failed";
        return false;
    }

    std::string user_agent = std::string("blastbridge/") + BLASTBRIDGE_VERSION;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(opts_.timeout_sec));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    if (post_body) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }

    uint32_t backoff_ms = opts_.initial_backoff_ms;

    for (uint32_t attempt = 0; attempt <= opts_.retries; attempt++) {
        resp.body.clear();
        resp.status = 0;
        CURLcode res = curl_easy_perform(curl);

        if (res != CURLE_OK) {
            error_msg = std::string("HTTP request failed: ") + curl_easy_strerror(res);
            if (attempt < opts_.retries) {
                std::fprintf(stderr, "[WARN] %s; retrying in %u ms (attempt %u/%u)\n",
                             error_msg.c_str(), backoff_ms, attempt + 1, opts_.retries);
                std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
                backoff_ms *= 2;
                continue;
            }
            curl_easy_cleanup(curl);
            return false;
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);

        if (is_retryable_http_status(resp.status) && attempt < opts_.retries) {
            std::fprintf(stderr, "[WARN] HTTP %ld, retrying in %u ms (attempt %u/%u)\n",
                         resp.status, backoff_ms, attempt + 1, opts_.retries);
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms *= 2;
            continue;
        }

        curl_easy_cleanup(curl);
        return true;
    }

    curl_easy_cleanup(curl);
    return true;
}

#else

bool CurlHttpTransport::perform(const std::string& url, const std::string*,
                                HttpResponse& resp, std::string& error_msg) {
    resp = HttpResponse{};
    error_msg = "remote search support not compiled in (cannot reach " + url + ")";
    return false;
}

#endif

} // namespace blastbridge
