#include "http_client.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <memory>
#include <string_view>

namespace {
    size_t write_body(void* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* body = static_cast<std::string*>(userdata);
        size_t bytes = size * nmemb;
        body->append(static_cast<char*>(ptr), bytes);
        return bytes;
    }

    // Keeps the reason phrase of the last status line seen, redirects included
    size_t read_status_line(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* reason = static_cast<std::string*>(userdata);
        size_t bytes = size * nitems;
        std::string_view line(buffer, bytes);
        if (line.rfind("HTTP/", 0) == 0) {
            size_t code_start = line.find(' ');
            size_t reason_start = code_start == std::string_view::npos ? code_start : line.find(' ', code_start + 1);
            *reason = reason_start == std::string_view::npos ? "" : trim(line.substr(reason_start + 1));
        }
        return bytes;
    }

    // Aborts the transfer once the token is cancelled
    int cancel_callback(void* clientp, [[maybe_unused]] curl_off_t dltotal, [[maybe_unused]] curl_off_t dlnow,
                        [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
        const auto* token = static_cast<const CancellationToken*>(clientp);
        return token->is_cancelled() ? 1 : 0;
    }

    // Custom deleter for the CURL handle
    struct CurlDeleter {
        void operator()(CURL* curl) const {
            if (curl) {
                curl_easy_cleanup(curl);
            }
        }
    };
    using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
}

std::string HttpResponse::status() const {
    return reason.empty() ? std::to_string(status_code) : std::to_string(status_code) + " " + reason;
}

CurlTransport::CurlTransport(long timeout_ms) : timeout_ms_(timeout_ms) {}

HttpResponse CurlTransport::get(const std::string& url, const CancellationToken& token) {
    if (token.is_cancelled()) {
        throw TransportException(string_format("error.request_cancelled", url), true);
    }

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw TransportException(string_format("error.curl_init_failed", url));
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, read_status_line);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.reason);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "cdnsnip/" CDNSNIP_VERSION);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, cancel_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &token);

    log_debug(string_format("debug.http_get", url));
    CURLcode res = curl_easy_perform(curl.get());

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw TransportException(string_format("error.request_cancelled", url), true);
    }
    if (res != CURLE_OK) {
        throw TransportException(string_format("error.transport_failed", url, curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

CurlGlobalInitializer::CurlGlobalInitializer() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlGlobalInitializer::~CurlGlobalInitializer() {
    curl_global_cleanup();
}
