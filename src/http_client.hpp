#pragma once

#include "cancellation.hpp"

#include <string>

struct HttpResponse {
    long status_code = 0;
    std::string reason; // reason phrase of the final status line, empty for HTTP/2
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
    // "404 Not Found", or just "404" when no reason phrase was sent
    std::string status() const;
};

// Blocking GET transport. Implementations throw TransportException when no response was received.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const std::string& url, const CancellationToken& token) = 0;
};

class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeout_ms);

    HttpResponse get(const std::string& url, const CancellationToken& token) override;

private:
    long timeout_ms_;
};

// RAII for curl global init/cleanup
struct CurlGlobalInitializer {
    CurlGlobalInitializer();
    ~CurlGlobalInitializer();
    CurlGlobalInitializer(const CurlGlobalInitializer&) = delete;
    CurlGlobalInitializer& operator=(const CurlGlobalInitializer&) = delete;
};
