#pragma once

#include <string>

struct HttpResponse {
    long status = 0;
    std::string body;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Throws std::runtime_error when no response was received
    virtual HttpResponse get(const std::string& url) = 0;
    virtual HttpResponse post_json(const std::string& url, const std::string& body) = 0;
};

// libcurl transport. Each request uses its own easy handle, so one instance
// may be shared by every worker thread.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(int timeout_ms = 8000);

    HttpResponse get(const std::string& url) override;
    HttpResponse post_json(const std::string& url, const std::string& body) override;

private:
    int timeout_ms_;

    HttpResponse perform(const std::string& url, const std::string* post_body);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
