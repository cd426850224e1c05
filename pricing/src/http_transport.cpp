#include "http_transport.hpp"
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>
#include <stdexcept>
#include <utility>

CurlTransport::CurlTransport(int timeout_ms)
    : timeout_ms_(timeout_ms)
{
    if (timeout_ms_ <= 0) {
        throw std::invalid_argument("CurlTransport timeout must be positive");
    }
}

size_t CurlTransport::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

HttpResponse CurlTransport::get(const std::string& url) {
    return perform(url, nullptr);
}

HttpResponse CurlTransport::post_json(const std::string& url, const std::string& body) {
    return perform(url, &body);
}

HttpResponse CurlTransport::perform(const std::string& url, const std::string* post_body) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
    headers.reset(curl_slist_append(headers.release(), "Accept: application/json"));

    std::string response_string;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    if (post_body) {
        headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw std::runtime_error(fmt::format("HTTP request to {} failed: {}", url, curl_easy_strerror(res)));
    }

    HttpResponse response;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    response.body = std::move(response_string);
    return response;
}
