/**
 * @file    http_client.cpp
 * @brief   HTTP Client Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.10.14
 * @license MIT
 */

#include "utils/http_client.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace wit {

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

// curl_global_init is not thread-safe; run it once before the first handle
void ensure_curl_global_init() {
    static const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw std::runtime_error("curl_global_init() failed");
    }
}

}  // namespace

HttpClient::HttpClient(std::chrono::seconds timeout)
    : timeout_(timeout) {}

HttpResponse HttpClient::get(const std::string& url,
                             const std::vector<std::string>& headers,
                             std::chrono::milliseconds timeout) const {
    return perform(url, nullptr, headers, timeout);
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers,
                              std::chrono::milliseconds timeout) const {
    return perform(url, &body, headers, timeout);
}

std::chrono::milliseconds HttpClient::effective_timeout(std::chrono::milliseconds timeout) const noexcept {
    const auto client_wide = std::chrono::duration_cast<std::chrono::milliseconds>(timeout_);
    if (timeout.count() <= 0) {
        return client_wide;
    }
    if (client_wide.count() <= 0) {
        return timeout;
    }
    return std::min(client_wide, timeout);
}

HttpResponse HttpClient::perform(const std::string& url,
                                 const std::string* body,
                                 const std::vector<std::string>& headers,
                                 std::chrono::milliseconds timeout) const {
    ensure_curl_global_init();

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw std::runtime_error("Failed to initialize curl");
    }

    curl_slist* raw_list = nullptr;
    for (const auto& h : headers) {
        curl_slist* next = curl_slist_append(raw_list, h.c_str());
        if (!next) {
            curl_slist_free_all(raw_list);
            throw std::runtime_error("Failed to build request headers");
        }
        raw_list = next;
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                     static_cast<long>(effective_timeout(timeout).count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }
    if (body) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(body->size()));
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("HTTP request failed: ") + curl_easy_strerror(res));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    spdlog::debug("{} {} -> {} ({} bytes)", body ? "POST" : "GET", url,
                  response.status, response.body.size());
    return response;
}

}  // namespace wit
