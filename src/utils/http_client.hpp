/**
 * @file    http_client.hpp
 * @brief   Blocking HTTP(S) requests over libcurl
 * @author  AllenK (Kwyshell)
 * @date    2026.10.14
 * @license MIT
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace wit {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * Thin RAII wrapper: one CURL easy handle per request, so instances can be
 * used from several threads. Transport errors throw std::runtime_error;
 * HTTP error statuses are returned to the caller.
 *
 * A positive per-call `timeout` tightens the client-wide timeout for that
 * request only.
 */
class HttpClient {
public:
    explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(180));

    HttpResponse get(const std::string& url,
                     const std::vector<std::string>& headers = {},
                     std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()) const;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<std::string>& headers = {},
                      std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()) const;

    /**
     * Timeout applied to a request given its per-call limit
     */
    std::chrono::milliseconds effective_timeout(std::chrono::milliseconds timeout) const noexcept;

private:
    std::chrono::seconds timeout_;

    HttpResponse perform(const std::string& url,
                         const std::string* body,
                         const std::vector<std::string>& headers,
                         std::chrono::milliseconds timeout) const;
};

}  // namespace wit
