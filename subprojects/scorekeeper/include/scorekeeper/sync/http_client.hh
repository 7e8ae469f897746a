#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace scorekeeper::sync {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

class HttpClient {
public:
    HttpClient() = default;
    HttpClient(const HttpClient&) = delete;
    HttpClient(HttpClient&&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient& operator=(HttpClient&&) = delete;
    virtual ~HttpClient() = default;

    /**
     * @brief POSTs @p json_body to @p url
     * @details The response body is not consumed.
     *
     * @return HTTP status code of the response
     * @errors Throws SyncDeliveryError on transport failure or timeout
     */
    virtual long post_json(
        const std::string& url,
        const HttpHeaders& headers,
        const std::string& json_body,
        std::chrono::milliseconds timeout
    ) = 0;
};

// libcurl-based client, safe to use from the sync worker thread
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();

    long post_json(
        const std::string& url,
        const HttpHeaders& headers,
        const std::string& json_body,
        std::chrono::milliseconds timeout
    ) override;
};

} // namespace scorekeeper::sync
