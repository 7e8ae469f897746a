#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <scorekeeper/errors.hh>
#include <scorekeeper/sync/http_client.hh>
#include <sklib/concat_tostr.hh>

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

// Discards the response body
size_t discard_body(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

} // namespace

namespace scorekeeper::sync {

CurlHttpClient::CurlHttpClient() {
    static std::once_flag global_init;
    std::call_once(global_init, [] {
        if (auto rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK) {
            throw SyncDeliveryError("curl_global_init() failed: ", curl_easy_strerror(rc));
        }
    });
}

long CurlHttpClient::post_json(
    const std::string& url,
    const HttpHeaders& headers,
    const std::string& json_body,
    std::chrono::milliseconds timeout
) {
    std::unique_ptr<CURL, CurlEasyDeleter> curl{curl_easy_init()};
    if (not curl) {
        throw SyncDeliveryError("POST ", url, ": curl_easy_init() failed");
    }

    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list;
    auto append_header = [&](const std::string& header) {
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (appended == nullptr) {
            throw SyncDeliveryError("POST ", url, ": curl_slist_append() failed");
        }
        (void)header_list.release();
        header_list.reset(appended);
    };
    append_header("Content-Type: application/json");
    for (const auto& [name, value] : headers) {
        append_header(concat_tostr(name, ": ", value));
    }

    CURL* handle = curl.get();
    (void)curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    (void)curl_easy_setopt(handle, CURLOPT_USERAGENT, "scorekeeper-sync/1.0");
    (void)curl_easy_setopt(handle, CURLOPT_POST, 1L);
    (void)curl_easy_setopt(handle, CURLOPT_POSTFIELDS, json_body.c_str());
    (void)curl_easy_setopt(
        handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(json_body.size())
    );
    (void)curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    (void)curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, discard_body);
    (void)curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    (void)curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L); // called from the worker thread

    if (CURLcode rc = curl_easy_perform(handle); rc != CURLE_OK) {
        throw SyncDeliveryError("POST ", url, ": ", curl_easy_strerror(rc));
    }

    long status = 0;
    (void)curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    return status;
}

} // namespace scorekeeper::sync
