#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <scorekeeper/sync/http_client.hh>
#include <string>
#include <vector>

struct RecordedRequest {
    std::string url;
    scorekeeper::sync::HttpHeaders headers;
    std::string body;
    std::chrono::milliseconds timeout;
};

// Shared between a test and the FakeHttpClient owned by the dispatcher
class RequestLog {
    std::mutex mtx_;
    std::vector<RecordedRequest> requests_;
    // Decides the response status, may throw to simulate failures
    std::function<long(const RecordedRequest&)> responder_ = [](const RecordedRequest&) {
        return 200L;
    };

public:
    void set_responder(std::function<long(const RecordedRequest&)> responder) {
        std::lock_guard guard(mtx_);
        responder_ = std::move(responder);
    }

    long record(RecordedRequest req) {
        std::function<long(const RecordedRequest&)> responder;
        {
            std::lock_guard guard(mtx_);
            requests_.emplace_back(req);
            responder = responder_;
        }
        return responder(req);
    }

    std::vector<RecordedRequest> requests() {
        std::lock_guard guard(mtx_);
        return requests_;
    }
};

class FakeHttpClient final : public scorekeeper::sync::HttpClient {
    std::shared_ptr<RequestLog> log_;

public:
    explicit FakeHttpClient(std::shared_ptr<RequestLog> log)
    : log_(std::move(log)) {}

    long post_json(
        const std::string& url,
        const scorekeeper::sync::HttpHeaders& headers,
        const std::string& json_body,
        std::chrono::milliseconds timeout
    ) override {
        return log_->record({.url = url, .headers = headers, .body = json_body, .timeout = timeout}
        );
    }
};
