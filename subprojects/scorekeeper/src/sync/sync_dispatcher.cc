#include <scorekeeper/sync/sync_dispatcher.hh>
#include <sklib/debug.hh>
#include <type_traits>
#include <utility>

namespace scorekeeper::sync {

std::string Credentials::base_url() const { return concat_tostr(sync_url, '/', event_code); }

SyncDispatcher::SyncDispatcher(
    std::unique_ptr<HttpClient> client, std::chrono::milliseconds timeout, size_t queue_limit
)
: client_(std::move(client))
, timeout_(timeout)
, queue_(queue_limit)
, worker_([this] { worker_main(); }) {}

SyncDispatcher::~SyncDispatcher() {
    try {
        stop();
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
    }
}

void SyncDispatcher::signal_credentials_ready() {
    if (not credentials_signaled_.exchange(true)) {
        credentials_ready_.post();
    }
}

void SyncDispatcher::configure(Credentials credentials) {
    if (stopped_) {
        errlog("sync: configure() after stop() ignored");
        return;
    }

    bool accepted = credentials_.perform([&](std::optional<Credentials>& creds) {
        if (creds) {
            return false;
        }
        creds = std::move(credentials);
        return true;
    });
    if (not accepted) {
        errlog("sync: credentials are already configured, ignoring the new ones");
        return;
    }

    signal_credentials_ready();
}

bool SyncDispatcher::is_configured() {
    return credentials_.perform([](const std::optional<Credentials>& creds) {
        return creds.has_value();
    });
}

void SyncDispatcher::enqueue(Message msg) {
    if (stopped_) {
        errlog("sync: message enqueued after stop() ignored");
        return;
    }
    if (queue_.push(std::move(msg))) {
        ++dropped_;
        errlog("sync: queue limit reached, dropped the oldest message");
    }
}

void SyncDispatcher::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    queue_.force_push(Stop{});
    // Without credentials the worker is still waiting for them
    signal_credentials_ready();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SyncDispatcher::post(
    const Credentials& credentials, std::string_view endpoint, const std::string& body
) {
    auto url = concat_tostr(credentials.base_url(), endpoint);
    long status =
        client_->post_json(url, {{"apikey", credentials.apikey}}, body, timeout_);
    stdlog("sync: POST ", url, " -> ", status);
    if (status < 200 or status > 299) {
        throw SyncDeliveryError("POST ", url, " -> HTTP ", status);
    }
}

void SyncDispatcher::process_messages(const Credentials& credentials) {
    for (;;) {
        auto msg = queue_.pop();
        if (std::holds_alternative<Stop>(msg)) {
            return;
        }

        auto body = std::visit(
            [](const auto& m) -> std::string {
                if constexpr (std::is_same_v<std::decay_t<decltype(m)>, Stop>) {
                    return {};
                } else {
                    return to_json(m);
                }
            },
            msg
        );

        try {
            post(credentials, endpoint_of(msg), body);
            ++delivered_;
        } catch (const SyncDeliveryError& e) {
            ++failed_;
            errlog("sync: delivery failed, message dropped: ", e.what());
        }
    }
}

void SyncDispatcher::worker_main() noexcept {
    try {
        credentials_ready_.wait();
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        running_ = false;
        return;
    }

    auto credentials = credentials_.copy();
    if (not credentials) {
        // Released by stop() before any credentials arrived
        auto discarded = queue_.size() - 1; // Stop is always queued here
        if (discarded > 0) {
            errlog("sync: stopped without credentials, ", discarded, " message(s) not sent");
        }
        running_ = false;
        return;
    }

    for (;;) {
        try {
            process_messages(*credentials);
            break;
        } catch (const std::exception& e) {
            ERRLOG_CATCH(e);
            ++restarts_;
            errlog("sync: worker loop restarted (restart #", restarts_.load(), ')');
        }
    }
    running_ = false;
}

Result<void, SyncDeliveryError> SyncDispatcher::force_sync(const EventSnapshot& snapshot) {
    auto credentials = credentials_.copy();
    if (not credentials) {
        return Err{SyncDeliveryError("force sync: reflector credentials are not configured")};
    }

    try {
        post(*credentials, "/sync", to_json(snapshot));
    } catch (const SyncDeliveryError& e) {
        errlog("sync: force sync failed: ", e.what());
        return Err{e};
    }
    return Ok{};
}

} // namespace scorekeeper::sync
