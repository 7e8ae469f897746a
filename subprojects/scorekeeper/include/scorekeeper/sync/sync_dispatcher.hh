#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <scorekeeper/errors.hh>
#include <scorekeeper/sync/http_client.hh>
#include <scorekeeper/sync/messages.hh>
#include <sklib/concurrent/blocking_queue.hh>
#include <sklib/concurrent/mutexed_value.hh>
#include <sklib/concurrent/semaphore.hh>
#include <sklib/result.hh>
#include <string>
#include <thread>

namespace scorekeeper::sync {

struct Credentials {
    std::string sync_url;
    std::string event_code;
    std::string apikey;

    // "{sync_url}/{event_code}"
    [[nodiscard]] std::string base_url() const;
};

/**
 * @brief Relays event changes to the reflector from a background worker
 * @details Messages are queued without blocking and delivered in FIFO order
 *   once credentials are configured. A failed delivery is logged and the
 *   message dropped; it is never retried. An unexpected exception in the
 *   worker restarts its loop instead of ending it.
 */
class SyncDispatcher {
    std::unique_ptr<HttpClient> client_;
    std::chrono::milliseconds timeout_;

    concurrent::MutexedValue<std::optional<Credentials>> credentials_;
    concurrent::Semaphore credentials_ready_{0};
    std::atomic<bool> credentials_signaled_{false};

    concurrent::BlockingQueue<Message> queue_;
    std::atomic<bool> stopped_{false};

    std::atomic<bool> running_{true};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> restarts_{0};

    std::thread worker_; // Has to be initialized last

    void signal_credentials_ready();

    void worker_main() noexcept;

    // Returns after the Stop message
    void process_messages(const Credentials& credentials);

    // Throws SyncDeliveryError on failure or a non-2xx response
    void post(const Credentials& credentials, std::string_view endpoint, const std::string& body);

public:
    /**
     * @param client used by the worker and force_sync()
     * @param timeout bound of every HTTP request
     * @param queue_limit maximum number of queued messages, 0 means
     *   unbounded; when reached the oldest queued message is dropped
     */
    explicit SyncDispatcher(
        std::unique_ptr<HttpClient> client,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000},
        size_t queue_limit = 0
    );

    SyncDispatcher(const SyncDispatcher&) = delete;
    SyncDispatcher(SyncDispatcher&&) = delete;
    SyncDispatcher& operator=(const SyncDispatcher&) = delete;
    SyncDispatcher& operator=(SyncDispatcher&&) = delete;

    // Calls stop()
    ~SyncDispatcher();

    // Supplies reflector credentials and releases the worker. Only the first
    // call has an effect.
    void configure(Credentials credentials);

    [[nodiscard]] bool is_configured();

    // Never blocks. Ignored after stop().
    void enqueue(Message msg);

    /**
     * @brief Stops the worker and waits for it to finish
     * @details Messages queued before stop() are still delivered if
     *   credentials are configured, otherwise they are discarded.
     */
    void stop();

    // Posts @p snapshot to /sync immediately, bypassing the queue
    Result<void, SyncDeliveryError> force_sync(const EventSnapshot& snapshot);

    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    [[nodiscard]] uint64_t delivered_messages() const noexcept { return delivered_.load(); }

    [[nodiscard]] uint64_t failed_messages() const noexcept { return failed_.load(); }

    [[nodiscard]] uint64_t dropped_messages() const noexcept { return dropped_.load(); }

    [[nodiscard]] uint64_t worker_restarts() const noexcept { return restarts_.load(); }

    [[nodiscard]] size_t queued_messages() { return queue_.size(); }
};

} // namespace scorekeeper::sync
