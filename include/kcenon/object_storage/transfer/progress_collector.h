/**
 * @file progress_collector.h
 * @brief Multi-writer, single-reader mailbox for transfer progress events
 * @version 0.1.0
 *
 * Workers never call into the front end. They post progress_event values
 * here, and the thread that owns the front end drains them at its own pace.
 */

#ifndef KCENON_OBJECT_STORAGE_TRANSFER_PROGRESS_COLLECTOR_H
#define KCENON_OBJECT_STORAGE_TRANSFER_PROGRESS_COLLECTOR_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::object_storage {

/**
 * @brief Kind of progress event
 */
enum class progress_event_kind {
    chunk_started,
    chunk_progress,
    chunk_completed,
    chunk_failed,
    transfer_completed
};

[[nodiscard]] constexpr auto to_string(progress_event_kind kind) -> const char* {
    switch (kind) {
        case progress_event_kind::chunk_started: return "chunk_started";
        case progress_event_kind::chunk_progress: return "chunk_progress";
        case progress_event_kind::chunk_completed: return "chunk_completed";
        case progress_event_kind::chunk_failed: return "chunk_failed";
        case progress_event_kind::transfer_completed: return "transfer_completed";
        default: return "unknown";
    }
}

/**
 * @brief One progress notification
 */
struct progress_event {
    progress_event_kind kind = progress_event_kind::chunk_progress;
    std::string key;
    std::optional<uint32_t> chunk_index;
    uint64_t bytes_transferred = 0;   ///< cumulative for the chunk, or the transfer
    uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::string message;
};

/**
 * @brief Mailbox between transfer workers and the front end
 *
 * enqueue() is safe from any thread and never throws. When the mailbox
 * holds capacity() events, further events are dropped and counted.
 *
 * @code
 * progress_collector progress;
 * upload_options options;
 * options.on_poll = [](progress_collector& c) {
 *     c.drain([](const progress_event& e) { render(e); });
 * };
 * client.upload_file("bucket", "key", path, options, &progress);
 * @endcode
 */
class progress_collector {
public:
    using event_handler = std::function<void(const progress_event&)>;

    static constexpr std::size_t default_capacity = 65536;

    explicit progress_collector(std::size_t capacity = default_capacity);

    progress_collector(const progress_collector&) = delete;
    auto operator=(const progress_collector&) -> progress_collector& = delete;

    void enqueue(progress_event event) noexcept;

    /**
     * @brief Remove and return every pending event in FIFO order
     */
    [[nodiscard]] auto drain() -> std::vector<progress_event>;

    /**
     * @brief Dispatch every pending event to handler on the calling thread
     * @return Number of events dispatched
     */
    auto drain(const event_handler& handler) -> std::size_t;

    [[nodiscard]] auto pending() const -> std::size_t;

    [[nodiscard]] auto dropped_count() const noexcept -> uint64_t {
        return dropped_.load();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

private:
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<progress_event> events_;
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_TRANSFER_PROGRESS_COLLECTOR_H
