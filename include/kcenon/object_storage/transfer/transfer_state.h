/**
 * @file transfer_state.h
 * @brief Per-chunk progress of a multipart transfer
 * @version 0.1.0
 *
 * A transfer_state is the unit persisted by the resume store. While a
 * transfer runs, workers mutate it only through a chunk_ledger, which
 * serializes access per chunk index.
 */

#ifndef KCENON_OBJECT_STORAGE_TRANSFER_TRANSFER_STATE_H
#define KCENON_OBJECT_STORAGE_TRANSFER_TRANSFER_STATE_H

#include "kcenon/object_storage/core/types.h"
#include "kcenon/object_storage/storage/storage_types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::object_storage {

/**
 * @brief Status of one chunk
 */
enum class chunk_status {
    pending,
    in_flight,
    completed,
    failed
};

[[nodiscard]] constexpr auto to_string(chunk_status status) -> const char* {
    switch (status) {
        case chunk_status::pending: return "pending";
        case chunk_status::in_flight: return "in_flight";
        case chunk_status::completed: return "completed";
        case chunk_status::failed: return "failed";
        default: return "pending";
    }
}

[[nodiscard]] auto chunk_status_from_string(std::string_view text)
    -> std::optional<chunk_status>;

/**
 * @brief Progress record of one chunk
 */
struct chunk_record {
    uint32_t index = 0;
    byte_range range;
    chunk_status status = chunk_status::pending;
    uint32_t retry_count = 0;
    std::string etag;        ///< upload parts only
    std::string checksum;    ///< base64 MD5 of an uploaded part
    uint64_t bytes_transferred = 0;
    std::string last_error;

    /// S3 part number (1-based)
    [[nodiscard]] auto part_number() const -> uint32_t { return index + 1; }

    [[nodiscard]] auto is_completed() const -> bool {
        return status == chunk_status::completed && bytes_transferred == range.length;
    }
};

/**
 * @brief Identity of the source at transfer start
 *
 * Uploads record the local size and modification time, leaving etag
 * empty. Downloads record the remote size, ETag and Last-Modified.
 */
struct transfer_fingerprint {
    uint64_t size = 0;
    std::string etag;
    std::string last_modified;

    [[nodiscard]] auto operator==(const transfer_fingerprint& other) const -> bool = default;

    /**
     * @brief Fingerprint of a local file (size and last write time)
     */
    [[nodiscard]] static auto of_local_file(const std::filesystem::path& path)
        -> result<transfer_fingerprint>;

    /**
     * @brief Fingerprint of a remote object
     */
    [[nodiscard]] static auto of_object(const object_descriptor& object)
        -> transfer_fingerprint;
};

/**
 * @brief Persistent state of a chunked transfer
 */
struct transfer_state {
    std::string bucket;
    std::string key;
    std::filesystem::path local_path;
    transfer_direction direction = transfer_direction::upload;
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    std::string upload_id;
    std::vector<chunk_record> chunks;
    transfer_fingerprint fingerprint;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point updated_at;

    /**
     * @brief Create a fresh state with every chunk pending
     */
    [[nodiscard]] static auto create(std::string bucket,
                                     std::string key,
                                     std::filesystem::path local_path,
                                     transfer_direction direction,
                                     uint64_t total_size,
                                     uint64_t chunk_size,
                                     transfer_fingerprint fingerprint) -> transfer_state;

    [[nodiscard]] auto completed_count() const -> uint32_t;
    [[nodiscard]] auto bytes_completed() const -> uint64_t;
    [[nodiscard]] auto is_complete() const -> bool;
    [[nodiscard]] auto completion_percentage() const -> double;

    /**
     * @brief Indices of every chunk not yet completed, ascending
     */
    [[nodiscard]] auto pending_indices() const -> std::vector<uint32_t>;

    /**
     * @brief Check that the chunk records tile [0, total_size)
     */
    [[nodiscard]] auto is_consistent() const -> bool;

    /**
     * @brief Put in-flight and failed chunks back to pending
     *
     * Used when a persisted state is picked up by a new run.
     */
    void reset_interrupted();

    /**
     * @brief Discard all progress, keeping the chunk layout
     */
    void reset_progress();

    /**
     * @brief Completed parts in ascending part-number order
     */
    [[nodiscard]] auto completed_parts() const -> std::vector<completed_part>;
};

/**
 * @brief Synchronized view of a transfer_state used by workers
 *
 * One mutex per chunk index guards that chunk's record; the counters are
 * atomics so the waiting thread can read progress without locking.
 * The ledger must not outlive the state it wraps.
 */
class chunk_ledger {
public:
    explicit chunk_ledger(transfer_state& state);

    chunk_ledger(const chunk_ledger&) = delete;
    auto operator=(const chunk_ledger&) -> chunk_ledger& = delete;

    [[nodiscard]] auto size() const -> std::size_t { return locks_.size(); }

    [[nodiscard]] auto range(uint32_t index) const -> byte_range;

    void mark_in_flight(uint32_t index);

    void mark_completed(uint32_t index, std::string etag = {}, std::string checksum = {});

    void mark_failed(uint32_t index, const error& err);

    /**
     * @brief Count one more attempt on the chunk
     * @return Retry count after the increment
     */
    auto record_retry(uint32_t index, const error& err) -> uint32_t;

    [[nodiscard]] auto record(uint32_t index) const -> chunk_record;

    [[nodiscard]] auto completed_count() const -> uint32_t { return completed_.load(); }

    [[nodiscard]] auto bytes_completed() const -> uint64_t { return bytes_.load(); }

    /**
     * @brief Consistent copy of the whole state, for checkpointing
     */
    [[nodiscard]] auto snapshot() const -> transfer_state;

private:
    void touch();

    transfer_state& state_;
    mutable std::vector<std::mutex> locks_;
    mutable std::mutex meta_mutex_;
    std::atomic<uint32_t> completed_{0};
    std::atomic<uint64_t> bytes_{0};
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_TRANSFER_TRANSFER_STATE_H
