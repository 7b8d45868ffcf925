/**
 * @file transfer_result.h
 * @brief Typed outcomes of upload_file and download_file
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_STORAGE_TRANSFER_TRANSFER_RESULT_H
#define KCENON_OBJECT_STORAGE_TRANSFER_TRANSFER_RESULT_H

#include "kcenon/object_storage/core/types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::object_storage {

/**
 * @brief Lifecycle of a multipart upload
 *
 * not_started -> initiated -> uploading -> completing -> completed;
 * failed and aborted are reachable from any non-terminal state.
 */
enum class multipart_upload_state {
    not_started,
    initiated,
    uploading,
    completing,
    completed,
    failed,
    aborted
};

[[nodiscard]] constexpr auto to_string(multipart_upload_state state) -> const char* {
    switch (state) {
        case multipart_upload_state::not_started: return "not_started";
        case multipart_upload_state::initiated: return "initiated";
        case multipart_upload_state::uploading: return "uploading";
        case multipart_upload_state::completing: return "completing";
        case multipart_upload_state::completed: return "completed";
        case multipart_upload_state::failed: return "failed";
        case multipart_upload_state::aborted: return "aborted";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal(multipart_upload_state state) -> bool {
    return state == multipart_upload_state::completed ||
           state == multipart_upload_state::failed ||
           state == multipart_upload_state::aborted;
}

/**
 * @brief Outcome of a (possibly resumed) multipart upload
 */
struct upload_result {
    std::string bucket;
    std::string key;
    std::filesystem::path local_path;
    std::string upload_id;
    std::string etag;                       ///< ETag of the assembled object
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    uint32_t total_parts = 0;
    uint32_t completed_parts = 0;
    uint64_t bytes_transferred = 0;         ///< Bytes sent during this run only
    std::chrono::milliseconds duration{0};
    double average_throughput = 0.0;        ///< Bytes per second during this run
    multipart_upload_state state = multipart_upload_state::not_started;
    bool was_resumed = false;
    bool resume_invalidated = false;
    std::optional<error> failure;

    [[nodiscard]] auto success() const noexcept -> bool {
        return state == multipart_upload_state::completed && !failure;
    }

    [[nodiscard]] auto completion_percentage() const noexcept -> double {
        if (total_parts == 0) {
            return success() ? 100.0 : 0.0;
        }
        return static_cast<double>(completed_parts) /
               static_cast<double>(total_parts) * 100.0;
    }
};

/**
 * @brief Outcome of a (possibly resumed) multipart download
 */
struct download_result {
    std::string bucket;
    std::string key;
    std::filesystem::path destination;
    std::string etag;                       ///< Remote ETag at download start
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    uint32_t total_chunks = 0;
    uint32_t completed_chunks = 0;
    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};
    double average_throughput = 0.0;
    bool completed = false;
    bool was_resumed = false;
    bool resume_invalidated = false;
    std::optional<error> failure;

    [[nodiscard]] auto success() const noexcept -> bool {
        return completed && !failure;
    }

    [[nodiscard]] auto completion_percentage() const noexcept -> double {
        if (total_chunks == 0) {
            return success() ? 100.0 : 0.0;
        }
        return static_cast<double>(completed_chunks) /
               static_cast<double>(total_chunks) * 100.0;
    }
};

/**
 * @brief Bytes per second over a duration; zero for an empty interval
 */
[[nodiscard]] inline auto throughput(uint64_t bytes, std::chrono::milliseconds elapsed)
    -> double {
    if (elapsed.count() <= 0) {
        return 0.0;
    }
    return static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsed.count());
}

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_TRANSFER_TRANSFER_RESULT_H
