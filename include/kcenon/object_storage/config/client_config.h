/**
 * @file client_config.h
 * @brief Connection, credential and transfer configuration types
 * @version 0.1.0
 *
 * Configuration is supplied as plain values by the embedding application;
 * nothing here reads or writes configuration files.
 */

#ifndef KCENON_OBJECT_STORAGE_CONFIG_CLIENT_CONFIG_H
#define KCENON_OBJECT_STORAGE_CONFIG_CLIENT_CONFIG_H

#include "kcenon/object_storage/core/logging.h"
#include "kcenon/object_storage/core/types.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::object_storage {

class progress_collector;

/// Smallest part S3 accepts for any but the last part of a multipart upload
inline constexpr uint64_t min_upload_chunk_size = 5ULL * 1024 * 1024;

/// Smallest ranged-GET size used by the download manager
inline constexpr uint64_t min_download_chunk_size = 1ULL * 1024 * 1024;

/// Maximum number of parts in one multipart upload
inline constexpr uint32_t max_upload_parts = 10000;

inline constexpr std::size_t max_parallel_uploads_limit = 10;
inline constexpr std::size_t max_parallel_downloads_limit = 8;

/**
 * @brief Access credentials and endpoint for one S3-compatible service
 *
 * Immutable once a client is connected.
 */
struct credentials {
    std::string access_key;
    std::string secret_key;
    std::string region = "us-east-1";
    std::string endpoint;  ///< host[:port]
    bool use_tls = true;

    [[nodiscard]] auto has_keys() const -> bool {
        return !access_key.empty() && !secret_key.empty();
    }

    [[nodiscard]] auto scheme() const -> std::string {
        return use_tls ? "https" : "http";
    }
};

/**
 * @brief Cooperative cancellation flag shared between caller and workers
 */
class cancellation_token {
public:
    cancellation_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }

    [[nodiscard]] auto is_cancelled() const -> bool { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Client-wide connection and transfer defaults
 */
struct connection_options {
    std::string region = "us-east-1";
    bool use_tls = true;
    std::chrono::milliseconds timeout{30000};

    /// Default part size for multipart uploads (64MB)
    uint64_t upload_chunk_size = 64ULL * 1024 * 1024;

    /// Default range size for multipart downloads (32MB)
    uint64_t download_chunk_size = 32ULL * 1024 * 1024;

    std::size_t max_parallel_uploads = 4;
    std::size_t max_parallel_downloads = 4;

    /// Extra attempts per chunk after the first one fails transiently
    std::size_t max_retries = 3;

    bool enable_resume = true;

    /// Empty selects <temp>/object_storage_resume
    std::filesystem::path resume_directory;

    /// Checkpoint the resume record after this many newly completed chunks
    uint32_t checkpoint_interval = 4;

    /// How often the waiting thread wakes to run on_poll hooks
    std::chrono::milliseconds poll_interval{250};

    log_level min_log_level = log_level::info;

    /**
     * @brief Validate configuration
     */
    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Per-call upload options; zero/empty values fall back to the client defaults
 */
struct upload_options {
    uint64_t chunk_size = 0;
    std::size_t max_parallel = 0;
    std::optional<std::size_t> max_retries;
    std::string content_type;
    std::map<std::string, std::string> metadata;

    /// Look for a resume record before starting
    bool resume = true;

    /// Abort the remote multipart upload instead of keeping it for resume
    bool abort_on_failure = false;

    cancellation_token cancel;

    /// Runs on the calling thread while it waits for workers
    std::function<void(progress_collector&)> on_poll;
};

/**
 * @brief Per-call download options; zero values fall back to the client defaults
 */
struct download_options {
    uint64_t chunk_size = 0;
    std::size_t max_parallel = 0;
    std::optional<std::size_t> max_retries;
    bool resume = true;
    cancellation_token cancel;
    std::function<void(progress_collector&)> on_poll;
};

/**
 * @brief Fluent builder for connection_options
 *
 * @code
 * auto options = connection_options_builder()
 *     .with_region("eu-west-1")
 *     .with_tls(false)
 *     .with_upload_chunk_size(16 * 1024 * 1024)
 *     .build();
 * @endcode
 */
class connection_options_builder {
public:
    auto with_region(std::string region) -> connection_options_builder& {
        options_.region = std::move(region);
        return *this;
    }

    auto with_tls(bool enable) -> connection_options_builder& {
        options_.use_tls = enable;
        return *this;
    }

    auto with_timeout(std::chrono::milliseconds timeout) -> connection_options_builder& {
        options_.timeout = timeout;
        return *this;
    }

    auto with_upload_chunk_size(uint64_t size) -> connection_options_builder& {
        options_.upload_chunk_size = size;
        return *this;
    }

    auto with_download_chunk_size(uint64_t size) -> connection_options_builder& {
        options_.download_chunk_size = size;
        return *this;
    }

    auto with_max_parallel(std::size_t uploads, std::size_t downloads)
        -> connection_options_builder& {
        options_.max_parallel_uploads = uploads;
        options_.max_parallel_downloads = downloads;
        return *this;
    }

    auto with_max_retries(std::size_t retries) -> connection_options_builder& {
        options_.max_retries = retries;
        return *this;
    }

    auto with_resume_directory(std::filesystem::path dir) -> connection_options_builder& {
        options_.resume_directory = std::move(dir);
        return *this;
    }

    auto with_resume(bool enable) -> connection_options_builder& {
        options_.enable_resume = enable;
        return *this;
    }

    auto with_log_level(log_level level) -> connection_options_builder& {
        options_.min_log_level = level;
        return *this;
    }

    [[nodiscard]] auto build() const -> result<connection_options>;

private:
    connection_options options_;
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_CONFIG_CLIENT_CONFIG_H
