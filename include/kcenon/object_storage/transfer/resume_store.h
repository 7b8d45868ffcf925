/**
 * @file resume_store.h
 * @brief On-disk persistence of transfer_state for resumable transfers
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_STORAGE_TRANSFER_RESUME_STORE_H
#define KCENON_OBJECT_STORAGE_TRANSFER_RESUME_STORE_H

#include "kcenon/object_storage/core/types.h"
#include "kcenon/object_storage/transfer/transfer_state.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::object_storage {

/**
 * @brief Configuration for resume_store
 */
struct resume_store_config {
    /// Directory holding *.resume.json records
    std::filesystem::path directory;

    /// Records not updated within this window are expired
    std::chrono::seconds state_ttl{7 * 24 * 60 * 60};

    resume_store_config();
    explicit resume_store_config(std::filesystem::path dir);

    /**
     * @brief <temp>/object_storage_resume
     */
    [[nodiscard]] static auto default_directory() -> std::filesystem::path;
};

/**
 * @brief Stores one JSON record per (bucket, key, local path, direction)
 *
 * Writes go to a temporary file that is renamed over the record, so a
 * reader never sees a partially written file. A missing, corrupt or
 * expired record loads as std::nullopt; only write failures are errors.
 *
 * @code
 * resume_store store(resume_store_config("/var/tmp/resume"));
 * store.save(state);
 * if (auto prior = store.load(bucket, key, path, transfer_direction::upload)) {
 *     // validate the fingerprint, then continue from prior->pending_indices()
 * }
 * @endcode
 */
class resume_store {
public:
    explicit resume_store(const resume_store_config& config = resume_store_config{});

    ~resume_store();

    resume_store(const resume_store&) = delete;
    auto operator=(const resume_store&) -> resume_store& = delete;
    resume_store(resume_store&&) noexcept;
    auto operator=(resume_store&&) noexcept -> resume_store&;

    [[nodiscard]] auto save(const transfer_state& state) -> result<void>;

    [[nodiscard]] auto load(const std::string& bucket,
                            const std::string& key,
                            const std::filesystem::path& local_path,
                            transfer_direction direction) -> std::optional<transfer_state>;

    /**
     * @brief Delete a record; a missing record is not an error
     */
    [[nodiscard]] auto remove(const transfer_state& state) -> result<void>;

    [[nodiscard]] auto remove(const std::string& bucket,
                              const std::string& key,
                              const std::filesystem::path& local_path,
                              transfer_direction direction) -> result<void>;

    /**
     * @brief Every readable, unexpired record in the directory
     */
    [[nodiscard]] auto list_states() -> std::vector<transfer_state>;

    /**
     * @brief Delete records older than the TTL
     * @return Number of records removed
     */
    auto cleanup_expired() -> std::size_t;

    /**
     * @brief File that holds the record for the given transfer
     */
    [[nodiscard]] auto record_path(const std::string& bucket,
                                   const std::string& key,
                                   const std::filesystem::path& local_path,
                                   transfer_direction direction) const
        -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const resume_store_config&;

    /**
     * @brief Stable 16-hex-digit record key (FNV-1a 64)
     */
    [[nodiscard]] static auto record_key(const std::string& bucket,
                                         const std::string& key,
                                         const std::filesystem::path& local_path,
                                         transfer_direction direction) -> std::string;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_TRANSFER_RESUME_STORE_H
