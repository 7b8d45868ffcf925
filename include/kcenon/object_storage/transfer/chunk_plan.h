/**
 * @file chunk_plan.h
 * @brief Chunk size selection and byte-range partitioning
 * @version 0.1.0
 */

#ifndef KCENON_OBJECT_STORAGE_TRANSFER_CHUNK_PLAN_H
#define KCENON_OBJECT_STORAGE_TRANSFER_CHUNK_PLAN_H

#include "kcenon/object_storage/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace kcenon::object_storage {

/**
 * @brief Number of chunks needed to cover total_size
 */
[[nodiscard]] auto chunk_count(uint64_t total_size, uint64_t chunk_size) -> uint32_t;

/**
 * @brief Part size actually used for an upload
 *
 * Raised to min_upload_chunk_size, then grown to ceil(size / max_upload_parts)
 * when the part count would exceed the S3 limit.
 */
[[nodiscard]] auto effective_upload_chunk_size(uint64_t total_size, uint64_t requested)
    -> uint64_t;

/**
 * @brief Range size actually used for a download (at least min_download_chunk_size)
 */
[[nodiscard]] auto effective_download_chunk_size(uint64_t requested) -> uint64_t;

/**
 * @brief Clamp a worker count to [1, limit]
 */
[[nodiscard]] auto clamp_parallelism(std::size_t requested, std::size_t limit)
    -> std::size_t;

/**
 * @brief Split [0, total_size) into consecutive ranges of chunk_size
 *
 * Every range but the last has exactly chunk_size bytes. A zero-size
 * input yields no ranges.
 */
[[nodiscard]] auto plan_chunks(uint64_t total_size, uint64_t chunk_size)
    -> std::vector<byte_range>;

/**
 * @brief Check that ranges tile [0, total_size) in order, without gaps or overlaps
 */
[[nodiscard]] auto tiles_exactly(const std::vector<byte_range>& ranges, uint64_t total_size)
    -> bool;

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_TRANSFER_CHUNK_PLAN_H
