/**
 * @file chunk_plan.cpp
 * @brief Chunk size selection and byte-range partitioning
 */

#include "kcenon/object_storage/transfer/chunk_plan.h"
#include "kcenon/object_storage/config/client_config.h"

#include <algorithm>

namespace kcenon::object_storage {

auto chunk_count(uint64_t total_size, uint64_t chunk_size) -> uint32_t {
    if (total_size == 0 || chunk_size == 0) {
        return 0;
    }
    return static_cast<uint32_t>((total_size + chunk_size - 1) / chunk_size);
}

auto effective_upload_chunk_size(uint64_t total_size, uint64_t requested) -> uint64_t {
    auto size = std::max(requested, min_upload_chunk_size);
    if (chunk_count(total_size, size) > max_upload_parts) {
        size = (total_size + max_upload_parts - 1) / max_upload_parts;
    }
    return size;
}

auto effective_download_chunk_size(uint64_t requested) -> uint64_t {
    return std::max(requested, min_download_chunk_size);
}

auto clamp_parallelism(std::size_t requested, std::size_t limit) -> std::size_t {
    return std::clamp<std::size_t>(requested, 1, std::max<std::size_t>(limit, 1));
}

auto plan_chunks(uint64_t total_size, uint64_t chunk_size) -> std::vector<byte_range> {
    std::vector<byte_range> ranges;
    if (total_size == 0) {
        return ranges;
    }
    if (chunk_size == 0) {
        chunk_size = total_size;
    }

    ranges.reserve(chunk_count(total_size, chunk_size));
    for (uint64_t offset = 0; offset < total_size; offset += chunk_size) {
        ranges.emplace_back(offset, std::min(chunk_size, total_size - offset));
    }
    return ranges;
}

auto tiles_exactly(const std::vector<byte_range>& ranges, uint64_t total_size) -> bool {
    uint64_t expected = 0;
    for (const auto& range : ranges) {
        if (range.offset != expected || range.length == 0) {
            return false;
        }
        expected = range.end();
    }
    return expected == total_size;
}

}  // namespace kcenon::object_storage
