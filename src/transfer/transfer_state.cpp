/**
 * @file transfer_state.cpp
 * @brief Implementation of transfer_state and chunk_ledger
 */

#include "kcenon/object_storage/transfer/transfer_state.h"
#include "kcenon/object_storage/transfer/chunk_plan.h"

#include <algorithm>

namespace kcenon::object_storage {

auto chunk_status_from_string(std::string_view text) -> std::optional<chunk_status> {
    if (text == "pending") return chunk_status::pending;
    if (text == "in_flight") return chunk_status::in_flight;
    if (text == "completed") return chunk_status::completed;
    if (text == "failed") return chunk_status::failed;
    return std::nullopt;
}

// ============================================================================
// transfer_fingerprint
// ============================================================================

auto transfer_fingerprint::of_local_file(const std::filesystem::path& path)
    -> result<transfer_fingerprint> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found,
            "not a regular file: " + path.string()}};
    }

    transfer_fingerprint fp;
    fp.size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected{error{error_code::file_access_denied,
            "cannot stat " + path.string() + ": " + ec.message()}};
    }
    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return unexpected{error{error_code::file_access_denied,
            "cannot stat " + path.string() + ": " + ec.message()}};
    }
    fp.last_modified = std::to_string(mtime.time_since_epoch().count());
    return fp;
}

auto transfer_fingerprint::of_object(const object_descriptor& object) -> transfer_fingerprint {
    transfer_fingerprint fp;
    fp.size = object.size;
    fp.etag = object.etag;
    fp.last_modified = object.last_modified;
    return fp;
}

// ============================================================================
// transfer_state
// ============================================================================

auto transfer_state::create(std::string bucket,
                            std::string key,
                            std::filesystem::path local_path,
                            transfer_direction direction,
                            uint64_t total_size,
                            uint64_t chunk_size,
                            transfer_fingerprint fingerprint) -> transfer_state {
    transfer_state state;
    state.bucket = std::move(bucket);
    state.key = std::move(key);
    state.local_path = std::move(local_path);
    state.direction = direction;
    state.total_size = total_size;
    state.chunk_size = chunk_size;
    state.fingerprint = std::move(fingerprint);
    state.started_at = std::chrono::system_clock::now();
    state.updated_at = state.started_at;

    auto ranges = plan_chunks(total_size, chunk_size);
    state.chunks.reserve(ranges.size());
    for (uint32_t i = 0; i < ranges.size(); ++i) {
        chunk_record record;
        record.index = i;
        record.range = ranges[i];
        state.chunks.push_back(std::move(record));
    }
    return state;
}

auto transfer_state::completed_count() const -> uint32_t {
    return static_cast<uint32_t>(std::count_if(chunks.begin(), chunks.end(),
        [](const chunk_record& c) { return c.is_completed(); }));
}

auto transfer_state::bytes_completed() const -> uint64_t {
    uint64_t total = 0;
    for (const auto& c : chunks) {
        if (c.is_completed()) {
            total += c.range.length;
        }
    }
    return total;
}

auto transfer_state::is_complete() const -> bool {
    return std::all_of(chunks.begin(), chunks.end(),
        [](const chunk_record& c) { return c.is_completed(); });
}

auto transfer_state::completion_percentage() const -> double {
    if (total_size == 0) {
        return is_complete() ? 100.0 : 0.0;
    }
    return static_cast<double>(bytes_completed()) / static_cast<double>(total_size) * 100.0;
}

auto transfer_state::pending_indices() const -> std::vector<uint32_t> {
    std::vector<uint32_t> indices;
    for (const auto& c : chunks) {
        if (!c.is_completed()) {
            indices.push_back(c.index);
        }
    }
    return indices;
}

auto transfer_state::is_consistent() const -> bool {
    std::vector<byte_range> ranges;
    ranges.reserve(chunks.size());
    for (uint32_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index != i) {
            return false;
        }
        ranges.push_back(chunks[i].range);
    }
    return tiles_exactly(ranges, total_size);
}

void transfer_state::reset_interrupted() {
    for (auto& c : chunks) {
        if (c.status == chunk_status::in_flight || c.status == chunk_status::failed ||
            (c.status == chunk_status::completed && !c.is_completed())) {
            c.status = chunk_status::pending;
            c.bytes_transferred = 0;
            c.retry_count = 0;
        }
    }
}

void transfer_state::reset_progress() {
    upload_id.clear();
    for (auto& c : chunks) {
        c.status = chunk_status::pending;
        c.retry_count = 0;
        c.etag.clear();
        c.checksum.clear();
        c.bytes_transferred = 0;
        c.last_error.clear();
    }
}

auto transfer_state::completed_parts() const -> std::vector<completed_part> {
    std::vector<completed_part> parts;
    parts.reserve(chunks.size());
    for (const auto& c : chunks) {
        if (c.is_completed()) {
            parts.push_back(completed_part{c.part_number(), c.etag});
        }
    }
    return parts;
}

// ============================================================================
// chunk_ledger
// ============================================================================

chunk_ledger::chunk_ledger(transfer_state& state)
    : state_(state), locks_(state.chunks.size()) {
    completed_ = state.completed_count();
    bytes_ = state.bytes_completed();
}

auto chunk_ledger::range(uint32_t index) const -> byte_range {
    std::lock_guard<std::mutex> lock(locks_[index]);
    return state_.chunks[index].range;
}

void chunk_ledger::mark_in_flight(uint32_t index) {
    {
        std::lock_guard<std::mutex> lock(locks_[index]);
        auto& c = state_.chunks[index];
        c.status = chunk_status::in_flight;
        c.bytes_transferred = 0;
    }
    touch();
}

void chunk_ledger::mark_completed(uint32_t index, std::string etag, std::string checksum) {
    bool newly_completed = false;
    uint64_t length = 0;
    {
        std::lock_guard<std::mutex> lock(locks_[index]);
        auto& c = state_.chunks[index];
        newly_completed = !c.is_completed();
        c.status = chunk_status::completed;
        c.bytes_transferred = c.range.length;
        c.etag = std::move(etag);
        c.checksum = std::move(checksum);
        c.last_error.clear();
        length = c.range.length;
    }
    if (newly_completed) {
        completed_.fetch_add(1);
        bytes_.fetch_add(length);
    }
    touch();
}

void chunk_ledger::mark_failed(uint32_t index, const error& err) {
    {
        std::lock_guard<std::mutex> lock(locks_[index]);
        auto& c = state_.chunks[index];
        c.status = chunk_status::failed;
        c.bytes_transferred = 0;
        c.last_error = err.message;
    }
    touch();
}

auto chunk_ledger::record_retry(uint32_t index, const error& err) -> uint32_t {
    std::lock_guard<std::mutex> lock(locks_[index]);
    auto& c = state_.chunks[index];
    c.last_error = err.message;
    return ++c.retry_count;
}

auto chunk_ledger::record(uint32_t index) const -> chunk_record {
    std::lock_guard<std::mutex> lock(locks_[index]);
    return state_.chunks[index];
}

auto chunk_ledger::snapshot() const -> transfer_state {
    transfer_state copy;
    {
        std::lock_guard<std::mutex> lock(meta_mutex_);
        copy.bucket = state_.bucket;
        copy.key = state_.key;
        copy.local_path = state_.local_path;
        copy.direction = state_.direction;
        copy.total_size = state_.total_size;
        copy.chunk_size = state_.chunk_size;
        copy.upload_id = state_.upload_id;
        copy.fingerprint = state_.fingerprint;
        copy.started_at = state_.started_at;
        copy.updated_at = state_.updated_at;
    }
    copy.chunks.reserve(state_.chunks.size());
    for (uint32_t i = 0; i < state_.chunks.size(); ++i) {
        std::lock_guard<std::mutex> lock(locks_[i]);
        copy.chunks.push_back(state_.chunks[i]);
    }
    return copy;
}

void chunk_ledger::touch() {
    std::lock_guard<std::mutex> lock(meta_mutex_);
    state_.updated_at = std::chrono::system_clock::now();
}

}  // namespace kcenon::object_storage
