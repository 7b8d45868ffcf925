/**
 * @file resume_store.cpp
 * @brief Implementation of resume_store
 */

#include "kcenon/object_storage/transfer/resume_store.h"
#include "kcenon/object_storage/core/logging.h"
#include "kcenon/object_storage/core/storage_utils.h"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace kcenon::object_storage {

// ============================================================================
// resume_store_config implementation
// ============================================================================

resume_store_config::resume_store_config()
    : directory(default_directory()) {
}

resume_store_config::resume_store_config(std::filesystem::path dir)
    : directory(dir.empty() ? default_directory() : std::move(dir)) {
}

auto resume_store_config::default_directory() -> std::filesystem::path {
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = ".";
    }
    return temp / "object_storage_resume";
}

// ============================================================================
// JSON serialization helpers (simple implementation without external library)
// ============================================================================

namespace {

constexpr const char* record_suffix = ".resume.json";
constexpr int record_version = 1;

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4)
                      << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

auto unescape_json_string(const std::string& s) -> std::string {
    std::string result;
    result.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            switch (s[i + 1]) {
                case '"': result += '"'; ++i; break;
                case '\\': result += '\\'; ++i; break;
                case '/': result += '/'; ++i; break;
                case 'b': result += '\b'; ++i; break;
                case 'f': result += '\f'; ++i; break;
                case 'n': result += '\n'; ++i; break;
                case 'r': result += '\r'; ++i; break;
                case 't': result += '\t'; ++i; break;
                case 'u':
                    if (i + 5 < s.size()) {
                        auto code = std::stoi(s.substr(i + 2, 4), nullptr, 16);
                        result += static_cast<char>(code);
                        i += 5;
                    }
                    break;
                default: result += s[i]; break;
            }
        } else {
            result += s[i];
        }
    }
    return result;
}

auto time_point_to_int64(std::chrono::system_clock::time_point tp) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

auto int64_to_time_point(int64_t ms) -> std::chrono::system_clock::time_point {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

/**
 * @brief End of the string literal starting at json[open] (the opening quote)
 */
auto find_string_end(const std::string& json, std::size_t open) -> std::size_t {
    for (auto i = open + 1; i < json.size(); ++i) {
        if (json[i] == '\\') {
            ++i;
        } else if (json[i] == '"') {
            return i;
        }
    }
    return std::string::npos;
}

/**
 * @brief Raw value of "key" in a flat JSON object; strings come back unquoted and escaped
 */
auto extract_json_value(const std::string& json, const std::string& key)
    -> std::optional<std::string> {
    auto needle = "\"" + key + "\"";
    std::size_t pos = 0;
    while ((pos = json.find(needle, pos)) != std::string::npos) {
        auto after = pos + needle.size();
        while (after < json.size() && std::isspace(static_cast<unsigned char>(json[after]))) {
            ++after;
        }
        if (after < json.size() && json[after] == ':') {
            pos = after;
            break;
        }
        pos = after;
    }
    if (pos == std::string::npos || pos >= json.size()) {
        return std::nullopt;
    }

    auto value_start = pos + 1;
    while (value_start < json.size() &&
           std::isspace(static_cast<unsigned char>(json[value_start]))) {
        ++value_start;
    }
    if (value_start >= json.size()) {
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        auto string_end = find_string_end(json, value_start);
        if (string_end == std::string::npos) {
            return std::nullopt;
        }
        return json.substr(value_start + 1, string_end - value_start - 1);
    }

    auto value_end = value_start;
    while (value_end < json.size() && json[value_end] != ',' &&
           json[value_end] != '}' && json[value_end] != ']' &&
           !std::isspace(static_cast<unsigned char>(json[value_end]))) {
        ++value_end;
    }
    return json.substr(value_start, value_end - value_start);
}

auto require_string(const std::string& json, const std::string& key) -> std::string {
    auto value = extract_json_value(json, key);
    if (!value) {
        throw std::invalid_argument("missing field " + key);
    }
    return unescape_json_string(*value);
}

auto require_uint64(const std::string& json, const std::string& key) -> uint64_t {
    auto value = extract_json_value(json, key);
    if (!value) {
        throw std::invalid_argument("missing field " + key);
    }
    return std::stoull(*value);
}

/**
 * @brief Split the "chunks" array into its object literals
 */
auto split_chunk_objects(const std::string& json, std::size_t array_start)
    -> std::vector<std::string> {
    std::vector<std::string> objects;
    std::size_t depth = 0;
    std::size_t object_start = 0;
    for (auto i = array_start; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') {
            i = find_string_end(json, i);
            if (i == std::string::npos) {
                throw std::invalid_argument("unterminated string in chunks");
            }
        } else if (c == '{') {
            if (depth++ == 0) {
                object_start = i;
            }
        } else if (c == '}') {
            if (depth == 0) {
                throw std::invalid_argument("unbalanced braces in chunks");
            }
            if (--depth == 0) {
                objects.push_back(json.substr(object_start, i - object_start + 1));
            }
        } else if (c == ']' && depth == 0) {
            return objects;
        }
    }
    throw std::invalid_argument("unterminated chunks array");
}

auto serialize_state_to_json(const transfer_state& state) -> std::string {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"version\": " << record_version << ",\n";
    oss << "  \"bucket\": \"" << escape_json_string(state.bucket) << "\",\n";
    oss << "  \"key\": \"" << escape_json_string(state.key) << "\",\n";
    oss << "  \"local_path\": \"" << escape_json_string(state.local_path.string()) << "\",\n";
    oss << "  \"direction\": \"" << to_string(state.direction) << "\",\n";
    oss << "  \"total_size\": " << state.total_size << ",\n";
    oss << "  \"chunk_size\": " << state.chunk_size << ",\n";
    oss << "  \"upload_id\": \"" << escape_json_string(state.upload_id) << "\",\n";
    oss << "  \"fingerprint_size\": " << state.fingerprint.size << ",\n";
    oss << "  \"fingerprint_etag\": \"" << escape_json_string(state.fingerprint.etag) << "\",\n";
    oss << "  \"fingerprint_last_modified\": \""
        << escape_json_string(state.fingerprint.last_modified) << "\",\n";
    oss << "  \"started_at\": " << time_point_to_int64(state.started_at) << ",\n";
    oss << "  \"updated_at\": " << time_point_to_int64(state.updated_at) << ",\n";
    oss << "  \"chunks\": [";
    for (std::size_t i = 0; i < state.chunks.size(); ++i) {
        const auto& c = state.chunks[i];
        oss << (i == 0 ? "\n" : ",\n");
        oss << "    {\"index\": " << c.index
            << ", \"offset\": " << c.range.offset
            << ", \"length\": " << c.range.length
            << ", \"status\": \"" << to_string(c.status) << "\""
            << ", \"retries\": " << c.retry_count
            << ", \"etag\": \"" << escape_json_string(c.etag) << "\""
            << ", \"checksum\": \"" << escape_json_string(c.checksum) << "\""
            << ", \"bytes\": " << c.bytes_transferred
            << ", \"error\": \"" << escape_json_string(c.last_error) << "\"}";
    }
    oss << "\n  ]\n";
    oss << "}\n";
    return oss.str();
}

auto deserialize_state_from_json(const std::string& json) -> result<transfer_state> {
    auto chunks_key = json.find("\"chunks\"");
    if (chunks_key == std::string::npos) {
        return unexpected{error{error_code::resume_data_invalid, "missing chunks field"}};
    }
    auto array_start = json.find('[', chunks_key);
    if (array_start == std::string::npos) {
        return unexpected{error{error_code::resume_data_invalid, "chunks is not an array"}};
    }

    // Top-level fields precede the chunk list, so look them up only there.
    const auto header = json.substr(0, chunks_key);

    transfer_state state;
    try {
        state.bucket = require_string(header, "bucket");
        state.key = require_string(header, "key");
        state.local_path = require_string(header, "local_path");

        auto direction = require_string(header, "direction");
        if (direction == "upload") {
            state.direction = transfer_direction::upload;
        } else if (direction == "download") {
            state.direction = transfer_direction::download;
        } else {
            return unexpected{error{error_code::resume_data_invalid,
                "unknown direction " + direction}};
        }

        state.total_size = require_uint64(header, "total_size");
        state.chunk_size = require_uint64(header, "chunk_size");
        state.upload_id = require_string(header, "upload_id");
        state.fingerprint.size = require_uint64(header, "fingerprint_size");
        state.fingerprint.etag = require_string(header, "fingerprint_etag");
        state.fingerprint.last_modified = require_string(header, "fingerprint_last_modified");
        state.started_at = int64_to_time_point(
            std::stoll(extract_json_value(header, "started_at").value_or("0")));
        state.updated_at = int64_to_time_point(
            std::stoll(extract_json_value(header, "updated_at").value_or("0")));

        for (const auto& object : split_chunk_objects(json, array_start + 1)) {
            chunk_record record;
            record.index = static_cast<uint32_t>(require_uint64(object, "index"));
            record.range.offset = require_uint64(object, "offset");
            record.range.length = require_uint64(object, "length");
            auto status = chunk_status_from_string(require_string(object, "status"));
            if (!status) {
                return unexpected{error{error_code::resume_data_invalid,
                    "unknown chunk status in chunk " + std::to_string(record.index)}};
            }
            record.status = *status;
            record.retry_count = static_cast<uint32_t>(require_uint64(object, "retries"));
            record.etag = require_string(object, "etag");
            record.checksum = require_string(object, "checksum");
            record.bytes_transferred = require_uint64(object, "bytes");
            record.last_error = unescape_json_string(
                extract_json_value(object, "error").value_or(""));
            state.chunks.push_back(std::move(record));
        }
    } catch (const std::exception& e) {
        return unexpected{error{error_code::resume_data_invalid, e.what()}};
    }

    if (!state.is_consistent()) {
        return unexpected{error{error_code::resume_data_invalid,
            "chunk ranges do not tile the object"}};
    }
    return state;
}

}  // namespace

// ============================================================================
// resume_store::impl
// ============================================================================

class resume_store::impl {
public:
    explicit impl(const resume_store_config& cfg)
        : config_(cfg) {
    }

    auto ensure_directory() -> result<void> {
        std::error_code ec;
        std::filesystem::create_directories(config_.directory, ec);
        if (ec) {
            OBJSTORE_LOG_ERROR(log_category::resume,
                "Cannot create resume directory " + config_.directory.string() +
                ": " + ec.message());
            return unexpected{error{error_code::file_write_error,
                "cannot create resume directory: " + ec.message()}};
        }
        return {};
    }

    auto path_for(const std::string& bucket,
                  const std::string& key,
                  const std::filesystem::path& local_path,
                  transfer_direction direction) const -> std::filesystem::path {
        return config_.directory /
               (record_key(bucket, key, local_path, direction) + record_suffix);
    }

    auto save(const transfer_state& state) -> result<void> {
        std::lock_guard<std::mutex> lock(mutex_);

        auto dir = ensure_directory();
        if (!dir) {
            return dir;
        }

        auto path = path_for(state.bucket, state.key, state.local_path, state.direction);
        auto temp = path;
        temp += ".tmp";

        {
            std::ofstream file(temp, std::ios::trunc);
            if (!file) {
                OBJSTORE_LOG_ERROR(log_category::resume,
                    "Failed to open resume file for writing: " + temp.string());
                return unexpected{error{error_code::file_write_error,
                    "failed to open resume file for writing"}};
            }
            file << serialize_state_to_json(state);
            file.flush();
            if (!file) {
                OBJSTORE_LOG_ERROR(log_category::resume,
                    "Failed to write resume file: " + temp.string());
                return unexpected{error{error_code::file_write_error,
                    "failed to write resume file"}};
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp, path, ec);
        if (ec) {
            std::filesystem::remove(temp, ec);
            return unexpected{error{error_code::file_write_error,
                "failed to replace resume file " + path.string()}};
        }

        OBJSTORE_LOG_TRACE(log_category::resume,
            "Checkpointed " + state.bucket + "/" + state.key + " (" +
            std::to_string(state.completed_count()) + "/" +
            std::to_string(state.chunks.size()) + " chunks)");
        return {};
    }

    auto read_file(const std::filesystem::path& path) -> std::optional<transfer_state> {
        std::ifstream file(path);
        if (!file) {
            return std::nullopt;
        }
        std::ostringstream oss;
        oss << file.rdbuf();

        auto parsed = deserialize_state_from_json(oss.str());
        if (!parsed) {
            OBJSTORE_LOG_WARN(log_category::resume,
                "Ignoring unreadable resume file " + path.string() + ": " +
                parsed.error().message);
            return std::nullopt;
        }
        return std::move(parsed.value());
    }

    auto is_expired(const transfer_state& state) const -> bool {
        auto age = std::chrono::system_clock::now() - state.updated_at;
        return age > config_.state_ttl;
    }

    auto load(const std::string& bucket,
              const std::string& key,
              const std::filesystem::path& local_path,
              transfer_direction direction) -> std::optional<transfer_state> {
        std::lock_guard<std::mutex> lock(mutex_);

        auto path = path_for(bucket, key, local_path, direction);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            OBJSTORE_LOG_TRACE(log_category::resume, "No resume record at " + path.string());
            return std::nullopt;
        }

        auto state = read_file(path);
        if (!state) {
            return std::nullopt;
        }
        if (is_expired(*state)) {
            OBJSTORE_LOG_INFO(log_category::resume,
                "Discarding expired resume record for " + bucket + "/" + key);
            std::filesystem::remove(path, ec);
            return std::nullopt;
        }

        OBJSTORE_LOG_DEBUG(log_category::resume,
            "Recovered state for " + bucket + "/" + key + " (" +
            std::to_string(state->completed_count()) + "/" +
            std::to_string(state->chunks.size()) + " chunks)");
        return state;
    }

    auto remove(const std::string& bucket,
                const std::string& key,
                const std::filesystem::path& local_path,
                transfer_direction direction) -> result<void> {
        std::lock_guard<std::mutex> lock(mutex_);

        auto path = path_for(bucket, key, local_path, direction);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            return unexpected{error{error_code::file_write_error,
                "failed to delete resume file " + path.string() + ": " + ec.message()}};
        }
        return {};
    }

    auto list_states() -> std::vector<transfer_state> {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<transfer_state> states;
        for (const auto& path : record_files()) {
            auto state = read_file(path);
            if (state && !is_expired(*state)) {
                states.push_back(std::move(*state));
            }
        }
        OBJSTORE_LOG_DEBUG(log_category::resume,
            "Found " + std::to_string(states.size()) + " resumable transfers");
        return states;
    }

    auto cleanup_expired() -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);

        std::size_t removed = 0;
        for (const auto& path : record_files()) {
            auto state = read_file(path);
            if (state && is_expired(*state)) {
                std::error_code ec;
                if (std::filesystem::remove(path, ec)) {
                    ++removed;
                }
            }
        }

        OBJSTORE_LOG_INFO(log_category::resume,
            "Cleanup completed: " + std::to_string(removed) + " expired records removed");
        return removed;
    }

    auto config() const -> const resume_store_config& {
        return config_;
    }

private:
    auto record_files() const -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> files;
        std::error_code ec;
        if (!std::filesystem::is_directory(config_.directory, ec)) {
            return files;
        }
        for (const auto& entry : std::filesystem::directory_iterator(config_.directory, ec)) {
            auto name = entry.path().filename().string();
            const std::string suffix = record_suffix;
            if (name.size() > suffix.size() &&
                name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
                files.push_back(entry.path());
            }
        }
        return files;
    }

    resume_store_config config_;
    std::mutex mutex_;
};

// ============================================================================
// resume_store public interface
// ============================================================================

resume_store::resume_store(const resume_store_config& config)
    : impl_(std::make_unique<impl>(config)) {
}

resume_store::~resume_store() = default;

resume_store::resume_store(resume_store&&) noexcept = default;

auto resume_store::operator=(resume_store&&) noexcept -> resume_store& = default;

auto resume_store::save(const transfer_state& state) -> result<void> {
    return impl_->save(state);
}

auto resume_store::load(const std::string& bucket,
                        const std::string& key,
                        const std::filesystem::path& local_path,
                        transfer_direction direction) -> std::optional<transfer_state> {
    return impl_->load(bucket, key, local_path, direction);
}

auto resume_store::remove(const transfer_state& state) -> result<void> {
    return impl_->remove(state.bucket, state.key, state.local_path, state.direction);
}

auto resume_store::remove(const std::string& bucket,
                          const std::string& key,
                          const std::filesystem::path& local_path,
                          transfer_direction direction) -> result<void> {
    return impl_->remove(bucket, key, local_path, direction);
}

auto resume_store::list_states() -> std::vector<transfer_state> {
    return impl_->list_states();
}

auto resume_store::cleanup_expired() -> std::size_t {
    return impl_->cleanup_expired();
}

auto resume_store::record_path(const std::string& bucket,
                               const std::string& key,
                               const std::filesystem::path& local_path,
                               transfer_direction direction) const -> std::filesystem::path {
    return impl_->path_for(bucket, key, local_path, direction);
}

auto resume_store::config() const -> const resume_store_config& {
    return impl_->config();
}

auto resume_store::record_key(const std::string& bucket,
                              const std::string& key,
                              const std::filesystem::path& local_path,
                              transfer_direction direction) -> std::string {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(local_path, ec);
    if (ec) {
        absolute = local_path;
    }

    std::string identity = bucket + '\n' + key + '\n' +
                           absolute.lexically_normal().string() + '\n' +
                           to_string(direction);

    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx",
                  static_cast<unsigned long long>(storage_utils::fnv1a_64(identity)));
    return hex;
}

}  // namespace kcenon::object_storage
