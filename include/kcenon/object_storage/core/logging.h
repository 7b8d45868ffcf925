// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

namespace kcenon::object_storage {

/**
 * @brief Log categories for object storage system
 */
struct log_category {
    static constexpr std::string_view signer = "object_storage.signer";
    static constexpr std::string_view transport = "object_storage.transport";
    static constexpr std::string_view client = "object_storage.client";
    static constexpr std::string_view upload = "object_storage.upload";
    static constexpr std::string_view download = "object_storage.download";
    static constexpr std::string_view resume = "object_storage.resume";
    static constexpr std::string_view progress = "object_storage.progress";
};

/**
 * @brief Log levels for object storage system
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Masks credential material that may leak into log text
 *
 * Covers SigV4 signatures (header and query-string forms), the
 * Credential= scope and any registered access key.
 */
class credential_masker {
public:
    explicit credential_masker(bool enabled = true) : enabled_(enabled) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!enabled_) {
            return input;
        }

        static const std::regex signature_pattern(
            R"((Signature=|X-Amz-Signature=)([0-9a-fA-F]+))");
        static const std::regex credential_pattern(
            R"((Credential=|X-Amz-Credential=)([^/,&%\s]+))");

        auto masked = std::regex_replace(input, signature_pattern, "$1****");
        masked = std::regex_replace(masked, credential_pattern, "$1****");

        if (!access_key_.empty()) {
            std::string::size_type pos = 0;
            while ((pos = masked.find(access_key_, pos)) != std::string::npos) {
                masked.replace(pos, access_key_.size(), mask_key(access_key_));
                pos += 4;
            }
        }
        return masked;
    }

    void set_access_key(std::string key) { access_key_ = std::move(key); }

    void set_enabled(bool enabled) { enabled_ = enabled; }

    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    /**
     * @brief Keep the first four characters of a key visible
     */
    [[nodiscard]] static auto mask_key(const std::string& key) -> std::string {
        if (key.size() <= 4) {
            return std::string(key.size(), '*');
        }
        return key.substr(0, 4) + std::string(key.size() - 4, '*');
    }

private:
    bool enabled_;
    std::string access_key_;
};

/**
 * @brief Structured log context for object transfer operations
 */
struct transfer_log_context {
    std::string bucket;
    std::string key;
    std::optional<std::string> upload_id;
    std::optional<uint64_t> total_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint32_t> chunk_index;
    std::optional<uint32_t> total_chunks;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<int> http_status;
    std::optional<std::string> request_id;
    std::optional<std::string> error_message;

    /**
     * @brief Convert context to JSON string
     */
    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json_string(value) << "\"";
            first = false;
        };
        auto add_number = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!bucket.empty()) add_field("bucket", bucket);
        if (!key.empty()) add_field("key", key);
        if (upload_id) add_field("upload_id", *upload_id);
        if (total_size) add_number("size", *total_size);
        if (bytes_transferred) add_number("bytes_transferred", *bytes_transferred);
        if (chunk_index) add_number("chunk_index", *chunk_index);
        if (total_chunks) add_number("total_chunks", *total_chunks);
        if (rate_mbps) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2)
                << "\"rate_mbps\":" << *rate_mbps;
            first = false;
        }
        if (duration_ms) add_number("duration_ms", *duration_ms);
        if (http_status) add_number("http_status", static_cast<uint64_t>(*http_status));
        if (request_id) add_field("request_id", *request_id);
        if (error_message) add_field("error_message", *error_message);

        oss << "}";
        return oss.str();
    }

    [[nodiscard]] static auto escape_json_string(const std::string& input) -> std::string {
        std::string output;
        output.reserve(input.size() + 16);
        for (char c : input) {
            switch (c) {
                case '"':  output += "\\\""; break;
                case '\\': output += "\\\\"; break;
                case '\n': output += "\\n";  break;
                case '\r': output += "\\r";  break;
                case '\t': output += "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x",
                                      static_cast<unsigned char>(c));
                        output += buf;
                    } else {
                        output += c;
                    }
            }
        }
        return output;
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

// Forward declaration
class object_storage_logger;

/**
 * @brief Global logger accessor
 */
object_storage_logger& get_logger();

/**
 * @brief Object storage logging front end over logger_system
 */
class object_storage_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    object_storage_logger() = default;
    ~object_storage_logger() = default;

    object_storage_logger(const object_storage_logger&) = delete;
    object_storage_logger& operator=(const object_storage_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     * Called by connect().
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            std::lock_guard<std::mutex> lock(logger_mutex_);
            logger_ = std::move(result.value());
        }
    }

    /**
     * @brief Flush and stop the backend logger
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(logger_mutex_);
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
        std::lock_guard<std::mutex> lock(logger_mutex_);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Register the access key so it never appears verbatim in logs
     */
    void register_access_key(std::string key) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_access_key(std::move(key));
    }

    void enable_masking(bool enable = true) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_enabled(enable);
    }

    /**
     * @brief Set custom log callback, invoked before the backend logger
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    /**
     * @brief Log a message
     */
    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {

        if (!is_enabled(level)) return;

        log_output_format format;
        credential_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        auto masked = masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked, context);
            }
        }

        auto full_message = format == log_output_format::json
            ? format_json(level, category, masked, context)
            : format_text(category, masked, context);

        std::lock_guard<std::mutex> lock(logger_mutex_);
        if (!logger_) {
            return;
        }
        if (file && line > 0 && function) {
            logger_->log(to_logger_level(level), full_message, file, line, function);
        } else {
            logger_->log(to_logger_level(level), full_message);
        }
    }

    void flush() {
        std::lock_guard<std::mutex> lock(logger_mutex_);
        if (logger_) {
            logger_->flush();
        }
    }

private:
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    static auto format_text(std::string_view category,
                            const std::string& message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            const std::string& message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_iso8601_timestamp() << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\""
            << transfer_log_context::escape_json_string(message) << "\"";
        if (context) {
            auto ctx_json = context->to_json();
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
    std::mutex logger_mutex_;

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    credential_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline object_storage_logger& get_logger() {
    static object_storage_logger instance;
    return instance;
}

// Logging macros for convenience
#define OBJSTORE_LOG(level, category, message) \
    kcenon::object_storage::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define OBJSTORE_LOG_CTX(level, category, message, context) \
    kcenon::object_storage::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define OBJSTORE_LOG_TRACE(category, message) \
    OBJSTORE_LOG(kcenon::object_storage::log_level::trace, category, message)

#define OBJSTORE_LOG_DEBUG(category, message) \
    OBJSTORE_LOG(kcenon::object_storage::log_level::debug, category, message)

#define OBJSTORE_LOG_INFO(category, message) \
    OBJSTORE_LOG(kcenon::object_storage::log_level::info, category, message)

#define OBJSTORE_LOG_WARN(category, message) \
    OBJSTORE_LOG(kcenon::object_storage::log_level::warn, category, message)

#define OBJSTORE_LOG_ERROR(category, message) \
    OBJSTORE_LOG(kcenon::object_storage::log_level::error, category, message)

#define OBJSTORE_LOG_FATAL(category, message) \
    OBJSTORE_LOG(kcenon::object_storage::log_level::fatal, category, message)

#define OBJSTORE_LOG_DEBUG_CTX(category, message, ctx) \
    OBJSTORE_LOG_CTX(kcenon::object_storage::log_level::debug, category, message, ctx)

#define OBJSTORE_LOG_INFO_CTX(category, message, ctx) \
    OBJSTORE_LOG_CTX(kcenon::object_storage::log_level::info, category, message, ctx)

#define OBJSTORE_LOG_WARN_CTX(category, message, ctx) \
    OBJSTORE_LOG_CTX(kcenon::object_storage::log_level::warn, category, message, ctx)

#define OBJSTORE_LOG_ERROR_CTX(category, message, ctx) \
    OBJSTORE_LOG_CTX(kcenon::object_storage::log_level::error, category, message, ctx)

} // namespace kcenon::object_storage
