/**
 * @file in_memory_s3.h
 * @brief In-memory S3 backend implementing http_transport for tests
 */

#ifndef KCENON_OBJECT_STORAGE_TESTS_IN_MEMORY_S3_H
#define KCENON_OBJECT_STORAGE_TESTS_IN_MEMORY_S3_H

#include <kcenon/object_storage/http/http_transport.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::object_storage::test {

/**
 * @brief One request as seen by the backend
 */
struct recorded_request {
    http_method method = http_method::get;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::size_t body_size = 0;

    [[nodiscard]] auto header(const std::string& name) const -> std::optional<std::string>;
    [[nodiscard]] auto has_query(const std::string& name) const -> bool {
        return query.count(name) != 0;
    }
};

/**
 * @brief Path-style S3 emulation covering buckets, objects, ranges,
 *        multipart uploads, bucket policies and ListObjectsV2 paging
 *
 * Faults can be injected per part number, per range offset or for the
 * next N requests. The backend tracks peak request concurrency, and an
 * optional per-request latency makes overlap observable.
 */
class in_memory_s3 : public http_transport {
public:
    struct stored_object {
        std::vector<uint8_t> data;
        std::string etag;
        std::string last_modified;
        std::string content_type;
        std::map<std::string, std::string> metadata;
    };

    in_memory_s3() = default;

    [[nodiscard]] auto execute(const http_request& request,
                               const transfer_progress_callback& on_progress = {})
        -> result<http_response> override;

    // ------------------------------------------------------------------------
    // Direct state access
    // ------------------------------------------------------------------------

    void add_bucket(const std::string& bucket);
    void put(const std::string& bucket, const std::string& key, std::vector<uint8_t> data);
    void put(const std::string& bucket, const std::string& key, const std::string& text);

    [[nodiscard]] auto get(const std::string& bucket, const std::string& key) const
        -> std::optional<stored_object>;
    [[nodiscard]] auto open_upload_count() const -> std::size_t;
    [[nodiscard]] auto uploaded_part_numbers(const std::string& upload_id) const
        -> std::vector<int>;

    // ------------------------------------------------------------------------
    // Fault injection
    // ------------------------------------------------------------------------

    /// UploadPart for part_number answers status for the next times calls
    void fail_part(int part_number, std::size_t times, int status = 500);

    /// Ranged GET starting at offset answers status for the next times calls
    void fail_range(uint64_t offset, std::size_t times, int status = 500);

    /// The next count requests answer status
    void override_status(int status, std::size_t count = 1);

    /// The next count requests fail without a response
    void drop_connections(std::size_t count);

    /// Ignore Range headers and answer 200 with the whole object
    void set_ignore_range(bool ignore) { ignore_range_.store(ignore); }

    /// Sleep this long inside every request
    void set_latency(std::chrono::milliseconds latency) { latency_ = latency; }

    /// Page size used when the request asks for more keys
    void set_list_page_size(std::size_t size) { list_page_size_ = size; }

    /// Runs before each request is handled, outside the backend lock
    void set_on_request(std::function<void(const http_request&)> hook);

    // ------------------------------------------------------------------------
    // Observation
    // ------------------------------------------------------------------------

    [[nodiscard]] auto requests() const -> std::vector<recorded_request>;
    [[nodiscard]] auto count_requests(http_method method) const -> std::size_t;
    [[nodiscard]] auto count_requests(
        const std::function<bool(const recorded_request&)>& predicate) const -> std::size_t;
    [[nodiscard]] auto max_concurrency() const -> std::size_t { return max_in_flight_.load(); }
    void clear_requests();

private:
    struct multipart_upload {
        std::string bucket;
        std::string key;
        std::string content_type;
        std::map<std::string, std::string> metadata;
        std::map<int, stored_object> parts;
    };

    struct bucket_data {
        std::string creation_date;
        std::map<std::string, stored_object> objects;
        std::optional<std::string> policy;
    };

    auto handle(const http_request& request) -> http_response;
    auto handle_service(const http_request& request) -> http_response;
    auto handle_bucket(const http_request& request, const std::string& bucket) -> http_response;
    auto handle_object(const http_request& request,
                       const std::string& bucket,
                       const std::string& key) -> http_response;
    auto list_objects_v2(const http_request& request, const bucket_data& data) -> http_response;
    auto get_object(const http_request& request, const stored_object& object) -> http_response;

    auto next_version() -> std::string;
    static auto make_object(std::vector<uint8_t> data, std::string version) -> stored_object;
    static auto error_response(int status, const std::string& code, const std::string& message)
        -> http_response;

    mutable std::mutex mutex_;
    std::map<std::string, bucket_data> buckets_;
    std::map<std::string, multipart_upload> uploads_;
    uint64_t version_ = 0;
    uint64_t next_upload_ = 0;

    std::map<int, std::pair<std::size_t, int>> part_faults_;
    std::map<uint64_t, std::pair<std::size_t, int>> range_faults_;
    std::size_t status_override_count_ = 0;
    int status_override_ = 500;
    std::size_t dropped_connections_ = 0;

    std::atomic<bool> ignore_range_{false};
    std::chrono::milliseconds latency_{0};
    std::size_t list_page_size_ = 1000;
    std::function<void(const http_request&)> on_request_;

    std::vector<recorded_request> log_;
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<std::size_t> max_in_flight_{0};
};

}  // namespace kcenon::object_storage::test

#endif  // KCENON_OBJECT_STORAGE_TESTS_IN_MEMORY_S3_H
