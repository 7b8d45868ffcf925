/**
 * @file storage_client.cpp
 * @brief S3 REST operations implementation
 * @version 0.1.0
 */

#include "kcenon/object_storage/storage/storage_client.h"
#include "kcenon/object_storage/auth/request_signer.h"
#include "kcenon/object_storage/core/logging.h"
#include "kcenon/object_storage/core/storage_utils.h"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <sstream>

namespace kcenon::object_storage {

namespace {

// ============================================================================
// Helper Functions
// ============================================================================

/// Largest page ListObjectsV2 returns
constexpr std::size_t list_page_size = 1000;

constexpr std::string_view meta_prefix = "x-amz-meta-";

auto parse_uint64(std::string_view text) -> uint64_t {
    uint64_t value = 0;
    std::from_chars(text.data(), text.data() + text.size(), value);
    return value;
}

auto bucket_path(const std::string& bucket) -> std::string {
    return "/" + bucket;
}

auto object_path(const std::string& bucket, const std::string& key) -> std::string {
    return "/" + bucket + "/" + storage_utils::url_encode(key, false);
}

auto to_body(std::string_view text) -> std::vector<uint8_t> {
    return std::vector<uint8_t>(text.begin(), text.end());
}

auto classify_response(int status, const std::string& backend_code) -> error_code {
    if (backend_code == "NoSuchBucket") {
        return error_code::bucket_not_found;
    }
    if (backend_code == "NoSuchKey") {
        return error_code::object_not_found;
    }
    if (backend_code == "BucketAlreadyOwnedByYou" || backend_code == "BucketAlreadyExists") {
        return error_code::bucket_already_exists;
    }
    if (backend_code == "BucketNotEmpty") {
        return error_code::bucket_not_empty;
    }
    if (backend_code == "PreconditionFailed" || status == 412) {
        return error_code::precondition_failed;
    }
    if (backend_code == "SlowDown" || status == 429 || status == 503) {
        return error_code::throttled;
    }
    if (status == 403) {
        return error_code::access_denied;
    }
    if (status == 404) {
        return error_code::object_not_found;
    }
    if (status == 408) {
        return error_code::request_timeout;
    }
    if (status >= 500 && status < 600) {
        return error_code::server_error;
    }
    return error_code::storage_request_failed;
}

/**
 * @brief Build a storage error from a non-2xx response (or a 200 carrying <Error>)
 */
auto make_storage_error(const http_response& response, const std::string& resource) -> error {
    storage_error_detail detail;
    detail.http_status = response.status_code;
    detail.resource = resource;

    std::string message;
    auto body = response.get_body_string();
    if (!body.empty()) {
        detail.backend_code = storage_utils::extract_xml_element(body, "Code").value_or("");
        message = storage_utils::extract_xml_element(body, "Message").value_or("");
        detail.request_id = storage_utils::extract_xml_element(body, "RequestId").value_or("");
    }
    if (detail.request_id.empty()) {
        detail.request_id = response.get_header("x-amz-request-id").value_or("");
    }
    if (message.empty()) {
        message = "HTTP " + std::to_string(response.status_code) + " for " + resource;
    }

    auto code = classify_response(response.status_code, detail.backend_code);
    return error{code, message, std::move(detail)};
}

auto has_embedded_error(const http_response& response) -> bool {
    auto body = response.get_body_string();
    return body.find("<Error>") != std::string::npos;
}

auto parse_object_entry(const std::string& bucket, std::string_view block) -> object_descriptor {
    object_descriptor obj;
    obj.bucket = bucket;
    obj.key = storage_utils::extract_xml_element(block, "Key").value_or("");
    obj.size = parse_uint64(storage_utils::extract_xml_element(block, "Size").value_or("0"));
    obj.etag = storage_utils::strip_quotes(
        storage_utils::extract_xml_element(block, "ETag").value_or(""));
    obj.last_modified = storage_utils::extract_xml_element(block, "LastModified").value_or("");
    return obj;
}

auto parse_prefix_entry(const std::string& bucket, std::string_view block) -> object_descriptor {
    object_descriptor prefix;
    prefix.bucket = bucket;
    prefix.key = storage_utils::extract_xml_element(block, "Prefix").value_or("");
    prefix.is_prefix = true;
    return prefix;
}

/**
 * @brief Read up to limit bytes in stream_buffer_size steps
 */
auto read_part(std::istream& source, uint64_t limit) -> result<std::vector<uint8_t>> {
    std::vector<uint8_t> part;
    std::vector<char> buffer(stream_buffer_size);
    while (source && part.size() < limit) {
        auto want = std::min<uint64_t>(buffer.size(), limit - part.size());
        source.read(buffer.data(), static_cast<std::streamsize>(want));
        auto count = source.gcount();
        if (count > 0) {
            part.insert(part.end(), buffer.begin(), buffer.begin() + count);
        }
    }
    if (source.bad()) {
        return unexpected{error{error_code::file_read_error,
            "failed to read source stream after " + std::to_string(part.size()) + " bytes"}};
    }
    return part;
}

auto has_more(std::istream& source) -> bool {
    return source && source.peek() != std::char_traits<char>::eof();
}

/**
 * @brief Split a folder path into its marker keys ("a/", "a/b/", ...)
 */
auto folder_markers(const std::string& folder) -> std::vector<std::string> {
    std::vector<std::string> markers;
    std::string path;
    std::string level;

    auto flush = [&] {
        auto first = level.find_first_not_of(" \t");
        if (first != std::string::npos) {
            auto last = level.find_last_not_of(" \t");
            path += level.substr(first, last - first + 1) + "/";
            markers.push_back(path);
        }
        level.clear();
    };

    for (char c : folder) {
        if (c == '/' || c == '\\') {
            flush();
        } else {
            level += c;
        }
    }
    flush();
    return markers;
}

auto build_complete_multipart_xml(const std::vector<completed_part>& parts) -> std::string {
    std::ostringstream xml;
    xml << "<CompleteMultipartUpload>";
    for (const auto& part : parts) {
        xml << "<Part><PartNumber>" << part.part_number << "</PartNumber>"
            << "<ETag>\"" << storage_utils::xml_escape(part.etag) << "\"</ETag></Part>";
    }
    xml << "</CompleteMultipartUpload>";
    return xml.str();
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct storage_client::impl {
    credentials creds;
    std::shared_ptr<http_transport> transport;
    clock_function clock;

    impl(credentials c, std::shared_ptr<http_transport> t, clock_function clk)
        : creds(std::move(c)), transport(std::move(t)), clock(std::move(clk)) {
        if (!clock) {
            clock = [] { return std::chrono::system_clock::now(); };
        }
    }

    auto make_request(http_method method, std::string path) const -> http_request {
        http_request request;
        request.method = method;
        request.scheme = creds.scheme();
        request.host = creds.endpoint;
        request.path = std::move(path);
        return request;
    }

    /**
     * @brief Sign and execute; non-2xx responses are returned, not mapped
     */
    auto send(const http_request& request,
              const transfer_progress_callback& on_progress = {}) -> result<http_response> {
        if (!transport) {
            return unexpected{error{error_code::not_initialized, "no HTTP transport"}};
        }

        auto signed_req = request_signer::sign(request, creds, clock());
        if (!signed_req) {
            OBJSTORE_LOG_ERROR(log_category::client,
                "Signing failed: " + signed_req.error().message);
            return unexpected{signed_req.error()};
        }

        return transport->execute(signed_req.value().request, on_progress);
    }

    /**
     * @brief GET one range; a non-empty if_match pins the object version
     */
    auto fetch_range(const std::string& bucket,
                     const std::string& key,
                     const byte_range& range,
                     const std::string& if_match) -> result<std::vector<uint8_t>> {
        auto request = make_request(http_method::get, object_path(bucket, key));
        request.headers["Range"] =
            "bytes=" + std::to_string(range.offset) + "-" + std::to_string(range.last());
        if (!if_match.empty()) {
            request.headers["If-Match"] = "\"" + if_match + "\"";
        }

        auto response = send(request);
        if (!response) {
            return unexpected{response.error()};
        }
        auto& resp = response.value();
        if (resp.status_code != 206 && resp.status_code != 200) {
            return unexpected{make_storage_error(resp, bucket + "/" + key)};
        }

        // A server that ignores Range answers 200 with the whole object.
        if (resp.status_code == 200 && resp.body.size() > range.length &&
            range.end() <= resp.body.size()) {
            return std::vector<uint8_t>(
                resp.body.begin() + static_cast<std::ptrdiff_t>(range.offset),
                resp.body.begin() + static_cast<std::ptrdiff_t>(range.end()));
        }
        return std::move(resp.body);
    }

    static void apply_put_headers(http_request& request,
                                  const std::string& key,
                                  const put_object_options& options) {
        request.headers["Content-Type"] = options.content_type.empty()
            ? storage_utils::detect_content_type(key)
            : options.content_type;
        for (const auto& [name, value] : options.metadata) {
            request.headers[std::string(meta_prefix) + storage_utils::to_lower(name)] = value;
        }
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

storage_client::storage_client(credentials creds,
                               std::shared_ptr<http_transport> transport,
                               clock_function clock)
    : impl_(std::make_unique<impl>(std::move(creds), std::move(transport), std::move(clock))) {}

storage_client::~storage_client() = default;

storage_client::storage_client(storage_client&&) noexcept = default;
auto storage_client::operator=(storage_client&&) noexcept -> storage_client& = default;

auto storage_client::get_credentials() const -> const credentials& {
    return impl_->creds;
}

// ============================================================================
// Buckets
// ============================================================================

auto storage_client::list_buckets() -> result<std::vector<bucket_descriptor>> {
    auto response = impl_->send(impl_->make_request(http_method::get, "/"));
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (!resp.is_success()) {
        return unexpected{make_storage_error(resp, "/")};
    }

    std::vector<bucket_descriptor> buckets;
    auto body = resp.get_body_string();
    for (const auto& block : storage_utils::extract_xml_elements(body, "Bucket")) {
        bucket_descriptor bucket;
        bucket.name = storage_utils::extract_xml_element(block, "Name").value_or("");
        bucket.creation_date =
            storage_utils::extract_xml_element(block, "CreationDate").value_or("");
        buckets.push_back(std::move(bucket));
    }

    OBJSTORE_LOG_DEBUG(log_category::client,
        "Listed " + std::to_string(buckets.size()) + " buckets");
    return buckets;
}

auto storage_client::bucket_exists(const std::string& bucket) -> result<bool> {
    auto response = impl_->send(impl_->make_request(http_method::head, bucket_path(bucket)));
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (resp.status_code == 404) {
        return false;
    }
    if (!resp.is_success()) {
        return unexpected{make_storage_error(resp, bucket)};
    }
    return true;
}

auto storage_client::create_bucket(const std::string& bucket,
                                   const std::optional<std::string>& region) -> result<void> {
    if (bucket.empty()) {
        return unexpected{error{error_code::invalid_argument, "bucket name is empty"}};
    }

    auto request = impl_->make_request(http_method::put, bucket_path(bucket));
    const auto& location = region.value_or(impl_->creds.region);
    if (!location.empty() && location != "us-east-1") {
        request.body = to_body(
            "<CreateBucketConfiguration><LocationConstraint>" +
            storage_utils::xml_escape(location) +
            "</LocationConstraint></CreateBucketConfiguration>");
        request.headers["Content-Type"] = "application/xml";
    }

    auto response = impl_->send(request);
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return unexpected{make_storage_error(response.value(), bucket)};
    }

    OBJSTORE_LOG_INFO(log_category::client, "Created bucket " + bucket);
    return {};
}

auto storage_client::delete_bucket(const std::string& bucket) -> result<void> {
    auto response = impl_->send(impl_->make_request(http_method::del, bucket_path(bucket)));
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return unexpected{make_storage_error(response.value(), bucket)};
    }

    OBJSTORE_LOG_INFO(log_category::client, "Deleted bucket " + bucket);
    return {};
}

// ============================================================================
// Objects
// ============================================================================

auto storage_client::list_objects(const std::string& bucket,
                                  const list_objects_options& options)
    -> result<std::vector<object_descriptor>> {
    std::vector<object_descriptor> objects;
    std::string continuation;

    auto limit_reached = [&] {
        return options.max_keys != 0 && objects.size() >= options.max_keys;
    };

    do {
        auto request = impl_->make_request(http_method::get, bucket_path(bucket));
        request.query["list-type"] = "2";
        if (!options.prefix.empty()) {
            request.query["prefix"] = options.prefix;
        }
        if (!options.recursive) {
            request.query["delimiter"] = "/";
        }
        if (!continuation.empty()) {
            request.query["continuation-token"] = continuation;
        }
        std::size_t page = list_page_size;
        if (options.max_keys != 0) {
            page = std::min(page, options.max_keys - objects.size());
        }
        request.query["max-keys"] = std::to_string(page);

        auto response = impl_->send(request);
        if (!response) {
            return unexpected{response.error()};
        }
        const auto& resp = response.value();
        if (!resp.is_success()) {
            return unexpected{make_storage_error(resp, bucket)};
        }

        // Keys and common prefixes arrive as two sorted lists; interleave
        // them so the page keeps the backend's key order.
        auto body = resp.get_body_string();
        std::vector<object_descriptor> keys;
        for (const auto& block : storage_utils::extract_xml_elements(body, "Contents")) {
            keys.push_back(parse_object_entry(bucket, block));
        }
        std::vector<object_descriptor> prefixes;
        for (const auto& block : storage_utils::extract_xml_elements(body, "CommonPrefixes")) {
            prefixes.push_back(parse_prefix_entry(bucket, block));
        }

        std::vector<object_descriptor> entries;
        entries.reserve(keys.size() + prefixes.size());
        std::merge(std::make_move_iterator(keys.begin()), std::make_move_iterator(keys.end()),
                   std::make_move_iterator(prefixes.begin()),
                   std::make_move_iterator(prefixes.end()), std::back_inserter(entries),
                   [](const object_descriptor& a, const object_descriptor& b) {
                       return a.key < b.key;
                   });

        for (auto& entry : entries) {
            if (limit_reached()) {
                break;
            }
            objects.push_back(std::move(entry));
        }

        continuation.clear();
        if (storage_utils::extract_xml_element(body, "IsTruncated").value_or("false") == "true") {
            continuation =
                storage_utils::extract_xml_element(body, "NextContinuationToken").value_or("");
        }
    } while (!continuation.empty() && !limit_reached());

    OBJSTORE_LOG_DEBUG(log_category::client,
        "Listed " + std::to_string(objects.size()) + " entries in " + bucket +
        (options.prefix.empty() ? "" : " under " + options.prefix));
    return objects;
}

auto storage_client::head_object(const std::string& bucket, const std::string& key)
    -> result<std::optional<object_descriptor>> {
    auto response = impl_->send(
        impl_->make_request(http_method::head, object_path(bucket, key)));
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (resp.status_code == 404) {
        return std::optional<object_descriptor>{};
    }
    if (!resp.is_success()) {
        return unexpected{make_storage_error(resp, bucket + "/" + key)};
    }

    object_descriptor obj;
    obj.bucket = bucket;
    obj.key = key;
    obj.size = parse_uint64(resp.get_header("Content-Length").value_or("0"));
    obj.etag = storage_utils::strip_quotes(resp.get_header("ETag").value_or(""));
    obj.last_modified = resp.get_header("Last-Modified").value_or("");
    obj.content_type = resp.get_header("Content-Type").value_or("");
    for (const auto& [name, value] : resp.headers) {
        auto lower = storage_utils::to_lower(name);
        if (lower.rfind(meta_prefix, 0) == 0) {
            obj.metadata[lower.substr(meta_prefix.size())] = value;
        }
    }
    return std::optional<object_descriptor>{std::move(obj)};
}

auto storage_client::put_object(const std::string& bucket,
                                const std::string& key,
                                std::istream& source,
                                const put_object_options& options,
                                const transfer_progress_callback& on_progress)
    -> result<std::string> {
    const auto part_size = std::max<uint64_t>(options.part_size, min_upload_chunk_size);

    auto first = read_part(source, part_size);
    if (!first) {
        return unexpected{first.error()};
    }

    if (!has_more(source)) {
        auto request = impl_->make_request(http_method::put, object_path(bucket, key));
        impl::apply_put_headers(request, key, options);
        request.body = std::move(first.value());

        auto response = impl_->send(request, on_progress);
        if (!response) {
            return unexpected{response.error()};
        }
        const auto& resp = response.value();
        if (!resp.is_success()) {
            return unexpected{make_storage_error(resp, bucket + "/" + key)};
        }

        OBJSTORE_LOG_DEBUG(log_category::client,
            "Put " + bucket + "/" + key + " (" + std::to_string(request.body.size()) +
            " bytes)");
        return storage_utils::strip_quotes(resp.get_header("ETag").value_or(""));
    }

    auto upload_id = initiate_multipart_upload(bucket, key, options);
    if (!upload_id) {
        return unexpected{upload_id.error()};
    }

    auto abort_with = [&](error err) -> result<std::string> {
        auto aborted = abort_multipart_upload(bucket, key, upload_id.value());
        if (!aborted) {
            OBJSTORE_LOG_WARN(log_category::client,
                "Could not abort upload " + upload_id.value() + ": " +
                aborted.error().message);
        }
        return unexpected{std::move(err)};
    };

    std::vector<completed_part> parts;
    auto part = std::move(first.value());
    uint64_t sent = 0;
    for (uint32_t number = 1;; ++number) {
        auto uploaded = upload_part(bucket, key, upload_id.value(), number, part);
        if (!uploaded) {
            return abort_with(uploaded.error());
        }
        parts.push_back(completed_part{number, uploaded.value().etag});
        sent += part.size();
        if (on_progress) {
            on_progress(sent);
        }

        if (!has_more(source)) {
            break;
        }
        if (number == max_upload_parts) {
            return abort_with(error{error_code::invalid_argument,
                "stream for " + key + " exceeds " + std::to_string(max_upload_parts) +
                " parts of " + std::to_string(part_size) + " bytes"});
        }

        auto next = read_part(source, part_size);
        if (!next) {
            return abort_with(next.error());
        }
        part = std::move(next.value());
    }

    auto etag = complete_multipart_upload(bucket, key, upload_id.value(), std::move(parts));
    if (!etag) {
        return abort_with(etag.error());
    }

    OBJSTORE_LOG_DEBUG(log_category::client,
        "Put " + bucket + "/" + key + " (" + std::to_string(sent) + " bytes in multipart upload)");
    return etag;
}

auto storage_client::put_object(const std::string& bucket,
                                const std::string& key,
                                std::span<const uint8_t> data,
                                const put_object_options& options) -> result<std::string> {
    std::istringstream source(std::string(data.begin(), data.end()));
    return put_object(bucket, key, source, options);
}

auto storage_client::get_object(const std::string& bucket,
                                const std::string& key,
                                const std::filesystem::path& destination,
                                const transfer_progress_callback& on_progress)
    -> result<uint64_t> {
    std::error_code ec;
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::file_write_error,
                "cannot create directory " + destination.parent_path().string() +
                ": " + ec.message()}};
        }
    }

    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected{error{error_code::file_access_denied,
            "cannot open " + destination.string() + " for writing"}};
    }

    auto written = get_object(bucket, key, file, on_progress);
    file.close();
    if (!written) {
        std::filesystem::remove(destination, ec);
    }
    return written;
}

auto storage_client::get_object(const std::string& bucket,
                                const std::string& key,
                                std::ostream& destination,
                                const transfer_progress_callback& on_progress)
    -> result<uint64_t> {
    auto head = head_object(bucket, key);
    if (!head) {
        return unexpected{head.error()};
    }
    if (!head.value()) {
        storage_error_detail detail;
        detail.http_status = 404;
        detail.backend_code = "NoSuchKey";
        detail.resource = bucket + "/" + key;
        return unexpected{error{error_code::object_not_found,
            "object " + bucket + "/" + key + " does not exist", std::move(detail)}};
    }
    const auto& object = *head.value();

    uint64_t written = 0;
    while (written < object.size) {
        byte_range range(written, std::min(stream_range_size, object.size - written));
        auto slice = impl_->fetch_range(bucket, key, range, object.etag);
        if (!slice) {
            return unexpected{slice.error()};
        }
        const auto& body = slice.value();
        if (body.size() != range.length) {
            return unexpected{error{error_code::size_mismatch,
                "expected " + std::to_string(range.length) + " bytes at offset " +
                std::to_string(range.offset) + " of " + key + ", got " +
                std::to_string(body.size())}};
        }

        std::size_t offset = 0;
        while (offset < body.size()) {
            auto piece = std::min<std::size_t>(stream_buffer_size, body.size() - offset);
            destination.write(reinterpret_cast<const char*>(body.data() + offset),
                              static_cast<std::streamsize>(piece));
            if (!destination) {
                return unexpected{error{error_code::file_write_error,
                    "write failed after " + std::to_string(written) + " bytes of " + key}};
            }
            offset += piece;
            written += piece;
            if (on_progress) {
                on_progress(written);
            }
        }
    }

    OBJSTORE_LOG_DEBUG(log_category::client,
        "Got " + bucket + "/" + key + " (" + std::to_string(written) + " bytes)");
    return written;
}

auto storage_client::get_object_range(const std::string& bucket,
                                      const std::string& key,
                                      const byte_range& range) -> result<std::vector<uint8_t>> {
    if (range.length == 0) {
        return std::vector<uint8_t>{};
    }
    return impl_->fetch_range(bucket, key, range, {});
}

auto storage_client::delete_object(const std::string& bucket, const std::string& key)
    -> result<void> {
    auto response = impl_->send(
        impl_->make_request(http_method::del, object_path(bucket, key)));
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (resp.is_success()) {
        return {};
    }

    auto err = make_storage_error(resp, bucket + "/" + key);
    if (err.code == error_code::object_not_found) {
        return {};
    }
    return unexpected{std::move(err)};
}

auto storage_client::copy_object(const std::string& source_bucket,
                                 const std::string& source_key,
                                 const std::string& destination_bucket,
                                 const std::string& destination_key) -> result<std::string> {
    auto request = impl_->make_request(http_method::put,
                                       object_path(destination_bucket, destination_key));
    request.headers["x-amz-copy-source"] = object_path(source_bucket, source_key);

    auto response = impl_->send(request);
    if (!response) {
        return unexpected{response.error()};
    }
    auto& resp = response.value();
    if (!resp.is_success() || has_embedded_error(resp)) {
        if (resp.is_success()) {
            resp.status_code = 500;
        }
        return unexpected{make_storage_error(resp, destination_bucket + "/" + destination_key)};
    }

    auto etag = storage_utils::extract_xml_element(resp.get_body_string(), "ETag");
    OBJSTORE_LOG_DEBUG(log_category::client,
        "Copied " + source_bucket + "/" + source_key + " to " +
        destination_bucket + "/" + destination_key);
    return storage_utils::strip_quotes(etag.value_or(resp.get_header("ETag").value_or("")));
}

// ============================================================================
// Folders and statistics
// ============================================================================

auto storage_client::create_folder(const std::string& bucket, const std::string& folder)
    -> result<std::vector<std::string>> {
    auto markers = folder_markers(folder);
    if (markers.empty()) {
        return unexpected{error{error_code::invalid_argument,
            "folder name '" + folder + "' is empty"}};
    }

    put_object_options options;
    options.content_type = "application/x-directory";

    std::vector<std::string> created;
    for (const auto& marker : markers) {
        auto existing = head_object(bucket, marker);
        if (!existing) {
            return unexpected{existing.error()};
        }
        if (existing.value()) {
            continue;
        }
        auto etag = put_object(bucket, marker, std::span<const uint8_t>{}, options);
        if (!etag) {
            return unexpected{etag.error()};
        }
        created.push_back(marker);
    }

    OBJSTORE_LOG_INFO(log_category::client,
        "Created " + std::to_string(created.size()) + " folder level(s) for " +
        markers.back() + " in " + bucket);
    return created;
}

auto storage_client::delete_prefix(const std::string& bucket,
                                   const std::string& folder,
                                   bool recursive) -> result<std::size_t> {
    auto markers = folder_markers(folder);
    if (markers.empty()) {
        return unexpected{error{error_code::invalid_argument,
            "folder name '" + folder + "' is empty"}};
    }
    const auto& marker = markers.back();

    list_objects_options options;
    options.prefix = marker;
    auto listed = list_objects(bucket, options);
    if (!listed) {
        return unexpected{listed.error()};
    }
    if (listed.value().empty()) {
        OBJSTORE_LOG_DEBUG(log_category::client,
            "Folder " + marker + " not found in " + bucket);
        return std::size_t{0};
    }

    if (!recursive) {
        auto others = std::count_if(listed.value().begin(), listed.value().end(),
                                    [&](const object_descriptor& obj) {
                                        return obj.key != marker;
                                    });
        if (others > 0) {
            return unexpected{error{error_code::prefix_not_empty,
                "folder " + marker + " in " + bucket + " holds " + std::to_string(others) +
                " object(s)"}};
        }
    }

    std::size_t deleted = 0;
    for (const auto& obj : listed.value()) {
        auto removed = delete_object(bucket, obj.key);
        if (!removed) {
            OBJSTORE_LOG_ERROR(log_category::client,
                "Stopped removing " + marker + " after " + std::to_string(deleted) +
                " object(s): " + removed.error().message);
            return unexpected{removed.error()};
        }
        ++deleted;
    }

    OBJSTORE_LOG_INFO(log_category::client,
        "Removed " + std::to_string(deleted) + " object(s) under " + marker + " in " + bucket);
    return deleted;
}

auto storage_client::bucket_stats(const std::string& bucket,
                                  const std::string& prefix,
                                  std::size_t max_objects) -> result<bucket_statistics> {
    list_objects_options options;
    options.prefix = prefix;
    options.max_keys = max_objects;
    auto listed = list_objects(bucket, options);
    if (!listed) {
        return unexpected{listed.error()};
    }

    bucket_statistics stats;
    stats.bucket = bucket;
    stats.prefix = prefix;
    for (const auto& obj : listed.value()) {
        if (obj.size == 0 && !obj.key.empty() && obj.key.back() == '/') {
            ++stats.folder_count;
        } else {
            ++stats.object_count;
            stats.total_size += obj.size;
        }
    }
    stats.truncated = max_objects != 0 && listed.value().size() >= max_objects;
    return stats;
}

// ============================================================================
// Bucket policy
// ============================================================================

auto storage_client::get_bucket_policy(const std::string& bucket)
    -> result<std::optional<std::string>> {
    auto request = impl_->make_request(http_method::get, bucket_path(bucket));
    request.query["policy"] = "";

    auto response = impl_->send(request);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (resp.is_success()) {
        return std::optional<std::string>{resp.get_body_string()};
    }

    auto err = make_storage_error(resp, bucket);
    if (err.code == error_code::bucket_not_found) {
        return unexpected{std::move(err)};
    }
    if (resp.status_code == 404) {
        return std::optional<std::string>{};
    }
    return unexpected{std::move(err)};
}

auto storage_client::set_bucket_policy(const std::string& bucket,
                                       const std::string& policy_json) -> result<void> {
    if (policy_json.empty()) {
        return unexpected{error{error_code::invalid_argument, "bucket policy is empty"}};
    }

    auto request = impl_->make_request(http_method::put, bucket_path(bucket));
    request.query["policy"] = "";
    request.headers["Content-Type"] = "application/json";
    request.body = to_body(policy_json);

    auto response = impl_->send(request);
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return unexpected{make_storage_error(response.value(), bucket)};
    }

    OBJSTORE_LOG_INFO(log_category::client, "Updated policy of bucket " + bucket);
    return {};
}

auto storage_client::delete_bucket_policy(const std::string& bucket) -> result<void> {
    auto request = impl_->make_request(http_method::del, bucket_path(bucket));
    request.query["policy"] = "";

    auto response = impl_->send(request);
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return unexpected{make_storage_error(response.value(), bucket)};
    }
    return {};
}

// ============================================================================
// Presigned URLs
// ============================================================================

auto storage_client::generate_presigned_url(http_method method,
                                            const std::string& bucket,
                                            const std::string& key,
                                            std::chrono::seconds expiry)
    -> result<presigned_url> {
    auto clamped = std::clamp(expiry, min_presign_expiry, max_presign_expiry);
    if (clamped != expiry) {
        OBJSTORE_LOG_WARN(log_category::client,
            "Presigned URL expiry " + std::to_string(expiry.count()) +
            "s out of range, using " + std::to_string(clamped.count()) + "s");
    }

    auto now = impl_->clock();
    auto url = request_signer::presign(method, impl_->creds.endpoint,
                                       object_path(bucket, key), impl_->creds, now, clamped);
    if (!url) {
        return unexpected{url.error()};
    }

    presigned_url out;
    out.url = std::move(url.value());
    out.method = method;
    out.created_at = now;
    out.expiry = clamped;
    out.expires_at = now + clamped;
    return out;
}

// ============================================================================
// Multipart primitives
// ============================================================================

auto storage_client::initiate_multipart_upload(const std::string& bucket,
                                               const std::string& key,
                                               const put_object_options& options)
    -> result<std::string> {
    auto request = impl_->make_request(http_method::post, object_path(bucket, key));
    request.query["uploads"] = "";
    impl::apply_put_headers(request, key, options);

    auto response = impl_->send(request);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (!resp.is_success()) {
        return unexpected{make_storage_error(resp, bucket + "/" + key)};
    }

    auto upload_id = storage_utils::extract_xml_element(resp.get_body_string(), "UploadId");
    if (!upload_id || upload_id->empty()) {
        return unexpected{error{error_code::invalid_response,
            "InitiateMultipartUpload response has no UploadId"}};
    }
    return *upload_id;
}

auto storage_client::upload_part(const std::string& bucket,
                                 const std::string& key,
                                 const std::string& upload_id,
                                 uint32_t part_number,
                                 std::span<const uint8_t> data,
                                 const transfer_progress_callback& on_progress)
    -> result<uploaded_part> {
    auto request = impl_->make_request(http_method::put, object_path(bucket, key));
    request.query["partNumber"] = std::to_string(part_number);
    request.query["uploadId"] = upload_id;
    request.body.assign(data.begin(), data.end());

    uploaded_part part;
    part.md5 = storage_utils::md5_base64(data);
    request.headers["Content-MD5"] = part.md5;
    request.headers["Content-Type"] = "application/octet-stream";

    auto response = impl_->send(request, on_progress);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (!resp.is_success()) {
        return unexpected{make_storage_error(resp, bucket + "/" + key)};
    }

    auto etag = resp.get_header("ETag");
    if (!etag || etag->empty()) {
        return unexpected{error{error_code::invalid_response,
            "UploadPart response for part " + std::to_string(part_number) + " has no ETag"}};
    }
    part.etag = storage_utils::strip_quotes(*etag);
    return part;
}

auto storage_client::complete_multipart_upload(const std::string& bucket,
                                               const std::string& key,
                                               const std::string& upload_id,
                                               std::vector<completed_part> parts)
    -> result<std::string> {
    if (parts.empty()) {
        return unexpected{error{error_code::invalid_argument,
            "CompleteMultipartUpload needs at least one part"}};
    }
    std::sort(parts.begin(), parts.end(),
              [](const completed_part& a, const completed_part& b) {
                  return a.part_number < b.part_number;
              });

    auto request = impl_->make_request(http_method::post, object_path(bucket, key));
    request.query["uploadId"] = upload_id;
    request.headers["Content-Type"] = "application/xml";
    request.body = to_body(build_complete_multipart_xml(parts));

    auto response = impl_->send(request);
    if (!response) {
        return unexpected{response.error()};
    }
    auto& resp = response.value();
    // S3 can report a completion failure inside a 200 response.
    if (!resp.is_success() || has_embedded_error(resp)) {
        if (resp.is_success()) {
            resp.status_code = 500;
        }
        return unexpected{make_storage_error(resp, bucket + "/" + key)};
    }

    auto etag = storage_utils::extract_xml_element(resp.get_body_string(), "ETag");
    return storage_utils::strip_quotes(etag.value_or(resp.get_header("ETag").value_or("")));
}

auto storage_client::abort_multipart_upload(const std::string& bucket,
                                            const std::string& key,
                                            const std::string& upload_id) -> result<void> {
    auto request = impl_->make_request(http_method::del, object_path(bucket, key));
    request.query["uploadId"] = upload_id;

    auto response = impl_->send(request);
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (!resp.is_success()) {
        auto err = make_storage_error(resp, bucket + "/" + key);
        if (err.detail && err.detail->backend_code == "NoSuchUpload") {
            OBJSTORE_LOG_DEBUG(log_category::client,
                "Upload " + upload_id + " already gone");
            return {};
        }
        return unexpected{std::move(err)};
    }

    OBJSTORE_LOG_INFO(log_category::client,
        "Aborted multipart upload " + upload_id + " for " + bucket + "/" + key);
    return {};
}

}  // namespace kcenon::object_storage
