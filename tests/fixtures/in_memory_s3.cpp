/**
 * @file in_memory_s3.cpp
 * @brief Implementation of the in-memory S3 test backend
 */

#include "in_memory_s3.h"

#include <kcenon/object_storage/core/storage_utils.h>

#include <algorithm>
#include <cctype>
#include <span>
#include <sstream>
#include <thread>

namespace kcenon::object_storage::test {

namespace {

namespace utils = storage_utils;

auto to_bytes(std::string_view text) -> std::vector<uint8_t> {
    return std::vector<uint8_t>(text.begin(), text.end());
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

auto percent_decode(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

auto find_header(const std::map<std::string, std::string>& headers, const std::string& name)
    -> std::optional<std::string> {
    auto wanted = utils::to_lower(name);
    for (const auto& [key, value] : headers) {
        if (utils::to_lower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

auto etag_of(std::span<const uint8_t> data) -> std::string {
    return utils::sha256_hex(data).substr(0, 32);
}

auto code_for_status(int status) -> std::string {
    switch (status) {
        case 400: return "InvalidRequest";
        case 403: return "AccessDenied";
        case 404: return "NoSuchKey";
        case 408: return "RequestTimeout";
        case 429: return "SlowDown";
        case 500: return "InternalError";
        case 503: return "SlowDown";
        default: return "Error";
    }
}

}  // namespace

auto recorded_request::header(const std::string& name) const -> std::optional<std::string> {
    return find_header(headers, name);
}

// ============================================================================
// Direct state access
// ============================================================================

void in_memory_s3::add_bucket(const std::string& bucket) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& data = buckets_[bucket];
    data.creation_date = "2026-01-01T00:00:00.000Z";
}

void in_memory_s3::put(const std::string& bucket,
                       const std::string& key,
                       std::vector<uint8_t> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto object = make_object(std::move(data), next_version());
    object.content_type = "application/octet-stream";
    buckets_[bucket].objects[key] = std::move(object);
}

void in_memory_s3::put(const std::string& bucket, const std::string& key, const std::string& text) {
    put(bucket, key, to_bytes(text));
}

auto in_memory_s3::get(const std::string& bucket, const std::string& key) const
    -> std::optional<stored_object> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bucket_it = buckets_.find(bucket);
    if (bucket_it == buckets_.end()) {
        return std::nullopt;
    }
    auto it = bucket_it->second.objects.find(key);
    if (it == bucket_it->second.objects.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto in_memory_s3::open_upload_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.size();
}

auto in_memory_s3::uploaded_part_numbers(const std::string& upload_id) const
    -> std::vector<int> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> numbers;
    auto it = uploads_.find(upload_id);
    if (it != uploads_.end()) {
        for (const auto& [number, part] : it->second.parts) {
            numbers.push_back(number);
        }
    }
    return numbers;
}

// ============================================================================
// Fault injection and observation
// ============================================================================

void in_memory_s3::fail_part(int part_number, std::size_t times, int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    part_faults_[part_number] = {times, status};
}

void in_memory_s3::fail_range(uint64_t offset, std::size_t times, int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    range_faults_[offset] = {times, status};
}

void in_memory_s3::override_status(int status, std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_override_ = status;
    status_override_count_ = count;
}

void in_memory_s3::drop_connections(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped_connections_ = count;
}

void in_memory_s3::set_on_request(std::function<void(const http_request&)> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_request_ = std::move(hook);
}

auto in_memory_s3::requests() const -> std::vector<recorded_request> {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

auto in_memory_s3::count_requests(http_method method) const -> std::size_t {
    return count_requests([method](const recorded_request& r) { return r.method == method; });
}

auto in_memory_s3::count_requests(
    const std::function<bool(const recorded_request&)>& predicate) const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(log_.begin(), log_.end(), predicate));
}

void in_memory_s3::clear_requests() {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.clear();
}

// ============================================================================
// Transport
// ============================================================================

auto in_memory_s3::execute(const http_request& request,
                           const transfer_progress_callback& on_progress)
    -> result<http_response> {
    auto current = in_flight_.fetch_add(1) + 1;
    auto peak = max_in_flight_.load();
    while (current > peak && !max_in_flight_.compare_exchange_weak(peak, current)) {
    }

    std::function<void(const http_request&)> hook;
    std::chrono::milliseconds latency{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recorded_request record;
        record.method = request.method;
        record.path = request.path;
        record.query = request.query;
        record.headers = request.headers;
        record.body_size = request.body.size();
        log_.push_back(std::move(record));
        hook = on_request_;
        latency = latency_;
    }

    if (hook) {
        hook(request);
    }
    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }

    http_response response;
    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dropped_connections_ > 0) {
            --dropped_connections_;
            dropped = true;
        } else if (status_override_count_ > 0) {
            --status_override_count_;
            response = error_response(status_override_, code_for_status(status_override_),
                                      "injected failure");
        } else {
            response = handle(request);
        }
    }

    in_flight_.fetch_sub(1);

    if (dropped) {
        return unexpected{error{error_code::connection_failed, "injected connection drop"}};
    }
    if (on_progress && !request.body.empty()) {
        on_progress(request.body.size());
    }
    return response;
}

auto in_memory_s3::handle(const http_request& request) -> http_response {
    if (!find_header(request.headers, "Authorization")) {
        return error_response(403, "AccessDenied", "missing Authorization header");
    }

    if (request.path == "/") {
        return handle_service(request);
    }

    auto path = std::string_view(request.path).substr(1);
    auto slash = path.find('/');
    if (slash == std::string_view::npos || slash + 1 == path.size()) {
        return handle_bucket(request, std::string(path.substr(0, slash)));
    }
    return handle_object(request, std::string(path.substr(0, slash)),
                         percent_decode(path.substr(slash + 1)));
}

auto in_memory_s3::handle_service(const http_request& request) -> http_response {
    if (request.method != http_method::get) {
        return error_response(405, "MethodNotAllowed", "unsupported service operation");
    }

    std::ostringstream xml;
    xml << "<ListAllMyBucketsResult><Buckets>";
    for (const auto& [name, data] : buckets_) {
        xml << "<Bucket><Name>" << utils::xml_escape(name) << "</Name><CreationDate>"
            << data.creation_date << "</CreationDate></Bucket>";
    }
    xml << "</Buckets></ListAllMyBucketsResult>";

    http_response response;
    response.status_code = 200;
    response.body = to_bytes(xml.str());
    return response;
}

auto in_memory_s3::handle_bucket(const http_request& request, const std::string& bucket)
    -> http_response {
    auto it = buckets_.find(bucket);
    const bool exists = it != buckets_.end();

    http_response response;
    response.status_code = 200;

    if (request.query.count("policy") != 0) {
        if (!exists) {
            return error_response(404, "NoSuchBucket", "bucket does not exist");
        }
        switch (request.method) {
            case http_method::get:
                if (!it->second.policy) {
                    return error_response(404, "NoSuchBucketPolicy", "no policy");
                }
                response.body = to_bytes(*it->second.policy);
                return response;
            case http_method::put:
                it->second.policy = std::string(request.body.begin(), request.body.end());
                response.status_code = 204;
                return response;
            case http_method::del:
                it->second.policy.reset();
                response.status_code = 204;
                return response;
            default:
                return error_response(405, "MethodNotAllowed", "unsupported policy operation");
        }
    }

    switch (request.method) {
        case http_method::head:
            if (!exists) {
                response.status_code = 404;
            }
            return response;
        case http_method::put:
            if (exists) {
                return error_response(409, "BucketAlreadyOwnedByYou", "bucket exists");
            }
            buckets_[bucket].creation_date = "2026-01-01T00:00:00.000Z";
            return response;
        case http_method::del:
            if (!exists) {
                return error_response(404, "NoSuchBucket", "bucket does not exist");
            }
            if (!it->second.objects.empty()) {
                return error_response(409, "BucketNotEmpty", "bucket is not empty");
            }
            buckets_.erase(it);
            response.status_code = 204;
            return response;
        case http_method::get:
            if (!exists) {
                return error_response(404, "NoSuchBucket", "bucket does not exist");
            }
            return list_objects_v2(request, it->second);
        default:
            return error_response(405, "MethodNotAllowed", "unsupported bucket operation");
    }
}

auto in_memory_s3::list_objects_v2(const http_request& request, const bucket_data& data)
    -> http_response {
    auto query_value = [&](const std::string& name) -> std::string {
        auto it = request.query.find(name);
        return it == request.query.end() ? std::string{} : it->second;
    };

    const auto prefix = query_value("prefix");
    const auto delimiter = query_value("delimiter");
    const auto token = query_value("continuation-token");
    std::size_t max_keys = list_page_size_;
    if (auto requested = query_value("max-keys"); !requested.empty()) {
        max_keys = std::min<std::size_t>(max_keys, std::stoul(requested));
    }

    // Entries in key order; a common prefix is listed once under its own name.
    std::vector<std::pair<std::string, const stored_object*>> entries;
    std::string last_prefix;
    for (const auto& [key, object] : data.objects) {
        if (key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        if (!delimiter.empty()) {
            auto pos = key.find(delimiter, prefix.size());
            if (pos != std::string::npos) {
                auto common = key.substr(0, pos + delimiter.size());
                if (common != last_prefix) {
                    last_prefix = common;
                    entries.emplace_back(common, nullptr);
                }
                continue;
            }
        }
        entries.emplace_back(key, &object);
    }

    std::size_t start = 0;
    if (!token.empty()) {
        while (start < entries.size() && entries[start].first <= token) {
            ++start;
        }
    }
    const auto end = std::min(entries.size(), start + max_keys);
    const bool truncated = end < entries.size();

    std::ostringstream contents;
    std::ostringstream prefixes;
    for (std::size_t i = start; i < end; ++i) {
        const auto& [name, object] = entries[i];
        if (object == nullptr) {
            prefixes << "<CommonPrefixes><Prefix>" << utils::xml_escape(name)
                     << "</Prefix></CommonPrefixes>";
            continue;
        }
        contents << "<Contents><Key>" << utils::xml_escape(name) << "</Key>"
                 << "<LastModified>" << object->last_modified << "</LastModified>"
                 << "<ETag>&quot;" << object->etag << "&quot;</ETag>"
                 << "<Size>" << object->data.size() << "</Size></Contents>";
    }

    std::ostringstream xml;
    xml << "<ListBucketResult><Prefix>" << utils::xml_escape(prefix) << "</Prefix>"
        << "<KeyCount>" << (end - start) << "</KeyCount>"
        << "<IsTruncated>" << (truncated ? "true" : "false") << "</IsTruncated>";
    if (truncated) {
        xml << "<NextContinuationToken>" << utils::xml_escape(entries[end - 1].first)
            << "</NextContinuationToken>";
    }
    xml << contents.str() << prefixes.str() << "</ListBucketResult>";

    http_response response;
    response.status_code = 200;
    response.body = to_bytes(xml.str());
    return response;
}

auto in_memory_s3::handle_object(const http_request& request,
                                 const std::string& bucket,
                                 const std::string& key) -> http_response {
    auto bucket_it = buckets_.find(bucket);
    if (bucket_it == buckets_.end()) {
        return error_response(404, "NoSuchBucket", "bucket does not exist");
    }
    auto& objects = bucket_it->second.objects;

    http_response response;
    response.status_code = 200;

    auto upload_id_it = request.query.find("uploadId");

    // Multipart: initiate
    if (request.method == http_method::post && request.query.count("uploads") != 0) {
        auto upload_id = "upload-" + std::to_string(++next_upload_);
        auto& upload = uploads_[upload_id];
        upload.bucket = bucket;
        upload.key = key;
        upload.content_type = find_header(request.headers, "Content-Type")
                                  .value_or("application/octet-stream");
        for (const auto& [name, value] : request.headers) {
            auto lower = utils::to_lower(name);
            if (lower.rfind("x-amz-meta-", 0) == 0) {
                upload.metadata[lower.substr(11)] = value;
            }
        }
        response.body = to_bytes(
            "<InitiateMultipartUploadResult><Bucket>" + utils::xml_escape(bucket) +
            "</Bucket><Key>" + utils::xml_escape(key) + "</Key><UploadId>" + upload_id +
            "</UploadId></InitiateMultipartUploadResult>");
        return response;
    }

    if (upload_id_it != request.query.end()) {
        auto upload_it = uploads_.find(upload_id_it->second);
        if (upload_it == uploads_.end() || upload_it->second.bucket != bucket ||
            upload_it->second.key != key) {
            return error_response(404, "NoSuchUpload", "upload does not exist");
        }
        auto& upload = upload_it->second;

        // Multipart: upload part
        if (request.method == http_method::put) {
            auto number_it = request.query.find("partNumber");
            if (number_it == request.query.end()) {
                return error_response(400, "InvalidRequest", "missing partNumber");
            }
            const int part_number = std::stoi(number_it->second);

            auto fault = part_faults_.find(part_number);
            if (fault != part_faults_.end() && fault->second.first > 0) {
                --fault->second.first;
                return error_response(fault->second.second,
                                      code_for_status(fault->second.second),
                                      "injected part failure");
            }

            auto md5 = find_header(request.headers, "Content-MD5");
            if (md5 && *md5 != utils::md5_base64(request.body)) {
                return error_response(400, "BadDigest", "Content-MD5 mismatch");
            }

            stored_object part;
            part.data = request.body;
            part.etag = etag_of(part.data);
            response.headers["ETag"] = "\"" + part.etag + "\"";
            upload.parts[part_number] = std::move(part);
            return response;
        }

        // Multipart: complete
        if (request.method == http_method::post) {
            std::string body(request.body.begin(), request.body.end());
            std::vector<uint8_t> assembled;
            std::string etag_concat;
            int previous = 0;
            auto parts = utils::extract_xml_elements(body, "Part");
            if (parts.empty()) {
                return error_response(400, "MalformedXML", "no parts listed");
            }
            for (const auto& block : parts) {
                auto number = std::stoi(utils::extract_xml_element(block, "PartNumber")
                                            .value_or("0"));
                auto etag = utils::strip_quotes(
                    utils::extract_xml_element(block, "ETag").value_or(""));
                if (number <= previous) {
                    return error_response(400, "InvalidPartOrder", "parts out of order");
                }
                previous = number;
                auto part_it = upload.parts.find(number);
                if (part_it == upload.parts.end() || part_it->second.etag != etag) {
                    return error_response(400, "InvalidPart",
                                          "part " + std::to_string(number) + " not found");
                }
                assembled.insert(assembled.end(), part_it->second.data.begin(),
                                 part_it->second.data.end());
                etag_concat += etag;
            }

            auto object = make_object(std::move(assembled), next_version());
            object.etag = utils::sha256_hex(etag_concat).substr(0, 32) + "-" +
                          std::to_string(parts.size());
            object.content_type = upload.content_type;
            object.metadata = upload.metadata;
            auto etag = object.etag;
            objects[key] = std::move(object);
            uploads_.erase(upload_it);

            response.body = to_bytes(
                "<CompleteMultipartUploadResult><Bucket>" + utils::xml_escape(bucket) +
                "</Bucket><Key>" + utils::xml_escape(key) + "</Key><ETag>&quot;" + etag +
                "&quot;</ETag></CompleteMultipartUploadResult>");
            return response;
        }

        // Multipart: abort
        if (request.method == http_method::del) {
            uploads_.erase(upload_it);
            response.status_code = 204;
            return response;
        }

        return error_response(405, "MethodNotAllowed", "unsupported multipart operation");
    }

    auto object_it = objects.find(key);

    switch (request.method) {
        case http_method::head:
            if (object_it == objects.end()) {
                response.status_code = 404;
                return response;
            }
            response.headers["Content-Length"] = std::to_string(object_it->second.data.size());
            response.headers["ETag"] = "\"" + object_it->second.etag + "\"";
            response.headers["Last-Modified"] = object_it->second.last_modified;
            response.headers["Content-Type"] = object_it->second.content_type;
            for (const auto& [name, value] : object_it->second.metadata) {
                response.headers["x-amz-meta-" + name] = value;
            }
            return response;

        case http_method::get:
            if (object_it == objects.end()) {
                return error_response(404, "NoSuchKey", "key does not exist");
            }
            return get_object(request, object_it->second);

        case http_method::put: {
            if (auto source = find_header(request.headers, "x-amz-copy-source")) {
                auto source_path = std::string_view(*source);
                if (!source_path.empty() && source_path.front() == '/') {
                    source_path.remove_prefix(1);
                }
                auto slash = source_path.find('/');
                if (slash == std::string_view::npos) {
                    return error_response(400, "InvalidArgument", "bad copy source");
                }
                auto source_bucket = buckets_.find(std::string(source_path.substr(0, slash)));
                if (source_bucket == buckets_.end()) {
                    return error_response(404, "NoSuchBucket", "source bucket does not exist");
                }
                auto source_key = percent_decode(source_path.substr(slash + 1));
                auto source_object = source_bucket->second.objects.find(source_key);
                if (source_object == source_bucket->second.objects.end()) {
                    return error_response(404, "NoSuchKey", "source key does not exist");
                }
                auto copy = source_object->second;
                copy.last_modified = next_version();
                auto etag = copy.etag;
                objects[key] = std::move(copy);
                response.body = to_bytes("<CopyObjectResult><ETag>&quot;" + etag +
                                         "&quot;</ETag></CopyObjectResult>");
                return response;
            }

            auto object = make_object(request.body, next_version());
            object.content_type = find_header(request.headers, "Content-Type")
                                      .value_or("application/octet-stream");
            for (const auto& [name, value] : request.headers) {
                auto lower = utils::to_lower(name);
                if (lower.rfind("x-amz-meta-", 0) == 0) {
                    object.metadata[lower.substr(11)] = value;
                }
            }
            response.headers["ETag"] = "\"" + object.etag + "\"";
            objects[key] = std::move(object);
            return response;
        }

        case http_method::del:
            if (object_it != objects.end()) {
                objects.erase(object_it);
            }
            response.status_code = 204;
            return response;

        default:
            return error_response(405, "MethodNotAllowed", "unsupported object operation");
    }
}

auto in_memory_s3::get_object(const http_request& request, const stored_object& object)
    -> http_response {
    http_response response;
    response.headers["ETag"] = "\"" + object.etag + "\"";
    response.headers["Last-Modified"] = object.last_modified;
    response.headers["Content-Type"] = object.content_type;

    auto if_match = find_header(request.headers, "If-Match");
    if (if_match && utils::strip_quotes(*if_match) != object.etag) {
        return error_response(412, "PreconditionFailed",
                              "At least one of the pre-conditions you specified did not hold");
    }

    auto range = find_header(request.headers, "Range");
    if (!range || ignore_range_.load()) {
        response.status_code = 200;
        response.body = object.data;
        return response;
    }

    // bytes=first-last
    auto range_text = std::string_view(*range);
    if (range_text.rfind("bytes=", 0) != 0) {
        return error_response(416, "InvalidRange", "unsupported range unit");
    }
    range_text.remove_prefix(6);
    auto dash = range_text.find('-');
    if (dash == std::string_view::npos) {
        return error_response(416, "InvalidRange", "malformed range");
    }
    const auto first = std::stoull(std::string(range_text.substr(0, dash)));
    auto last = std::stoull(std::string(range_text.substr(dash + 1)));
    if (first >= object.data.size() || last < first) {
        return error_response(416, "InvalidRange", "range not satisfiable");
    }
    last = std::min<uint64_t>(last, object.data.size() - 1);

    auto fault = range_faults_.find(first);
    if (fault != range_faults_.end() && fault->second.first > 0) {
        --fault->second.first;
        return error_response(fault->second.second, code_for_status(fault->second.second),
                              "injected range failure");
    }

    response.status_code = 206;
    response.headers["Content-Range"] = "bytes " + std::to_string(first) + "-" +
                                        std::to_string(last) + "/" +
                                        std::to_string(object.data.size());
    response.body.assign(object.data.begin() + static_cast<std::ptrdiff_t>(first),
                         object.data.begin() + static_cast<std::ptrdiff_t>(last + 1));
    return response;
}

// ============================================================================
// Helpers
// ============================================================================

auto in_memory_s3::next_version() -> std::string {
    // Distinct per write so Last-Modified changes on overwrite.
    ++version_;
    return "Thu, 01 Jan 2026 00:00:00 GMT #" + std::to_string(version_);
}

auto in_memory_s3::make_object(std::vector<uint8_t> data, std::string version)
    -> stored_object {
    stored_object object;
    object.etag = etag_of(data);
    object.data = std::move(data);
    object.last_modified = std::move(version);
    return object;
}

auto in_memory_s3::error_response(int status, const std::string& code, const std::string& message)
    -> http_response {
    http_response response;
    response.status_code = status;
    response.headers["x-amz-request-id"] = "req-" + code;
    response.body = to_bytes("<?xml version=\"1.0\" encoding=\"UTF-8\"?><Error><Code>" + code +
                             "</Code><Message>" + utils::xml_escape(message) +
                             "</Message><RequestId>req-" + code + "</RequestId></Error>");
    return response;
}

}  // namespace kcenon::object_storage::test
