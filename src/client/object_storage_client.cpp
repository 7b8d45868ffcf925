/**
 * @file object_storage_client.cpp
 * @brief Implementation of object_storage_client and connect()
 */

#include "kcenon/object_storage/client/object_storage_client.h"

#include "kcenon/object_storage/core/logging.h"
#include "kcenon/object_storage/storage/storage_client.h"
#include "kcenon/object_storage/transfer/multipart_download_manager.h"
#include "kcenon/object_storage/transfer/multipart_upload_manager.h"
#include "kcenon/object_storage/transfer/resume_store.h"

namespace kcenon::object_storage {

namespace {

constexpr std::string_view http_prefix = "http://";
constexpr std::string_view https_prefix = "https://";

auto starts_with(const std::string& text, std::string_view prefix) -> bool {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

struct object_storage_client::impl {
    connection_options options;
    storage_client storage;
    std::unique_ptr<resume_store> store;
    multipart_upload_manager uploads;
    multipart_download_manager downloads;

    impl(credentials creds,
         std::shared_ptr<http_transport> transport,
         connection_options opts,
         std::unique_ptr<resume_store> resume)
        : options(std::move(opts))
        , storage(std::move(creds), std::move(transport))
        , store(std::move(resume))
        , uploads(storage, store.get(), options)
        , downloads(storage, store.get(), options) {}
};

object_storage_client::object_storage_client(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {}

object_storage_client::~object_storage_client() = default;

object_storage_client::object_storage_client(object_storage_client&&) noexcept = default;

auto object_storage_client::operator=(object_storage_client&&) noexcept
    -> object_storage_client& = default;

auto object_storage_client::list_buckets() -> result<std::vector<bucket_descriptor>> {
    return impl_->storage.list_buckets();
}

auto object_storage_client::storage() -> storage_client& {
    return impl_->storage;
}

auto object_storage_client::upload_file(const std::string& bucket,
                                        const std::string& key,
                                        const std::filesystem::path& local_path,
                                        const upload_options& options,
                                        progress_collector* progress) -> upload_result {
    return impl_->uploads.upload(bucket, key, local_path, options, progress);
}

auto object_storage_client::download_file(const std::string& bucket,
                                          const std::string& key,
                                          const std::filesystem::path& destination,
                                          const download_options& options,
                                          progress_collector* progress) -> download_result {
    return impl_->downloads.download(bucket, key, destination, options, progress);
}

auto object_storage_client::abort_upload(const transfer_state& state) -> result<void> {
    return impl_->uploads.abort_upload(state);
}

auto object_storage_client::resume_states() -> std::vector<transfer_state> {
    if (!impl_->store) {
        return {};
    }
    return impl_->store->list_states();
}

auto object_storage_client::options() const -> const connection_options& {
    return impl_->options;
}

// ============================================================================
// connect
// ============================================================================

auto connect(const std::string& endpoint,
             const std::string& access_key,
             const std::string& secret_key,
             std::shared_ptr<http_transport> transport,
             const connection_options& options) -> result<object_storage_client> {
    auto validated = options.validate();
    if (!validated) {
        return unexpected{validated.error()};
    }

    if (!transport) {
        return unexpected{error{error_code::invalid_argument, "transport must not be null"}};
    }

    auto& logger = get_logger();
    logger.set_level(options.min_log_level);
    logger.initialize();
    if (!access_key.empty()) {
        logger.register_access_key(access_key);
    }

    connection_options effective = options;
    std::string host = endpoint;
    if (starts_with(host, https_prefix)) {
        host.erase(0, https_prefix.size());
        effective.use_tls = true;
    } else if (starts_with(host, http_prefix)) {
        host.erase(0, http_prefix.size());
        effective.use_tls = false;
    }
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }

    if (host.empty()) {
        return unexpected{error{error_code::invalid_argument, "endpoint must name a host"}};
    }

    credentials creds;
    creds.access_key = access_key;
    creds.secret_key = secret_key;
    creds.region = effective.region;
    creds.endpoint = host;
    creds.use_tls = effective.use_tls;

    if (!creds.has_keys()) {
        return unexpected{error{error_code::missing_credentials,
            "access key and secret key are required"}};
    }

    std::unique_ptr<resume_store> store;
    if (effective.enable_resume) {
        resume_store_config store_config;
        if (!effective.resume_directory.empty()) {
            store_config.directory = effective.resume_directory;
        }
        store = std::make_unique<resume_store>(store_config);
    }

    OBJSTORE_LOG_INFO(log_category::client,
        "Connected to " + std::string(creds.scheme()) + "://" + host +
        " (region " + creds.region + ")");

    return object_storage_client(std::make_unique<object_storage_client::impl>(
        std::move(creds), std::move(transport), std::move(effective), std::move(store)));
}

auto connect(const std::string& endpoint,
             const std::string& access_key,
             const std::string& secret_key,
             const connection_options& options) -> result<object_storage_client> {
    return connect(endpoint, access_key, secret_key,
                   make_network_transport(options.timeout), options);
}

}  // namespace kcenon::object_storage
