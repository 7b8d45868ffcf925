/**
 * @file object_storage.h
 * @brief Main header for object_storage_system library
 * @version 0.1.0
 *
 * Include this header to access the S3-compatible client, the storage
 * operations and the multipart transfer managers.
 *
 * @code
 * #include <kcenon/object_storage/object_storage.h>
 *
 * using namespace kcenon::object_storage;
 *
 * auto client = connect("http://localhost:9000", "minio", "minio123",
 *                       connection_options_builder().with_region("us-east-1")
 *                           .build().value());
 * auto result = client.value().upload_file("backups", "db.tar", "/var/backups/db.tar");
 * @endcode
 */

#ifndef KCENON_OBJECT_STORAGE_OBJECT_STORAGE_H
#define KCENON_OBJECT_STORAGE_OBJECT_STORAGE_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/object_storage/core/types.h"
#include "kcenon/object_storage/core/error_codes.h"

// Configuration
#include "kcenon/object_storage/config/client_config.h"

// Signing and transport
#include "kcenon/object_storage/auth/request_signer.h"
#include "kcenon/object_storage/http/http_transport.h"

// Storage operations
#include "kcenon/object_storage/storage/storage_client.h"

// Transfers
#include "kcenon/object_storage/transfer/progress_collector.h"
#include "kcenon/object_storage/transfer/resume_store.h"
#include "kcenon/object_storage/transfer/transfer_result.h"
#include "kcenon/object_storage/transfer/transfer_state.h"

// Client
#include "kcenon/object_storage/client/object_storage_client.h"

namespace kcenon::object_storage {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::object_storage

#endif  // KCENON_OBJECT_STORAGE_OBJECT_STORAGE_H
