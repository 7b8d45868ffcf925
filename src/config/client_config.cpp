/**
 * @file client_config.cpp
 * @brief Validation for connection_options
 */

#include "kcenon/object_storage/config/client_config.h"

namespace kcenon::object_storage {

auto connection_options::validate() const -> result<void> {
    if (region.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "region must not be empty"}};
    }
    if (timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "timeout must be positive"}};
    }
    if (upload_chunk_size == 0 || download_chunk_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "chunk sizes must be non-zero"}};
    }
    if (max_parallel_uploads == 0 || max_parallel_downloads == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "parallelism must be at least 1"}};
    }
    if (checkpoint_interval == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "checkpoint interval must be at least 1"}};
    }
    if (poll_interval.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "poll interval must be positive"}};
    }
    return {};
}

auto connection_options_builder::build() const -> result<connection_options> {
    auto valid = options_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    return options_;
}

}  // namespace kcenon::object_storage
