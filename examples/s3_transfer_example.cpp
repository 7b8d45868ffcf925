/**
 * @file s3_transfer_example.cpp
 * @brief Upload or download a file against an S3-compatible endpoint
 *
 * This example demonstrates:
 * - Connecting with connection_options_builder
 * - Multipart upload and ranged download with progress events
 * - Resuming an interrupted transfer (run the same command again)
 * - Listing and aborting unfinished uploads
 */

#include <kcenon/object_storage/object_storage.h>

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::object_storage;

namespace {

cancellation_token cancel_token;

void on_signal(int) {
    cancel_token.cancel();
}

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Prints aggregate progress from drained chunk events
 */
class progress_printer {
public:
    void operator()(progress_collector& collector) {
        collector.drain([this](const progress_event& event) {
            if (!event.chunk_index) {
                return;
            }
            chunk_bytes_[*event.chunk_index] = event.bytes_transferred;
        });

        uint64_t done = 0;
        for (const auto& [index, bytes] : chunk_bytes_) {
            done += bytes;
        }
        std::cout << "\r  " << format_bytes(done) << " transferred   " << std::flush;
    }

private:
    std::map<uint32_t, uint64_t> chunk_bytes_;
};

void print_usage(const char* program) {
    std::cout << "S3 Transfer Example - Object Storage System" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <command> <bucket> [args]" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  put <bucket> <local_file> <key>   Upload a file" << std::endl;
    std::cout << "  get <bucket> <key> <local_file>   Download an object" << std::endl;
    std::cout << "  ls <bucket> [prefix]              List objects" << std::endl;
    std::cout << "  pending                           List unfinished transfers" << std::endl;
    std::cout << "  abort-pending                     Abort every unfinished upload" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -e, --endpoint <url>    Endpoint (default: http://localhost:9000)" << std::endl;
    std::cout << "  -r, --region <region>   Region (default: us-east-1)" << std::endl;
    std::cout << "  -j, --parallel <n>      Parallel parts or ranges (default: 4)" << std::endl;
    std::cout << "  -v, --verbose           Debug logging" << std::endl;
    std::cout << std::endl;
    std::cout << "Credentials are read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY." << std::endl;
}

void print_failure(const error& err) {
    std::cerr << std::endl << "Error: " << err.message << " (" << to_string(err.code) << ")";
    if (err.detail) {
        std::cerr << " [HTTP " << err.detail->http_status;
        if (!err.detail->request_id.empty()) {
            std::cerr << ", request " << err.detail->request_id;
        }
        std::cerr << "]";
    }
    std::cerr << std::endl;
    if (is_retryable(err)) {
        std::cerr << "The error is transient; run the command again to resume." << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string endpoint = "http://localhost:9000";
    std::string region = "us-east-1";
    std::size_t parallel = 4;
    bool verbose = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-e" || arg == "--endpoint") {
            if (++i >= argc) {
                std::cerr << "Error: --endpoint requires an argument" << std::endl;
                return 1;
            }
            endpoint = argv[i];
        } else if (arg == "-r" || arg == "--region") {
            if (++i >= argc) {
                std::cerr << "Error: --region requires an argument" << std::endl;
                return 1;
            }
            region = argv[i];
        } else if (arg == "-j" || arg == "--parallel") {
            if (++i >= argc) {
                std::cerr << "Error: --parallel requires an argument" << std::endl;
                return 1;
            }
            parallel = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const char* access_key = std::getenv("AWS_ACCESS_KEY_ID");
    const char* secret_key = std::getenv("AWS_SECRET_ACCESS_KEY");
    if (access_key == nullptr || secret_key == nullptr) {
        std::cerr << "Error: AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY must be set" << std::endl;
        return 1;
    }

    auto options = connection_options_builder()
                       .with_region(region)
                       .with_max_parallel(parallel, parallel)
                       .with_log_level(verbose ? log_level::debug : log_level::warn)
                       .build();
    if (!options) {
        print_failure(options.error());
        return 1;
    }

    auto connected = connect(endpoint, access_key, secret_key, options.value());
    if (!connected) {
        print_failure(connected.error());
        return 1;
    }
    auto& client = connected.value();

    std::signal(SIGINT, on_signal);

    const auto& command = positional[0];
    progress_collector progress;
    progress_printer printer;

    if (command == "put" && positional.size() == 4) {
        upload_options upload;
        upload.cancel = cancel_token;
        upload.on_poll = std::ref(printer);

        std::cout << "Uploading " << positional[2] << " to " << positional[1] << "/"
                  << positional[3] << std::endl;
        auto result = client.upload_file(positional[1], positional[3], positional[2], upload,
                                         &progress);
        printer(progress);
        if (!result.success()) {
            if (result.failure) {
                print_failure(*result.failure);
            }
            return 1;
        }
        std::cout << std::endl
                  << "Done: " << result.total_parts << " parts, etag " << result.etag
                  << (result.was_resumed ? " (resumed)" : "") << ", "
                  << format_bytes(static_cast<uint64_t>(result.average_throughput)) << "/s"
                  << std::endl;
        return 0;
    }

    if (command == "get" && positional.size() == 4) {
        download_options download;
        download.cancel = cancel_token;
        download.on_poll = std::ref(printer);

        std::cout << "Downloading " << positional[1] << "/" << positional[2] << " to "
                  << positional[3] << std::endl;
        auto result = client.download_file(positional[1], positional[2], positional[3],
                                           download, &progress);
        printer(progress);
        if (!result.success()) {
            if (result.failure) {
                print_failure(*result.failure);
            }
            return 1;
        }
        std::cout << std::endl
                  << "Done: " << format_bytes(result.total_size) << " in "
                  << result.total_chunks << " ranges"
                  << (result.was_resumed ? " (resumed)" : "") << std::endl;
        return 0;
    }

    if (command == "ls" && positional.size() >= 2) {
        list_objects_options list;
        list.recursive = false;
        if (positional.size() > 2) {
            list.prefix = positional[2];
        }
        auto objects = client.storage().list_objects(positional[1], list);
        if (!objects) {
            print_failure(objects.error());
            return 1;
        }
        for (const auto& object : objects.value()) {
            if (object.is_prefix) {
                std::cout << std::setw(12) << "DIR" << "  " << object.key << std::endl;
            } else {
                std::cout << std::setw(12) << object.size << "  " << object.key << std::endl;
            }
        }
        return 0;
    }

    if (command == "pending" || command == "abort-pending") {
        for (const auto& state : client.resume_states()) {
            std::cout << to_string(state.direction) << "  " << state.bucket << "/" << state.key
                      << "  " << std::fixed << std::setprecision(1)
                      << state.completion_percentage() << "%" << std::endl;
            if (command == "abort-pending" && state.direction == transfer_direction::upload) {
                auto aborted = client.abort_upload(state);
                if (!aborted) {
                    print_failure(aborted.error());
                }
            }
        }
        return 0;
    }

    print_usage(argv[0]);
    return 1;
}
