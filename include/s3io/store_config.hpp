#pragma once

#include "s3io/constants.hpp"
#include "s3io/secure_string.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace s3io {

/// Connection settings for an S3-compatible service.
struct StoreConfig {
    std::string region = constants::DEFAULT_REGION;
    std::string endpoint;         // Empty for AWS, custom for MinIO/etc
    SecureString access_key;      // Empty access key = anonymous requests
    SecureString secret_key;
    SecureString session_token;   // STS/temporary credentials
    bool use_path_style = false;  // For MinIO compatibility
    bool verify_ssl = true;       // Disable for self-signed certs
    std::string ca_bundle_path;

    // Timeouts
    uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
    uint32_t request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;

    // Retry (transport level only)
    uint32_t max_retries = constants::DEFAULT_MAX_RETRIES;

    // Largest response body accepted, in bytes; 0 = unlimited.
    // A GET over the limit fails with ResponseError and is not retried.
    size_t max_response_size = 0;

    // Background threads running network I/O
    size_t io_threads = constants::DEFAULT_IO_THREADS;

    std::string user_agent = constants::DEFAULT_USER_AGENT;
    bool verbose = false;

    // Prometheus metrics (textfile collector); empty = no export
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Build a configuration from the ambient AWS environment:
    /// AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN,
    /// AWS_REGION (or AWS_DEFAULT_REGION), AWS_ENDPOINT_URL_S3 (or
    /// AWS_ENDPOINT_URL), S3IO_PATH_STYLE and S3IO_VERBOSE.
    static StoreConfig from_env();

    /// Overlay settings from a JSON file. Returns false (and logs) on error,
    /// leaving the config untouched.
    bool load_json(const std::filesystem::path& path);

    /// Returns error message or empty string on success.
    std::string validate() const;

    bool anonymous() const { return access_key.empty(); }
};

}  // namespace s3io
