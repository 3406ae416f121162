#pragma once

#include <cstddef>
#include <cstdint>

namespace s3io::constants {

// Store defaults
constexpr const char* DEFAULT_REGION = "us-east-1";
constexpr const char* DEFAULT_USER_AGENT = "s3io/1.0";
constexpr size_t DEFAULT_IO_THREADS = 4;

// HTTP request defaults
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_SECONDS = 10;
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_SECONDS = 60;
constexpr uint32_t DEFAULT_MAX_RETRIES = 3;
constexpr int DEFAULT_INITIAL_RETRY_DELAY_MS = 100;
constexpr size_t DEFAULT_MAX_RESPONSE_SIZE = 512 * 1024 * 1024;        // 512MB

// Stream adapters
constexpr size_t DEFAULT_STREAM_BUFFER_SIZE = 8 * 1024 * 1024;         // 8MB

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace s3io::constants
