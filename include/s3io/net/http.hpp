#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace s3io::net {

// The object transport only reads: GET for bodies, HEAD for metadata
enum class HttpMethod {
    GET,
    HEAD
};

bool is_success_status(int status);

// 429 and the transient 5xx family
bool is_retryable_status(int status);

// Why a request ended without a usable HTTP response
enum class NetworkError {
    None,
    Timeout,        // Connect or transfer timeout
    Construction,   // Request could not be built (malformed URL, bad option)
    Dispatch,       // Could not resolve / connect / send
    Response,       // Connection dropped or the response was malformed
    BodyTooLarge    // Body exceeded HttpClientConfig::max_response_size
};

// Construction failures and size-limit aborts fail again the same way
bool is_retryable_network_error(NetworkError error);

/// Header map with case-insensitive names (stored lowercase).
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // (lowercase name, value) pairs, sorted by name
    std::vector<std::pair<std::string, std::string>> entries() const;

    std::optional<std::string> content_type() const;

    // Unset when the header is absent or not a plain decimal number
    std::optional<uint64_t> content_length() const;

private:
    std::map<std::string, std::vector<std::string>> values_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // Inclusive (first, last); sent as "Range: bytes=first-last"
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;
};

struct HttpResponse {
    int status_code = 0;  // 0 when no status line arrived
    HttpHeaders headers;

    // Body as received, one entry per curl write callback
    std::vector<std::vector<uint8_t>> body_chunks;
    size_t body_size = 0;

    std::chrono::milliseconds elapsed{0};

    NetworkError network_error = NetworkError::None;
    std::string error;

    bool ok() const { return is_success_status(status_code); }
    bool is_network_error() const { return network_error != NetworkError::None; }
    std::string body_string() const;
};

// Exponential backoff between attempts of execute_with_retry()
struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds initial_delay{100};
    double backoff_multiplier = 2.0;
};

// The request timeout can be overridden with S3IO_REQUEST_TIMEOUT (seconds).
struct HttpClientConfig {
    std::string user_agent = "s3io/1.0";

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds request_timeout{60000};

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    // 0 = unlimited. A larger body aborts the transfer with BodyTooLarge.
    size_t max_response_size = 0;

    RetryPolicy retry;

    // Easy handles kept for reuse (each keeps its own connection cache)
    size_t max_idle_handles = 32;

    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    std::chrono::seconds dns_cache_timeout{60};

    bool verbose = false;  // curl's own verbose output
};

/// Blocking libcurl client with a pool of reusable easy handles.
/// Thread-safe: any number of threads may call execute() concurrently.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    // Repeats execute() under config().retry while the failure is retryable
    HttpResponse execute_with_retry(const HttpRequest& request);

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// AWS Signature Version 4 for requests without a body.
class AwsSigV4Signer {
public:
    AwsSigV4Signer(std::string access_key_id,
                   std::string secret_access_key,
                   std::string region,
                   std::string service);

    // Adds Host, X-Amz-Date, X-Amz-Content-Sha256, Range and Authorization
    void sign(HttpRequest& request) const;

    // Same, plus X-Amz-Security-Token for temporary credentials
    void sign_with_token(HttpRequest& request, const std::string& session_token) const;

private:
    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;     // IPv6 literals without brackets
    int port = 0;         // 0 = default for scheme
    std::string path;
    std::string query;

    // Host header value: host, plus the port when it is not the scheme default
    std::string authority() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// RFC 3986 percent-encoding; unreserved characters pass through
std::string url_encode(const std::string& str);

// Encode an object key for a URL path, keeping '/' separators
std::string url_encode_path(const std::string& path);

// RFC 7231 IMF-fixdate, e.g. "Wed, 21 Oct 2015 07:28:00 GMT"
std::string format_http_date(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& value);

}  // namespace s3io::net
