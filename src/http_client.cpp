#include "s3io/net/http.hpp"
#include "s3io/log.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>
#include <map>

namespace s3io::net {

// ============================================================================
// Environment-based configuration helpers
// ============================================================================

// Get request timeout from environment, if set and sane
static std::optional<std::chrono::seconds> get_request_timeout_override() {
    if (const char* env = std::getenv("S3IO_REQUEST_TIMEOUT")) {
        try {
            unsigned long secs = std::stoul(env);
            // Sanity check: at least 1 second, at most 1 hour
            if (secs >= 1 && secs <= 3600) {
                return std::chrono::seconds(secs);
            }
            log_error("S3IO_REQUEST_TIMEOUT=%s out of range [1,3600], using default", env);
        } catch (const std::exception&) {
            log_error("invalid S3IO_REQUEST_TIMEOUT=%s, using default", env);
        }
    }
    return std::nullopt;
}

// ============================================================================
// Utility functions
// ============================================================================

static const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

bool is_retryable_network_error(NetworkError error) {
    switch (error) {
        case NetworkError::Timeout:
        case NetworkError::Dispatch:
        case NetworkError::Response:
            return true;
        case NetworkError::None:
        case NetworkError::Construction:
        case NetworkError::BodyTooLarge:
            break;
    }
    return false;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode_path(const std::string& path) {
    std::string result;
    result.reserve(path.size());

    size_t pos = 0;
    while (true) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) {
            result += url_encode(path.substr(pos));
            break;
        }
        result += url_encode(path.substr(pos, slash - pos));
        result += '/';
        pos = slash + 1;
    }
    return result;
}

static const char* const k_day_names[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
static const char* const k_month_names[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                            "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

std::string format_http_date(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (!gmtime_r(&t, &tm)) return {};

    // Fixed English names; strftime would follow the C locale
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  k_day_names[tm.tm_wday], tm.tm_mday, k_month_names[tm.tm_mon],
                  tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& value) {
    char day_name[4] = {};
    char month_name[4] = {};
    int day = 0, year = 0, hour = 0, min = 0, sec = 0;

    if (std::sscanf(value.c_str(), "%3s %d %3s %d %d:%d:%d",
                    day_name, &day, month_name, &year, &hour, &min, &sec) != 7) {
        return std::nullopt;
    }

    int month = -1;
    for (int i = 0; i < 12; ++i) {
        if (std::strncmp(month_name, k_month_names[i], 3) == 0) {
            month = i;
            break;
        }
    }
    if (month < 0) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    tm.tm_isdst = 0;

    time_t tt = timegm(&tm);
    if (tt == -1) return std::nullopt;
    return std::chrono::system_clock::from_time_t(tt);
}

// ============================================================================
// HttpHeaders
// ============================================================================

static std::string lowercase(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    values_[lowercase(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    values_[lowercase(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    values_.erase(lowercase(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = values_.find(lowercase(name));
    if (it == values_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.front();
}

bool HttpHeaders::has(const std::string& name) const {
    return values_.count(lowercase(name)) > 0;
}

std::vector<std::pair<std::string, std::string>> HttpHeaders::entries() const {
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto& [name, values] : values_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value || value->empty()) {
        return std::nullopt;
    }
    // Digits only: no sign, no whitespace, no trailing garbage
    uint64_t length = 0;
    const char* first = value->data();
    const char* last = first + value->size();
    auto [ptr, ec] = std::from_chars(first, last, length);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return length;
}

std::string HttpResponse::body_string() const {
    std::string result;
    result.reserve(body_size);
    for (const auto& chunk : body_chunks) {
        result.append(chunk.begin(), chunk.end());
    }
    return result;
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }

    size_t colon_pos = host_port.rfind(':');
    if (host_port.front() == '[') {
        // IPv6 literal
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) {
            return std::nullopt;
        }
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else if (colon_pos != std::string::npos) {
        result.host = host_port.substr(0, colon_pos);
        try {
            result.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }

    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

std::string ParsedUrl::authority() const {
    std::string result = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    bool default_port = port == 0 ||
                        (scheme == "https" && port == 443) ||
                        (scheme == "http" && port == 80);
    if (!default_port) {
        result += ":" + std::to_string(port);
    }
    return result;
}

// ============================================================================
// CURL callback functions
// ============================================================================

// Context for bounded response accumulation
struct WriteCallbackContext {
    HttpResponse* response;
    size_t max_size;
    bool size_exceeded;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->max_size > 0 && ctx->response->body_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }

    ctx->response->body_chunks.emplace_back(ptr, ptr + bytes);
    ctx->response->body_size += bytes;
    return bytes;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // Skip empty lines and status line
    if (line.empty() || line.starts_with("HTTP/")) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string() : value.substr(start);

        headers->add(name, value);
    }

    return bytes;
}

static NetworkError classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError::Timeout;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_BAD_FUNCTION_ARGUMENT:
        case CURLE_NOT_BUILT_IN:
        case CURLE_OUT_OF_MEMORY:
            return NetworkError::Construction;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
            return NetworkError::Dispatch;
        default:
            return NetworkError::Response;
    }
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        if (auto timeout = get_request_timeout_override()) {
            config_.request_timeout =
                std::chrono::duration_cast<std::chrono::milliseconds>(*timeout);
        }

        if (!config_.verify_ssl) {
            log_error("SSL verification disabled via configuration; "
                      "connections are exposed to man-in-the-middle attacks");
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "curl_easy_init failed";
            response.network_error = NetworkError::Construction;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        if (request.method == HttpMethod::HEAD) {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        } else {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }

        struct curl_slist* header_list = nullptr;
        for (const auto& [name, value] : request.headers.entries()) {
            std::string line = name + ": " + value;
            header_list = curl_slist_append(header_list, line.c_str());
        }
        if (header_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        }

        // Signed requests already carry the range as a header
        std::string range;
        if (request.byte_range && !request.headers.has("Range")) {
            range = std::to_string(request.byte_range->first) + "-" +
                    std::to_string(request.byte_range->second);
            curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
        }

        apply_connection_options(curl);

        WriteCallbackContext write_ctx{&response, config_.max_response_size, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        auto started = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        // The status survives a transfer that was cut short mid-body
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);

        if (write_ctx.size_exceeded) {
            response.error = "response body exceeds " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.network_error = NetworkError::BodyTooLarge;
        } else if (res != CURLE_OK) {
            response.error = curl_easy_strerror(res);
            response.network_error = classify_curl_error(res);
        }

        if (header_list) {
            curl_slist_free_all(header_list);
        }
        release_handle(curl);

        return response;
    }

    HttpResponse execute_with_retry(const HttpRequest& request) {
        const RetryPolicy& policy = config_.retry;
        auto delay = policy.initial_delay;

        for (int attempt = 0;; ++attempt) {
            HttpResponse response = execute(request);

            bool retryable = response.is_network_error()
                ? is_retryable_network_error(response.network_error)
                : is_retryable_status(response.status_code);
            if (!retryable || attempt >= policy.max_retries) {
                return response;
            }

            log_debug("retrying %s %s after %s (attempt %d of %d)",
                      method_name(request.method), request.url.c_str(),
                      response.is_network_error()
                          ? response.error.c_str()
                          : ("HTTP " + std::to_string(response.status_code)).c_str(),
                      attempt + 1, policy.max_retries);

            std::this_thread::sleep_for(delay);
            delay = std::chrono::milliseconds(
                static_cast<long>(delay.count() * policy.backoff_multiplier));
        }
    }

    const HttpClientConfig& config() const { return config_; }

private:
    void apply_connection_options(CURL* curl) const {
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(config_.request_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.tcp_keepalive_idle.count()));
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                             static_cast<long>(config_.tcp_keepalive_interval.count()));
        }

        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
        if (!config_.ca_bundle_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle_path.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_DNS_CACHE_TIMEOUT,
                         static_cast<long>(config_.dns_cache_timeout.count()));

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }
    }

    CURL* acquire_handle() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    // curl_easy_reset keeps the handle's connection cache
    void release_handle(CURL* handle) {
        curl_easy_reset(handle);

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;

    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request) {
    return impl_->execute_with_retry(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

static std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key,
                                        const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

static std::string format_utc(const char* fmt) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

// Query params are already URL-encoded in the URL; only sorting is needed,
// and params without values must appear as "key="
static std::string build_canonical_query_string(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        size_t eq = param.find('=');
        if (eq != std::string::npos) {
            params[param.substr(0, eq)] = param.substr(eq + 1);
        } else {
            params[param] = "";
        }
        pos = amp + 1;
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

// Header names are lowercase and entries() is sorted, so the canonical
// header block and the signed header list come out in the same order
static std::string canonical_request(const HttpRequest& request,
                                     const ParsedUrl& url,
                                     const std::string& signed_headers,
                                     const std::string& payload_hash) {
    std::ostringstream oss;
    oss << method_name(request.method) << "\n";
    oss << (url.path.empty() ? "/" : url.path) << "\n";
    oss << build_canonical_query_string(url.query) << "\n";
    for (const auto& [name, value] : request.headers.entries()) {
        oss << name << ":" << value << "\n";
    }
    oss << "\n";
    oss << signed_headers << "\n";
    oss << payload_hash;
    return oss.str();
}

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id,
                               std::string secret_access_key,
                               std::string region,
                               std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    auto url = ParsedUrl::parse(request.url);
    if (!url) return;

    std::string datetime = format_utc("%Y%m%dT%H%M%SZ");
    std::string date = datetime.substr(0, 8);
    std::string scope = date + "/" + region_ + "/" + service_ + "/aws4_request";

    // GET and HEAD carry no body
    std::string payload_hash = sha256_hex("");

    request.headers.set("Host", url->authority());
    request.headers.set("X-Amz-Date", datetime);
    request.headers.set("X-Amz-Content-Sha256", payload_hash);
    if (request.byte_range) {
        request.headers.set("Range", "bytes=" + std::to_string(request.byte_range->first) + "-" +
                                     std::to_string(request.byte_range->second));
    }

    std::string signed_headers;
    for (const auto& [name, value] : request.headers.entries()) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + datetime + "\n" + scope + "\n" +
        sha256_hex(canonical_request(request, *url, signed_headers, payload_hash));

    auto k_date = hmac_sha256("AWS4" + secret_access_key_, date);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");
    auto signature = hmac_sha256(k_signing, string_to_sign);

    request.headers.set("Authorization",
                        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" + scope +
                        ", SignedHeaders=" + signed_headers +
                        ", Signature=" + to_hex(signature.data(), signature.size()));
}

void AwsSigV4Signer::sign_with_token(HttpRequest& request,
                                     const std::string& session_token) const {
    request.headers.set("X-Amz-Security-Token", session_token);
    sign(request);
}

}  // namespace s3io::net
