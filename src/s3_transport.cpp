#include "s3io/s3_transport.hpp"
#include "s3io/log.hpp"

#include <limits>
#include <optional>

namespace s3io {

namespace {

// ============================================================================
// Minimal XML helpers for S3 error bodies
// ============================================================================

// Find the value between <tag>value</tag>, returns empty string if not found
std::string xml_element(const std::string& xml, const std::string& tag) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Decode XML entities (basic set used by S3)
std::string xml_decode(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }
    return result;
}

ErrorKind network_error_kind(net::NetworkError error) {
    switch (error) {
        case net::NetworkError::Timeout: return ErrorKind::Timeout;
        case net::NetworkError::Construction: return ErrorKind::ConstructionFailure;
        case net::NetworkError::Dispatch: return ErrorKind::DispatchFailure;
        case net::NetworkError::Response:
        case net::NetworkError::BodyTooLarge:
        case net::NetworkError::None:
            break;
    }
    return ErrorKind::ResponseError;
}

constexpr int k_status_not_modified = 304;
constexpr int k_status_not_found = 404;

template<typename T>
std::future<T> ready_future(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

}  // namespace

// ============================================================================
// Response classification
// ============================================================================

ObjectError classify_response_error(Operation op,
                                    const net::HttpResponse& response,
                                    const std::string& bucket,
                                    const std::string& key) {
    ObjectError err;
    err.operation = op;
    err.http_status = response.status_code;
    err.context["bucket_name"] = bucket;
    err.context["key"] = key;
    err.request_id = response.headers.get("x-amz-request-id").value_or("");

    if (response.is_network_error()) {
        err.kind = network_error_kind(response.network_error);
        err.message = response.error;
        return err;
    }

    if (response.status_code == k_status_not_modified) {
        err.kind = ErrorKind::NotModified;
        err.message = "object not modified";
        return err;
    }

    // HEAD responses carry no body, so only the status is available
    std::string body = response.body_string();
    err.service_code = xml_element(body, "Code");
    std::string message = xml_decode(xml_element(body, "Message"));
    std::string request_id = xml_element(body, "RequestId");
    if (!request_id.empty()) err.request_id = request_id;

    if (err.service_code == "NoSuchKey" ||
        response.status_code == k_status_not_found) {
        err.kind = ErrorKind::NoSuchKey;
        err.message = message.empty() ? "The specified key does not exist." : message;
    } else if (err.service_code == "InvalidObjectState") {
        err.kind = ErrorKind::InvalidObjectState;
        err.message = message.empty() ? "object is not in a readable state" : message;
    } else {
        err.kind = ErrorKind::Unhandled;
        err.message = message.empty() ? "HTTP " + std::to_string(response.status_code) : message;
    }
    return err;
}

bool parse_object_metadata(const net::HttpHeaders& headers, ObjectMetadata& metadata) {
    if (auto value = headers.get("Last-Modified")) {
        metadata.last_modified = net::parse_http_date(*value);
    }
    metadata.etag = headers.get("ETag").value_or("");
    metadata.content_type = headers.content_type().value_or("application/octet-stream");
    metadata.storage_class = headers.get("x-amz-storage-class").value_or("");

    auto length = headers.content_length();
    if (!length || *length > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    metadata.content_length = static_cast<int64_t>(*length);
    return true;
}

// ============================================================================
// S3Transport
// ============================================================================

S3Transport::S3Transport(const StoreConfig& config, std::shared_ptr<TransportMetrics> metrics)
    : config_(config)
    , metrics_(std::move(metrics)) {
    if (!config_.anonymous()) {
        signer_ = std::make_unique<net::AwsSigV4Signer>(
            config_.access_key.str(), config_.secret_key.str(), config_.region, "s3");
    }

    net::HttpClientConfig http_config;
    http_config.user_agent = config_.user_agent;
    http_config.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
    http_config.request_timeout = std::chrono::seconds(config_.request_timeout_secs);
    http_config.verify_ssl = config_.verify_ssl;
    http_config.ca_bundle_path = config_.ca_bundle_path;
    http_config.max_response_size = config_.max_response_size;
    http_config.retry.max_retries = static_cast<int>(config_.max_retries);
    http_config.retry.initial_delay =
        std::chrono::milliseconds(constants::DEFAULT_INITIAL_RETRY_DELAY_MS);
    http_config.verbose = config_.verbose && log_verbose();
    http_client_ = std::make_unique<net::HttpClient>(http_config);

    executor_ = std::make_unique<IoExecutor>(config_.io_threads);

    log_debug("s3 transport: region=%s endpoint=%s path_style=%d anonymous=%d io_threads=%zu",
              config_.region.c_str(),
              config_.endpoint.empty() ? "(aws)" : config_.endpoint.c_str(),
              config_.use_path_style ? 1 : 0, config_.anonymous() ? 1 : 0,
              executor_->thread_count());
}

S3Transport::~S3Transport() {
    executor_->shutdown();
}

std::string S3Transport::build_url(const std::string& bucket, const std::string& key) const {
    std::string url;
    if (!config_.endpoint.empty()) {
        std::string endpoint = config_.endpoint;
        while (!endpoint.empty() && endpoint.back() == '/') {
            endpoint.pop_back();
        }
        if (config_.use_path_style) {
            url = endpoint + "/" + bucket;
        } else {
            // Virtual-hosted style against a custom endpoint: bucket becomes a subdomain
            size_t scheme_end = endpoint.find("://");
            url = scheme_end == std::string::npos
                ? bucket + "." + endpoint
                : endpoint.substr(0, scheme_end + 3) + bucket + "." + endpoint.substr(scheme_end + 3);
        }
    } else if (config_.use_path_style) {
        url = "https://s3." + config_.region + ".amazonaws.com/" + bucket;
    } else {
        url = "https://" + bucket + ".s3." + config_.region + ".amazonaws.com";
    }
    url += "/" + net::url_encode_path(key);
    return url;
}

net::HttpRequest S3Transport::make_request(net::HttpMethod method, const std::string& url) const {
    net::HttpRequest request;
    request.method = method;
    request.url = url;
    return request;
}

void S3Transport::sign_request(net::HttpRequest& request) const {
    if (!signer_) return;
    if (!config_.session_token.empty()) {
        signer_->sign_with_token(request, config_.session_token.str());
    } else {
        signer_->sign(request);
    }
}

std::future<GetObjectOutcome> S3Transport::get_object(const GetObjectRequest& request) const {
    if (request.range && request.range->first > request.range->second) {
        GetObjectOutcome outcome;
        outcome.error.kind = ErrorKind::ConstructionFailure;
        outcome.error.operation = Operation::GetObject;
        outcome.error.message = "invalid byte range " + std::to_string(request.range->first) +
                                "-" + std::to_string(request.range->second);
        outcome.error.context["bucket_name"] = request.bucket;
        outcome.error.context["key"] = request.key;
        return ready_future(std::move(outcome));
    }
    return executor_->submit([this, request]() { return execute_get(request); });
}

std::future<HeadObjectOutcome> S3Transport::head_object(const HeadObjectRequest& request) const {
    return executor_->submit([this, request]() { return execute_head(request); });
}

GetObjectOutcome S3Transport::execute_get(const GetObjectRequest& request) const {
    GetObjectOutcome outcome;

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->duration(Operation::GetObject));

    net::HttpRequest http_request = make_request(net::HttpMethod::GET,
                                                 build_url(request.bucket, request.key));
    if (request.range) {
        http_request.byte_range = request.range;
    }
    sign_request(http_request);

    if (request.range) {
        log_debug("GET s3://%s/%s bytes=%llu-%llu", request.bucket.c_str(), request.key.c_str(),
                  static_cast<unsigned long long>(request.range->first),
                  static_cast<unsigned long long>(request.range->second));
    } else {
        log_debug("GET s3://%s/%s", request.bucket.c_str(), request.key.c_str());
    }

    auto response = http_client_->execute_with_retry(http_request);

    // A transfer cut short mid-body still delivers what arrived, with the failure attached
    bool cut_short = response.network_error == net::NetworkError::Response &&
                     net::is_success_status(response.status_code) &&
                     response.body_size > 0;

    if (!cut_short && (response.is_network_error() || !response.ok())) {
        outcome.error = classify_response_error(Operation::GetObject, response,
                                                request.bucket, request.key);
        log_debug("GET s3://%s/%s failed: %s", request.bucket.c_str(), request.key.c_str(),
                  outcome.error.to_string().c_str());
        if (metrics_) metrics_->record_request(Operation::GetObject, false);
        return outcome;
    }

    // A body without a usable Content-Length is still delivered as received
    if (!parse_object_metadata(response.headers, outcome.metadata)) {
        outcome.metadata.content_length = static_cast<int64_t>(response.body_size);
    }

    std::optional<ObjectError> trailing_error;
    auto announced = response.headers.content_length();
    if (cut_short || (announced && *announced != response.body_size)) {
        ObjectError err;
        err.kind = ErrorKind::ResponseError;
        err.operation = Operation::GetObject;
        err.http_status = response.status_code;
        err.message = "received " + std::to_string(response.body_size) + " of " +
                      (announced ? std::to_string(*announced) : std::string("?")) + " bytes";
        if (!response.error.empty()) err.message += ": " + response.error;
        err.context["bucket_name"] = request.bucket;
        err.context["key"] = request.key;
        trailing_error = std::move(err);
    }

    if (metrics_) {
        metrics_->record_request(Operation::GetObject, !trailing_error);
        metrics_->record_bytes_received(response.body_size);
    }

    outcome.body = ByteStream(std::move(response.body_chunks), std::move(trailing_error));
    outcome.success = true;
    return outcome;
}

HeadObjectOutcome S3Transport::execute_head(const HeadObjectRequest& request) const {
    HeadObjectOutcome outcome;

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->duration(Operation::HeadObject));

    net::HttpRequest http_request = make_request(net::HttpMethod::HEAD,
                                                 build_url(request.bucket, request.key));
    if (request.if_modified_since) {
        http_request.headers.set("If-Modified-Since",
                                 net::format_http_date(*request.if_modified_since));
    }
    sign_request(http_request);

    log_debug("HEAD s3://%s/%s%s", request.bucket.c_str(), request.key.c_str(),
              request.if_modified_since ? " (conditional)" : "");

    auto response = http_client_->execute_with_retry(http_request);

    if (response.is_network_error() || !response.ok()) {
        outcome.error = classify_response_error(Operation::HeadObject, response,
                                                request.bucket, request.key);
        if (outcome.error.kind == ErrorKind::NotModified) {
            if (metrics_) {
                metrics_->record_request(Operation::HeadObject, true);
                metrics_->record_not_modified();
            }
        } else {
            log_debug("HEAD s3://%s/%s failed: %s", request.bucket.c_str(), request.key.c_str(),
                      outcome.error.to_string().c_str());
            if (metrics_) metrics_->record_request(Operation::HeadObject, false);
        }
        return outcome;
    }

    if (!parse_object_metadata(response.headers, outcome.metadata)) {
        outcome.error.kind = ErrorKind::ResponseError;
        outcome.error.operation = Operation::HeadObject;
        outcome.error.http_status = response.status_code;
        outcome.error.message = "HEAD response has no valid Content-Length";
        outcome.error.request_id = response.headers.get("x-amz-request-id").value_or("");
        outcome.error.context["bucket_name"] = request.bucket;
        outcome.error.context["key"] = request.key;
        log_error("HEAD s3://%s/%s: %s", request.bucket.c_str(), request.key.c_str(),
                  outcome.error.message.c_str());
        if (metrics_) metrics_->record_request(Operation::HeadObject, false);
        return outcome;
    }

    outcome.success = true;
    if (metrics_) metrics_->record_request(Operation::HeadObject, true);
    return outcome;
}

}  // namespace s3io
