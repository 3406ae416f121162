#pragma once

#include "s3io/io_executor.hpp"
#include "s3io/metrics.hpp"
#include "s3io/net/http.hpp"
#include "s3io/store_config.hpp"
#include "s3io/transport.hpp"

#include <memory>
#include <string>

namespace s3io {

/// Transport for S3-compatible services over HTTP(S).
///
/// Requests are signed with SigV4 (anonymous when no credentials are
/// configured) and executed on a persistent pool of I/O threads; the
/// returned futures become ready when the response has been received
/// in full. Instances are shared through std::shared_ptr.
class S3Transport : public Transport {
public:
    explicit S3Transport(const StoreConfig& config,
                         std::shared_ptr<TransportMetrics> metrics = nullptr);
    ~S3Transport() override;

    S3Transport(const S3Transport&) = delete;
    S3Transport& operator=(const S3Transport&) = delete;

    std::string type_name() const override { return "s3"; }

    std::future<GetObjectOutcome> get_object(const GetObjectRequest& request) const override;
    std::future<HeadObjectOutcome> head_object(const HeadObjectRequest& request) const override;

    bool on_io_thread() const override { return executor_->on_worker_thread(); }

    /// Object URL, virtual-hosted or path-style depending on configuration.
    std::string build_url(const std::string& bucket, const std::string& key) const;

    const std::shared_ptr<TransportMetrics>& metrics() const { return metrics_; }

    // Blocking request bodies; run on the I/O threads
    GetObjectOutcome execute_get(const GetObjectRequest& request) const;
    HeadObjectOutcome execute_head(const HeadObjectRequest& request) const;

private:
    net::HttpRequest make_request(net::HttpMethod method, const std::string& url) const;
    void sign_request(net::HttpRequest& request) const;

    StoreConfig config_;
    std::unique_ptr<net::AwsSigV4Signer> signer_;  // null for anonymous access
    std::unique_ptr<net::HttpClient> http_client_;
    std::shared_ptr<TransportMetrics> metrics_;

    // Declared last: joined before the client it uses is destroyed
    std::unique_ptr<IoExecutor> executor_;
};

/// Classify a completed HTTP exchange into an ObjectError.
/// Network failures map to the transport kinds; HTTP 304 to NotModified;
/// 404 or <Code>NoSuchKey</Code> to NoSuchKey; <Code>InvalidObjectState</Code>
/// to InvalidObjectState; everything else to Unhandled.
ObjectError classify_response_error(Operation op,
                                    const net::HttpResponse& response,
                                    const std::string& bucket,
                                    const std::string& key);

/// Fill metadata from response headers. Returns false when Content-Length is
/// missing, not a plain decimal number, or beyond int64_t; the other fields
/// are filled in regardless.
bool parse_object_metadata(const net::HttpHeaders& headers, ObjectMetadata& metadata);

}  // namespace s3io
