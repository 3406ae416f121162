#pragma once

#include "s3io/bucket.hpp"
#include "s3io/metrics.hpp"
#include "s3io/store_config.hpp"
#include "s3io/transport.hpp"

#include <memory>
#include <string>

namespace s3io {

/// Entry point: owns the transport shared by every bucket and object
/// handle derived from it.
class Store {
public:
    /// Build an S3 transport from the given configuration. Throws
    /// std::invalid_argument if the configuration does not validate.
    explicit Store(const StoreConfig& config);

    /// Use an existing transport (e.g. a test double).
    explicit Store(std::shared_ptr<Transport> transport);

    /// Store configured from the ambient AWS environment.
    static Store from_env();

    Bucket bucket(const std::string& name) const { return Bucket(name, transport_); }

    const std::shared_ptr<Transport>& transport() const { return transport_; }

    /// Null unless this store built its own S3 transport.
    const std::shared_ptr<TransportMetrics>& metrics() const { return metrics_; }

private:
    std::shared_ptr<TransportMetrics> metrics_;
    std::shared_ptr<Transport> transport_;
};

}  // namespace s3io
