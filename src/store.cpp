#include "s3io/store.hpp"
#include "s3io/log.hpp"
#include "s3io/s3_transport.hpp"

#include <stdexcept>

namespace s3io {

Store::Store(const StoreConfig& config) {
    auto err = config.validate();
    if (!err.empty()) {
        throw std::invalid_argument("invalid store configuration: " + err);
    }

    if (config.verbose) {
        set_log_verbose(true);
    }

    metrics_ = std::make_shared<TransportMetrics>();
    if (!config.metrics_file.empty()) {
        metrics_->start_export(config.metrics_file,
                               std::chrono::seconds(config.metrics_interval_secs));
        log_info("metrics: writing %s every %zus", config.metrics_file.c_str(),
                 config.metrics_interval_secs);
    }

    transport_ = std::make_shared<S3Transport>(config, metrics_);
}

Store::Store(std::shared_ptr<Transport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("Store requires a transport");
    }
}

Store Store::from_env() {
    return Store(StoreConfig::from_env());
}

}  // namespace s3io
