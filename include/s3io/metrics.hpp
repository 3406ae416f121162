#pragma once

#include "s3io/error.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace s3io {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Request counters and latency histograms for one S3 transport.
///
/// Owns a prometheus::Registry. Optionally a background writer thread
/// periodically serializes the registry to a .prom textfile (temp+rename)
/// for node_exporter pickup.
class TransportMetrics {
public:
    /// @param labels  Constant labels applied to all metrics.
    explicit TransportMetrics(const std::map<std::string, std::string>& labels = {});
    ~TransportMetrics();

    TransportMetrics(const TransportMetrics&) = delete;
    TransportMetrics& operator=(const TransportMetrics&) = delete;

    /// Record the result of one GetObject / HeadObject request.
    /// A NotModified answer counts as a success and bumps not_modified.
    void record_request(Operation op, bool success);
    void record_not_modified() { not_modified_->Increment(); }
    void record_bytes_received(size_t bytes) {
        bytes_received_->Increment(static_cast<double>(bytes));
    }

    prometheus::Histogram& duration(Operation op) {
        return op == Operation::HeadObject ? *head_duration_ : *get_duration_;
    }

    // --- Counter accessors ---
    prometheus::Counter& get_success() { return *get_success_; }
    prometheus::Counter& get_failure() { return *get_failure_; }
    prometheus::Counter& head_success() { return *head_success_; }
    prometheus::Counter& head_failure() { return *head_failure_; }
    prometheus::Counter& not_modified() { return *not_modified_; }
    prometheus::Counter& bytes_received() { return *bytes_received_; }

    /// Current registry contents in Prometheus text exposition format.
    std::string serialize() const;

    /// Start writing the registry to prom_file_path every write_interval.
    void start_export(const std::filesystem::path& prom_file_path,
                      std::chrono::seconds write_interval);

    /// Stop the writer thread (writes one final snapshot).
    void stop_export();

private:
    void writer_loop();
    void write_file();

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* get_success_;
    prometheus::Counter* get_failure_;
    prometheus::Counter* head_success_;
    prometheus::Counter* head_failure_;
    prometheus::Counter* not_modified_;
    prometheus::Counter* bytes_received_;

    // --- Histograms ---
    prometheus::Histogram* get_duration_;
    prometheus::Histogram* head_duration_;

    // Writer thread
    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_{15};
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace s3io
