#include "s3io/metrics.hpp"
#include "s3io/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace s3io {

TransportMetrics::TransportMetrics(const std::map<std::string, std::string>& labels)
    : registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& requests_family = prometheus::BuildCounter()
        .Name("s3io_requests_total")
        .Help("Total object requests completed")
        .Labels(labels)
        .Register(*registry_);
    get_success_ = &requests_family.Add({{"operation", "get_object"}, {"result", "success"}});
    get_failure_ = &requests_family.Add({{"operation", "get_object"}, {"result", "failure"}});
    head_success_ = &requests_family.Add({{"operation", "head_object"}, {"result", "success"}});
    head_failure_ = &requests_family.Add({{"operation", "head_object"}, {"result", "failure"}});

    not_modified_ = &prometheus::BuildCounter()
        .Name("s3io_not_modified_total")
        .Help("Conditional metadata requests answered with Not Modified")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    bytes_received_ = &prometheus::BuildCounter()
        .Name("s3io_bytes_received_total")
        .Help("Total object body bytes received")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    auto& duration_family = prometheus::BuildHistogram()
        .Name("s3io_request_duration_seconds")
        .Help("Object request duration in seconds")
        .Labels(labels)
        .Register(*registry_);
    get_duration_ = &duration_family.Add(
        {{"operation", "get_object"}},
        prometheus::Histogram::BucketBoundaries{
            0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60});
    head_duration_ = &duration_family.Add(
        {{"operation", "head_object"}},
        prometheus::Histogram::BucketBoundaries{
            0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1, 5});
}

TransportMetrics::~TransportMetrics() {
    stop_export();
}

void TransportMetrics::record_request(Operation op, bool success) {
    if (op == Operation::HeadObject) {
        (success ? head_success_ : head_failure_)->Increment();
    } else {
        (success ? get_success_ : get_failure_)->Increment();
    }
}

std::string TransportMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void TransportMetrics::start_export(const std::filesystem::path& prom_file_path,
                                    std::chrono::seconds write_interval) {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
        prom_file_path_ = prom_file_path;
        write_interval_ = write_interval;
    }
    writer_thread_ = std::thread(&TransportMetrics::writer_loop, this);
}

void TransportMetrics::stop_export() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (!was_running) return;

    cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    write_file();
}

void TransportMetrics::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

void TransportMetrics::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("cannot open metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) {
        log_error("failed writing metrics file %s", tmp_path.c_str());
        return;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_error("failed to rename %s: %s", tmp_path.c_str(), ec.message().c_str());
    }
}

}  // namespace s3io
