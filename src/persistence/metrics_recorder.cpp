/**
 * @file metrics_recorder.cpp
 * @brief Metrics recorder implementation
 */

#include "persistence/metrics_recorder.hpp"
#include "network/status_formatter.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace tradeguard {

namespace {

constexpr size_t BATCH_FLUSH_SIZE = 100;
constexpr auto WRITER_IDLE_WAIT = std::chrono::milliseconds(100);

const char* format_to_string(RecordingFormat format) {
    return format == RecordingFormat::JSON ? "json" : "csv";
}

} // namespace

std::optional<RecordingFormat> parse_recording_format(const std::string& name) {
    if (name == "csv") {
        return RecordingFormat::CSV;
    }
    if (name == "json") {
        return RecordingFormat::JSON;
    }
    return std::nullopt;
}

MetricsRecorder::MetricsRecorder(const std::string& filename,
                                 RecordingFormat format,
                                 size_t max_queue_size)
    : filename_(filename)
    , format_(format)
    , max_queue_size_(max_queue_size) {

    spdlog::info("MetricsRecorder: Created for file {} (format: {}, queue: {})",
                filename_, format_to_string(format_), max_queue_size_);
}

MetricsRecorder::~MetricsRecorder() {
    if (recording_.load()) {
        stop();
    }
}

bool MetricsRecorder::start() {
    if (recording_.load()) {
        spdlog::warn("MetricsRecorder: Already recording");
        return false;
    }

    total_points_.store(0);
    bytes_written_.store(0);
    dropped_points_.store(0);
    start_time_ns_.store(get_timestamp_ns());
    last_write_ns_.store(0);

    {
        std::lock_guard<std::mutex> lock(file_mutex_);

        output_file_ = std::make_unique<std::ofstream>(filename_, std::ios::out | std::ios::trunc);
        if (!output_file_->is_open()) {
            spdlog::error("MetricsRecorder: Failed to open file {}", filename_);
            output_file_.reset();
            return false;
        }

        write_header();
    }

    recording_.store(true);
    writer_thread_ = std::make_unique<std::thread>([this]() {
        writer_loop();
    });

    spdlog::info("MetricsRecorder: Recording started");
    return true;
}

void MetricsRecorder::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!recording_.exchange(false)) {
            return;
        }
    }
    queue_cv_.notify_all();

    if (writer_thread_ && writer_thread_->joinable()) {
        writer_thread_->join();
    }
    writer_thread_.reset();

    {
        std::lock_guard<std::mutex> lock(file_mutex_);
        if (output_file_ && output_file_->is_open()) {
            output_file_->flush();
            output_file_->close();
        }
    }

    auto stats = get_statistics();
    spdlog::info("MetricsRecorder: Recording stopped - {} points, {} bytes written, {} dropped",
                stats.total_points_recorded, stats.bytes_written, stats.dropped_points);
}

void MetricsRecorder::write(const MetricPoint& point) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (!recording_.load()) {
            throw std::runtime_error("MetricsRecorder: not recording");
        }

        if (queue_.size() >= max_queue_size_) {
            dropped_points_.fetch_add(1);
            return;
        }

        queue_.push_back(point);
    }
    queue_cv_.notify_one();
}

void MetricsRecorder::flush() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (output_file_ && output_file_->is_open()) {
        output_file_->flush();
    }
}

RecordingStats MetricsRecorder::get_statistics() const {
    RecordingStats stats;
    stats.total_points_recorded = total_points_.load();
    stats.bytes_written = bytes_written_.load();
    stats.dropped_points = dropped_points_.load();
    stats.start_time_ns = start_time_ns_.load();
    stats.last_write_ns = last_write_ns_.load();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stats.queue_size = queue_.size();
    }

    uint64_t now = get_timestamp_ns();
    if (stats.start_time_ns > 0 && now > stats.start_time_ns) {
        double elapsed_sec = static_cast<double>(now - stats.start_time_ns) / 1'000'000'000.0;
        stats.write_rate_per_sec = static_cast<double>(stats.total_points_recorded) / elapsed_sec;
    }

    return stats;
}

void MetricsRecorder::writer_loop() {
    spdlog::debug("MetricsRecorder: Writer thread started");

    size_t batch_count = 0;
    std::vector<MetricPoint> batch;

    while (true) {
        bool keep_running;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, WRITER_IDLE_WAIT, [this]() {
                return !queue_.empty() || !recording_.load();
            });

            batch.assign(queue_.begin(), queue_.end());
            queue_.clear();
            keep_running = recording_.load();
        }

        if (!batch.empty()) {
            std::lock_guard<std::mutex> lock(file_mutex_);

            for (const auto& point : batch) {
                write_point(point);
                total_points_.fetch_add(1);

                if (++batch_count >= BATCH_FLUSH_SIZE) {
                    output_file_->flush();
                    batch_count = 0;
                }
            }
            last_write_ns_.store(get_timestamp_ns());
            batch.clear();
        }

        if (!keep_running) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(file_mutex_);
    output_file_->flush();
    spdlog::debug("MetricsRecorder: Writer thread stopped");
}

void MetricsRecorder::write_header() {
    if (format_ == RecordingFormat::CSV) {
        static const std::string header = "timestamp,category,name,value,tags\n";
        *output_file_ << header;
        bytes_written_.fetch_add(header.size());
    }
}

void MetricsRecorder::write_point(const MetricPoint& point) {
    std::string line = (format_ == RecordingFormat::JSON)
        ? StatusFormatter::format_metric_point(point)
        : format_csv(point);
    line += '\n';

    *output_file_ << line;
    bytes_written_.fetch_add(line.size());
}

std::string MetricsRecorder::format_csv(const MetricPoint& point) {
    std::ostringstream csv;
    csv << std::fixed << std::setprecision(6);

    csv << nanos_to_iso8601(point.timestamp_ns) << ","
        << point.category << ","
        << point.name << ","
        << point.value << ",";

    bool first = true;
    for (const auto& [key, value] : point.tags) {
        if (!first) csv << ";";
        first = false;
        csv << key << "=" << value;
    }

    return csv.str();
}

} // namespace tradeguard
