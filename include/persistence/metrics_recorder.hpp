/**
 * @file metrics_recorder.hpp
 * @brief Asynchronous metric point recording to disk
 *
 * Appends metric points to a file for offline analysis. write() only
 * enqueues; a background thread formats and writes, so the collection
 * loop never waits on disk I/O.
 *
 * **File Formats:**
 * - CSV: header "timestamp,category,name,value,tags", tags as k=v;k=v
 * - JSON: one object per line (StatusFormatter::format_metric_point)
 *
 * @author tradeguard Team
 * @date 2024-11-24
 */

#pragma once

#include "metrics/metrics_sink.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace tradeguard {

/**
 * @brief Recording format
 */
enum class RecordingFormat {
    CSV,    ///< Spreadsheet friendly
    JSON    ///< JSON lines
};

/**
 * @brief Parse "csv" / "json"
 *
 * @return std::optional<RecordingFormat> Empty for anything else
 */
std::optional<RecordingFormat> parse_recording_format(const std::string& name);

/**
 * @brief Recording statistics
 */
struct RecordingStats {
    size_t total_points_recorded{0};    ///< Points written
    size_t bytes_written{0};            ///< Bytes written
    size_t queue_size{0};               ///< Points waiting for the writer
    size_t dropped_points{0};           ///< Points rejected because the queue was full
    uint64_t start_time_ns{0};          ///< Recording start time
    uint64_t last_write_ns{0};          ///< Last write time
    double write_rate_per_sec{0.0};     ///< Points per second since start
};

/**
 * @brief File-backed MetricsSink with a writer thread
 *
 * **Architecture:**
 * - write(): push onto a bounded queue, wake the writer
 * - writer thread: drain the queue, append to the file, flush every
 *   batch_flush_size points
 * - stop(): drain what is left, flush and close
 *
 * Points written while not recording are dropped (write() is a no-op).
 *
 * @code
 * auto recorder = std::make_shared<MetricsRecorder>("metrics.csv", RecordingFormat::CSV);
 * recorder->start();
 *
 * collector.add_sink(recorder);
 * ...
 * recorder->stop();
 * @endcode
 *
 * @note Thread-safe
 */
class MetricsRecorder : public MetricsSink {
public:
    /**
     * @brief Construct recorder
     *
     * @param filename Output file (truncated on start)
     * @param format Output format
     * @param max_queue_size Points buffered before write() starts dropping
     */
    explicit MetricsRecorder(const std::string& filename,
                             RecordingFormat format = RecordingFormat::CSV,
                             size_t max_queue_size = 100000);

    /**
     * @brief Destructor
     *
     * Stops recording if active.
     */
    ~MetricsRecorder() override;

    MetricsRecorder(const MetricsRecorder&) = delete;
    MetricsRecorder& operator=(const MetricsRecorder&) = delete;

    /**
     * @brief Open the file and start the writer thread
     *
     * @return bool False if already recording or the file cannot be opened
     */
    bool start();

    /**
     * @brief Drain the queue, close the file, join the writer
     */
    void stop();

    /**
     * @brief Enqueue a point
     *
     * @throws std::runtime_error if not recording
     */
    void write(const MetricPoint& point) override;

    /**
     * @brief Flush buffered file output
     *
     * Points still queued are not waited for.
     */
    void flush() override;

    RecordingStats get_statistics() const;

    bool is_recording() const { return recording_.load(); }

    const std::string& get_filename() const { return filename_; }

    RecordingFormat get_format() const { return format_; }

private:
    std::string filename_;
    RecordingFormat format_;
    size_t max_queue_size_;

    std::atomic<bool> recording_{false};
    std::unique_ptr<std::thread> writer_thread_;

    std::mutex file_mutex_;                         ///< Protects output_file_
    std::unique_ptr<std::ofstream> output_file_;

    mutable std::mutex queue_mutex_;                ///< Protects queue_
    std::condition_variable queue_cv_;
    std::deque<MetricPoint> queue_;

    std::atomic<size_t> total_points_{0};
    std::atomic<size_t> bytes_written_{0};
    std::atomic<size_t> dropped_points_{0};
    std::atomic<uint64_t> start_time_ns_{0};
    std::atomic<uint64_t> last_write_ns_{0};

    void writer_loop();

    /**
     * @brief Format and append one point (caller holds file_mutex_)
     */
    void write_point(const MetricPoint& point);

    void write_header();

    static std::string format_csv(const MetricPoint& point);
};

} // namespace tradeguard
