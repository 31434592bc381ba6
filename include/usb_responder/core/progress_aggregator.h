/**
 * @file progress_aggregator.h
 * @brief Per-file and overall progress accounting for a session
 *
 * This file defines the progress_aggregator, which turns the progress events
 * emitted by the transfer engine into progress snapshots.
 */

#ifndef USB_RESPONDER_CORE_PROGRESS_AGGREGATOR_H
#define USB_RESPONDER_CORE_PROGRESS_AGGREGATOR_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace usb_responder {

/**
 * @brief Duration type for time measurements
 */
using duration = std::chrono::milliseconds;

/**
 * @brief Bytes of one file acknowledged by the transport
 */
struct progress_event {
    uint32_t file_index = 0;
    uint64_t offset = 0;
    uint64_t bytes = 0;
};

/**
 * @brief Progress state derived after an event
 */
struct progress_snapshot {
    uint32_t file_index = 0;
    uint64_t bytes_done = 0;           ///< Distinct bytes of this file sent
    uint64_t file_total = 0;           ///< Declared size of this file
    uint64_t overall_bytes_done = 0;   ///< Distinct bytes of all files sent
    uint64_t overall_total = 0;        ///< Sum of all declared sizes
    uint32_t files_completed = 0;
    uint32_t files_total = 0;
    duration elapsed{0};
    double rate = 0.0;                 ///< Overall bytes per second

    [[nodiscard]] auto file_percent() const -> double {
        return file_total == 0 ? 100.0
                               : static_cast<double>(bytes_done) * 100.0 /
                                     static_cast<double>(file_total);
    }

    [[nodiscard]] auto overall_percent() const -> double {
        return overall_total == 0 ? 100.0
                                  : static_cast<double>(overall_bytes_done) * 100.0 /
                                        static_cast<double>(overall_total);
    }
};

/**
 * @brief Receiver of progress snapshots
 */
class progress_sink {
public:
    virtual ~progress_sink() = default;

    virtual void on_progress(const progress_snapshot& snapshot) = 0;

    /**
     * @brief Called once when a file's coverage first reaches its size
     */
    virtual void on_file_completed(const progress_snapshot& snapshot) = 0;
};

/**
 * @brief Aggregates progress events into snapshots
 *
 * Per-file progress counts distinct bytes: covered ranges are kept as merged
 * intervals, so a range sent again after a reconnect is not counted twice.
 * Events outside a file's declared size are clamped.
 *
 * @code
 * progress_aggregator progress({1000, 2000});
 * progress.start();
 * auto snap = progress.record({0, 500, 300});
 * // snap.bytes_done == 300, snap.overall_total == 3000
 * @endcode
 */
class progress_aggregator {
public:
    explicit progress_aggregator(std::vector<uint64_t> file_sizes);

    // Non-copyable, movable
    progress_aggregator(const progress_aggregator&) = delete;
    auto operator=(const progress_aggregator&) -> progress_aggregator& = delete;
    progress_aggregator(progress_aggregator&&) noexcept;
    auto operator=(progress_aggregator&&) noexcept -> progress_aggregator&;

    ~progress_aggregator();

    /**
     * @brief Capture the session start time used for elapsed and rate
     */
    void start();

    /**
     * @brief Sink receiving every snapshot; may be null
     */
    void set_sink(progress_sink* sink);

    /**
     * @brief Account for an event and deliver the resulting snapshot
     *
     * Events for an unknown file index are ignored and yield an overall
     * snapshot.
     */
    auto record(const progress_event& event) -> progress_snapshot;

    [[nodiscard]] auto bytes_done(uint32_t file_index) const -> uint64_t;
    [[nodiscard]] auto is_file_complete(uint32_t file_index) const -> bool;
    [[nodiscard]] auto overall_bytes_done() const -> uint64_t;
    [[nodiscard]] auto overall_total() const -> uint64_t;
    [[nodiscard]] auto files_completed() const -> uint32_t;
    [[nodiscard]] auto get_elapsed() const -> duration;

    /**
     * @brief Snapshot of a file without recording anything
     */
    [[nodiscard]] auto snapshot(uint32_t file_index) const -> progress_snapshot;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_CORE_PROGRESS_AGGREGATOR_H
