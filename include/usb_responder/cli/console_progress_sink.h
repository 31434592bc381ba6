/**
 * @file console_progress_sink.h
 * @brief Terminal rendering of session progress
 */

#ifndef USB_RESPONDER_CLI_CONSOLE_PROGRESS_SINK_H
#define USB_RESPONDER_CLI_CONSOLE_PROGRESS_SINK_H

#include <usb_responder/core/file_catalog.h>
#include <usb_responder/core/progress_aggregator.h>
#include <usb_responder/session/session_types.h>

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace usb_responder {

/**
 * @brief Format bytes into human-readable string
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format a transfer rate (bytes per second)
 */
[[nodiscard]] auto format_rate(double bytes_per_second) -> std::string;

/**
 * @brief Format duration as [h:]mm:ss
 */
[[nodiscard]] auto format_duration(std::chrono::milliseconds ms) -> std::string;

/**
 * @brief Progress sink writing one line per update
 *
 * Line format: "[n] name: pct% | done/total [elapsed, rate]". Sessions with
 * more than one file also get an "n/m files" overall line when a file
 * completes. Reconnect attempts are announced from session events.
 */
class console_progress_sink : public progress_sink {
public:
    console_progress_sink(std::ostream& out, const file_catalog& catalog);

    void on_progress(const progress_snapshot& snapshot) override;
    void on_file_completed(const progress_snapshot& snapshot) override;

    /**
     * @brief Handle session events relevant to the user
     */
    void on_session_event(const session_event& event);

    /**
     * @brief Render a progress line without writing it
     */
    [[nodiscard]] auto format_line(const progress_snapshot& snapshot) const -> std::string;

    [[nodiscard]] auto format_overall(const progress_snapshot& snapshot) const -> std::string;

private:
    void end_line();

    std::ostream& out_;
    std::vector<std::string> names_;
    bool line_open_ = false;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_CLI_CONSOLE_PROGRESS_SINK_H
