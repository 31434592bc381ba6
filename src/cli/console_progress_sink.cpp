/**
 * @file console_progress_sink.cpp
 * @brief Terminal rendering of session progress
 */

#include <usb_responder/cli/console_progress_sink.h>

#include <iomanip>
#include <sstream>

namespace usb_responder {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " B";
    }
    return oss.str();
}

auto format_rate(double bytes_per_second) -> std::string {
    if (bytes_per_second <= 0.0) {
        return "-- B/s";
    }
    return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

auto format_duration(std::chrono::milliseconds ms) -> std::string {
    auto total = ms.count() / 1000;
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    std::ostringstream oss;
    oss << std::setfill('0');
    if (hours > 0) {
        oss << hours << ':' << std::setw(2);
    }
    oss << minutes << ':' << std::setw(2) << seconds;
    return oss.str();
}

console_progress_sink::console_progress_sink(std::ostream& out, const file_catalog& catalog)
    : out_(out) {
    names_.reserve(catalog.count());
    for (const auto& entry : catalog.entries()) {
        names_.push_back(entry.name);
    }
}

auto console_progress_sink::format_line(const progress_snapshot& snapshot) const
    -> std::string {
    std::ostringstream oss;
    oss << '[' << (snapshot.file_index + 1) << "] ";
    if (snapshot.file_index < names_.size()) {
        oss << names_[snapshot.file_index];
    }
    oss << ": " << std::fixed << std::setprecision(1) << snapshot.file_percent() << "% | "
        << format_bytes(snapshot.bytes_done) << '/' << format_bytes(snapshot.file_total)
        << " [" << format_duration(snapshot.elapsed) << ", " << format_rate(snapshot.rate)
        << ']';
    return oss.str();
}

auto console_progress_sink::format_overall(const progress_snapshot& snapshot) const
    -> std::string {
    std::ostringstream oss;
    oss << "Overall: " << snapshot.files_completed << '/' << snapshot.files_total
        << " files | " << format_bytes(snapshot.overall_bytes_done) << '/'
        << format_bytes(snapshot.overall_total);
    return oss.str();
}

void console_progress_sink::on_progress(const progress_snapshot& snapshot) {
    out_ << '\r' << format_line(snapshot) << "\x1b[K" << std::flush;
    line_open_ = true;
}

void console_progress_sink::on_file_completed(const progress_snapshot& snapshot) {
    end_line();
    if (snapshot.files_total > 1) {
        out_ << format_overall(snapshot) << '\n' << std::flush;
    }
}

void console_progress_sink::on_session_event(const session_event& event) {
    switch (event.kind) {
        case session_event_kind::waiting_for_device:
            end_line();
            out_ << "Waiting for device..." << '\n' << std::flush;
            break;
        case session_event_kind::reconnecting:
            end_line();
            out_ << "Connection lost, reconnecting (attempt " << event.retry_count << ", in "
                 << event.delay.count() << " ms)..." << '\n' << std::flush;
            break;
        case session_event_kind::reconnected:
            end_line();
            out_ << "Reconnected." << '\n' << std::flush;
            break;
        case session_event_kind::session_finished:
            end_line();
            break;
        default:
            break;
    }
}

void console_progress_sink::end_line() {
    if (line_open_) {
        out_ << '\n';
        line_open_ = false;
    }
}

}  // namespace usb_responder
