/**
 * @file progress_aggregator.cpp
 * @brief Implementation of session progress accounting
 */

#include "usb_responder/core/progress_aggregator.h"

#include <algorithm>
#include <iterator>
#include <map>

namespace usb_responder {

using time_point = std::chrono::steady_clock::time_point;

/**
 * @brief Coverage of one file as disjoint, non-adjacent [begin, end) intervals
 */
struct file_coverage {
    uint64_t size = 0;
    uint64_t covered = 0;
    bool completed = false;
    std::map<uint64_t, uint64_t> intervals;  // begin -> end

    /**
     * @brief Add [begin, end) and return the number of newly covered bytes
     */
    auto add(uint64_t begin, uint64_t end) -> uint64_t {
        if (begin >= end) {
            return 0;
        }

        // First interval that could touch [begin, end)
        auto it = intervals.upper_bound(begin);
        if (it != intervals.begin()) {
            auto prev = std::prev(it);
            if (prev->second >= begin) {
                it = prev;
            }
        }

        uint64_t merged_begin = begin;
        uint64_t merged_end = end;
        uint64_t overlap = 0;

        while (it != intervals.end() && it->first <= end) {
            const auto lo = std::max(it->first, begin);
            const auto hi = std::min(it->second, end);
            if (hi > lo) {
                overlap += hi - lo;
            }
            merged_begin = std::min(merged_begin, it->first);
            merged_end = std::max(merged_end, it->second);
            it = intervals.erase(it);
        }

        intervals.emplace(merged_begin, merged_end);

        const auto added = (end - begin) - overlap;
        covered += added;
        return added;
    }
};

struct progress_aggregator::impl {
    std::vector<file_coverage> files;
    uint64_t overall_total = 0;
    uint64_t overall_done = 0;
    uint32_t files_completed = 0;

    time_point start_time = std::chrono::steady_clock::now();
    progress_sink* sink = nullptr;

    explicit impl(const std::vector<uint64_t>& sizes) {
        files.reserve(sizes.size());
        for (auto size : sizes) {
            file_coverage coverage;
            coverage.size = size;
            files.push_back(std::move(coverage));
            overall_total += size;
        }
    }

    [[nodiscard]] auto elapsed() const -> duration {
        return std::chrono::duration_cast<duration>(std::chrono::steady_clock::now() -
                                                    start_time);
    }

    [[nodiscard]] auto make_snapshot(uint32_t file_index) const -> progress_snapshot {
        progress_snapshot snap;
        snap.file_index = file_index;
        if (file_index < files.size()) {
            snap.bytes_done = files[file_index].covered;
            snap.file_total = files[file_index].size;
        }
        snap.overall_bytes_done = overall_done;
        snap.overall_total = overall_total;
        snap.files_completed = files_completed;
        snap.files_total = static_cast<uint32_t>(files.size());
        snap.elapsed = elapsed();
        if (snap.elapsed.count() > 0) {
            snap.rate = static_cast<double>(overall_done) * 1000.0 /
                        static_cast<double>(snap.elapsed.count());
        }
        return snap;
    }
};

progress_aggregator::progress_aggregator(std::vector<uint64_t> file_sizes)
    : impl_(std::make_unique<impl>(file_sizes)) {}

progress_aggregator::progress_aggregator(progress_aggregator&&) noexcept = default;
auto progress_aggregator::operator=(progress_aggregator&&) noexcept
    -> progress_aggregator& = default;

progress_aggregator::~progress_aggregator() = default;

void progress_aggregator::start() {
    impl_->start_time = std::chrono::steady_clock::now();
}

void progress_aggregator::set_sink(progress_sink* sink) {
    impl_->sink = sink;
}

auto progress_aggregator::record(const progress_event& event) -> progress_snapshot {
    if (event.file_index >= impl_->files.size()) {
        return impl_->make_snapshot(event.file_index);
    }

    auto& file = impl_->files[event.file_index];
    const auto begin = std::min(event.offset, file.size);
    const auto end = event.bytes > file.size - begin ? file.size : begin + event.bytes;

    impl_->overall_done += file.add(begin, end);

    bool just_completed = false;
    if (!file.completed && file.covered >= file.size) {
        file.completed = true;
        impl_->files_completed++;
        just_completed = true;
    }

    auto snap = impl_->make_snapshot(event.file_index);
    if (impl_->sink != nullptr) {
        impl_->sink->on_progress(snap);
        if (just_completed) {
            impl_->sink->on_file_completed(snap);
        }
    }
    return snap;
}

auto progress_aggregator::bytes_done(uint32_t file_index) const -> uint64_t {
    return file_index < impl_->files.size() ? impl_->files[file_index].covered : 0;
}

auto progress_aggregator::is_file_complete(uint32_t file_index) const -> bool {
    return file_index < impl_->files.size() && impl_->files[file_index].completed;
}

auto progress_aggregator::overall_bytes_done() const -> uint64_t {
    return impl_->overall_done;
}

auto progress_aggregator::overall_total() const -> uint64_t {
    return impl_->overall_total;
}

auto progress_aggregator::files_completed() const -> uint32_t {
    return impl_->files_completed;
}

auto progress_aggregator::get_elapsed() const -> duration {
    return impl_->elapsed();
}

auto progress_aggregator::snapshot(uint32_t file_index) const -> progress_snapshot {
    return impl_->make_snapshot(file_index);
}

}  // namespace usb_responder
