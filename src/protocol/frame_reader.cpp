/**
 * @file frame_reader.cpp
 * @brief Implementation of the buffered frame reader
 */

#include <usb_responder/protocol/frame_reader.h>

#include <algorithm>

namespace usb_responder {

frame_reader::frame_reader(transport_interface& transport, std::size_t receive_window)
    : transport_(transport), receive_window_(std::max<std::size_t>(receive_window, 1)) {}

auto frame_reader::read_exact(std::size_t count) -> result<std::vector<std::byte>> {
    while (buffered() < count) {
        auto filled = fill(io_timeout_);
        if (!filled.has_value()) {
            return unexpected(filled.error());
        }
    }

    auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(position_);
    std::vector<std::byte> out(first, first + static_cast<std::ptrdiff_t>(count));
    position_ += count;
    compact();
    return out;
}

auto frame_reader::wait_for_data(std::chrono::milliseconds timeout) -> result<bool> {
    if (buffered() > 0) {
        return true;
    }

    auto filled = fill(timeout);
    if (!filled.has_value()) {
        if (filled.error().code == error_code::connection_timeout) {
            return false;
        }
        return unexpected(filled.error());
    }
    return true;
}

void frame_reader::begin_frame() {
    frame_start_ = position_;
    compact();
}

auto frame_reader::resynchronise(std::span<const std::byte> magic, std::size_t header_size)
    -> std::size_t {
    const auto begin = buffer_.begin();
    const auto end = buffer_.end();
    const auto frame = begin + static_cast<std::ptrdiff_t>(frame_start_);

    const auto available = static_cast<std::size_t>(end - frame);
    const bool has_magic = !magic.empty() && available >= magic.size() &&
                           std::equal(magic.begin(), magic.end(), frame);
    const std::size_t skip =
        std::min(has_magic ? std::max<std::size_t>(header_size, 1) : std::size_t{1}, available);

    auto from = frame + static_cast<std::ptrdiff_t>(skip);
    auto next = std::search(from, end, magic.begin(), magic.end());
    if (next == end && !magic.empty()) {
        // Keep a magic prefix cut off by the receive boundary
        const auto tail = static_cast<std::ptrdiff_t>(magic.size() - 1);
        next = (end - from > tail) ? end - tail : from;
        while (next != end &&
               !std::equal(next, end, magic.begin(),
                           magic.begin() + static_cast<std::ptrdiff_t>(end - next))) {
            ++next;
        }
    }

    const auto skipped = static_cast<std::size_t>(next - frame);
    position_ = static_cast<std::size_t>(next - begin);
    frame_start_ = position_;
    compact();
    return skipped;
}

void frame_reader::reset() {
    buffer_.clear();
    buffer_.shrink_to_fit();
    position_ = 0;
    frame_start_ = 0;
}

auto frame_reader::fill(std::chrono::milliseconds timeout) -> result<void> {
    auto data = transport_.receive(receive_window_, timeout);
    if (!data.has_value()) {
        return unexpected(data.error());
    }
    buffer_.insert(buffer_.end(), data.value().begin(), data.value().end());
    return {};
}

void frame_reader::compact() {
    // Bytes from frame_start_ on may still be rescanned
    if (frame_start_ == buffer_.size()) {
        buffer_.clear();
        position_ = 0;
        frame_start_ = 0;
    } else if (frame_start_ > receive_window_) {
        buffer_.erase(buffer_.begin(),
                      buffer_.begin() + static_cast<std::ptrdiff_t>(frame_start_));
        position_ -= frame_start_;
        frame_start_ = 0;
    }
}

}  // namespace usb_responder
