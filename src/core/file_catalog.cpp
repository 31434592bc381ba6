/**
 * @file file_catalog.cpp
 * @brief Implementation of the file catalog and range reader
 */

#include <usb_responder/core/file_catalog.h>

#include <algorithm>

namespace usb_responder {

// range_reader implementation

range_reader::range_reader(std::ifstream file, uint32_t file_index, uint64_t offset,
                           uint64_t length)
    : file_(std::move(file)),
      file_index_(file_index),
      position_(offset),
      remaining_(length) {}

auto range_reader::read(std::span<std::byte> buffer) -> result<std::size_t> {
    const auto to_read = static_cast<std::size_t>(
        std::min<uint64_t>(buffer.size(), remaining_));
    if (to_read == 0) {
        return std::size_t{0};
    }

    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(to_read));
    const auto bytes_read = static_cast<std::size_t>(file_.gcount());

    if (bytes_read != to_read) {
        return unexpected(error{error_code::io_error,
                                "short read at offset " + std::to_string(position_ + bytes_read)});
    }

    position_ += bytes_read;
    remaining_ -= bytes_read;
    return bytes_read;
}

// file_catalog implementation

file_catalog::file_catalog(std::vector<file_input> inputs) {
    entries_.reserve(inputs.size());

    uint32_t index = 0;
    for (auto& input : inputs) {
        file_entry entry;
        entry.index = index++;
        entry.name = input.path.filename().string();
        entry.path = std::move(input.path);
        entry.size = input.size;
        total_size_ += entry.size;
        entries_.push_back(std::move(entry));
    }
}

auto file_catalog::entry(uint32_t index) const -> result<file_entry> {
    if (index >= entries_.size()) {
        return unexpected(error{error_code::index_out_of_range,
                                "no file with index " + std::to_string(index)});
    }
    return entries_[index];
}

auto file_catalog::name_of(uint32_t index) const -> result<std::string> {
    if (index >= entries_.size()) {
        return unexpected(error{error_code::index_out_of_range,
                                "no file with index " + std::to_string(index)});
    }
    return entries_[index].name;
}

auto file_catalog::size_of(uint32_t index) const -> result<uint64_t> {
    if (index >= entries_.size()) {
        return unexpected(error{error_code::index_out_of_range,
                                "no file with index " + std::to_string(index)});
    }
    return entries_[index].size;
}

auto file_catalog::find(std::string_view name) const -> std::optional<uint32_t> {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const file_entry& e) { return e.name == name; });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->index;
}

auto file_catalog::open_range_reader(uint32_t index, uint64_t offset, uint64_t length) const
    -> result<range_reader> {
    if (index >= entries_.size()) {
        return unexpected(error{error_code::index_out_of_range,
                                "no file with index " + std::to_string(index)});
    }

    const auto& e = entries_[index];

    // offset + length may overflow; compare against what is left instead
    if (offset > e.size || length > e.size - offset) {
        return unexpected(error{error_code::range_invalid,
                                "range [" + std::to_string(offset) + ", +" +
                                std::to_string(length) + ") exceeds size " +
                                std::to_string(e.size) + " of " + e.name});
    }

    std::ifstream file(e.path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::io_error, "cannot open file: " + e.name});
    }

    file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file.good()) {
        return unexpected(error{error_code::io_error,
                                "seek to " + std::to_string(offset) + " failed: " + e.name});
    }

    return range_reader(std::move(file), index, offset, length);
}

}  // namespace usb_responder
