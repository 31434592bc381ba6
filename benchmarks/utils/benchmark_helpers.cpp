/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace usb_responder::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() / "usb_responder_benchmarks";
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_random_file(
    const std::string& name,
    std::size_t size,
    uint32_t seed) -> std::filesystem::path {
    auto data = test_data_generator::generate_random_data(size, seed);
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// discard_transport implementation

auto discard_transport::connect() -> result<void> {
    state_ = transport_state::connected;
    stats_.connects++;
    stats_.connected_at = std::chrono::steady_clock::now();
    return {};
}

void discard_transport::close() {
    state_ = transport_state::disconnected;
}

auto discard_transport::is_connected() const -> bool {
    return state_ == transport_state::connected;
}

auto discard_transport::state() const -> transport_state {
    return state_;
}

auto discard_transport::send(std::span<const std::byte> data) -> result<void> {
    if (!is_connected()) {
        return unexpected(error{error_code::not_connected, "not connected"});
    }
    stats_.bytes_sent += data.size();
    stats_.packets_sent++;
    return {};
}

auto discard_transport::receive(std::size_t max_bytes, std::chrono::milliseconds /*timeout*/)
    -> result<std::vector<std::byte>> {
    if (!is_connected()) {
        return unexpected(error{error_code::not_connected, "not connected"});
    }
    if (inbound_.empty()) {
        return unexpected(error{error_code::connection_timeout, "no data"});
    }
    const auto count = std::min(max_bytes, inbound_.size());
    stats_.bytes_received += count;
    stats_.packets_received++;
    return std::vector<std::byte>(inbound_.begin(),
                                  inbound_.begin() + static_cast<std::ptrdiff_t>(count));
}

auto discard_transport::get_statistics() const -> transport_statistics {
    return stats_;
}

auto discard_transport::config() const -> const transport_config& {
    return config_;
}

// Utility functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace usb_responder::benchmark
