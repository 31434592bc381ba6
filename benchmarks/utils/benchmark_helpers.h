/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef USB_RESPONDER_BENCHMARKS_BENCHMARK_HELPERS_H
#define USB_RESPONDER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <usb_responder/transport/transport_interface.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace usb_responder::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with random data
     * @param name File name
     * @param size File size
     * @param seed Random seed
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Transport that accepts every send and replays one inbound buffer
 *
 * Sends only update the statistics, so benchmarks measure the responder
 * side without a device attached.
 */
class discard_transport : public transport_interface {
public:
    discard_transport() = default;

    /**
     * @brief Bytes returned by every receive(), cut to max_bytes
     */
    void set_inbound(std::vector<std::byte> data) { inbound_ = std::move(data); }

    [[nodiscard]] auto type() const -> std::string_view override { return "discard"; }
    [[nodiscard]] auto connect() -> result<void> override;
    void close() override;
    [[nodiscard]] auto is_connected() const -> bool override;
    [[nodiscard]] auto state() const -> transport_state override;
    [[nodiscard]] auto send(std::span<const std::byte> data) -> result<void> override;
    [[nodiscard]] auto receive(std::size_t max_bytes, std::chrono::milliseconds timeout)
        -> result<std::vector<std::byte>> override;
    [[nodiscard]] auto get_statistics() const -> transport_statistics override;
    [[nodiscard]] auto config() const -> const transport_config& override;

private:
    transport_state state_ = transport_state::disconnected;
    transport_config config_;
    transport_statistics stats_;
    std::vector<std::byte> inbound_;
};

/**
 * @brief Format bytes as human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;    // 100 KB
constexpr std::size_t medium_file = 10 * MB;    // 10 MB
constexpr std::size_t large_file = 64 * MB;     // 64 MB

// Segment sizes for testing
constexpr std::size_t min_segment = 4 * KB;       // 4 KB
constexpr std::size_t small_segment = 64 * KB;    // 64 KB
constexpr std::size_t default_segment = 1 * MB;   // 1 MB
constexpr std::size_t max_segment = 8 * MB;       // 8 MB
}  // namespace sizes

}  // namespace usb_responder::benchmark

#endif  // USB_RESPONDER_BENCHMARKS_BENCHMARK_HELPERS_H
