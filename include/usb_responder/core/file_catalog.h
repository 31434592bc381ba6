/**
 * @file file_catalog.h
 * @brief Immutable, session-scoped set of files served to the peer
 */

#ifndef USB_RESPONDER_CORE_FILE_CATALOG_H
#define USB_RESPONDER_CORE_FILE_CATALOG_H

#include <usb_responder/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace usb_responder {

/**
 * @brief Validated input for the catalog
 */
struct file_input {
    std::filesystem::path path;
    uint64_t size = 0;
};

/**
 * @brief One served file
 */
struct file_entry {
    uint32_t index = 0;
    std::filesystem::path path;
    std::string name;       ///< UTF-8 file name reported to the peer
    uint64_t size = 0;      ///< Declared size, fixed for the session
};

/**
 * @brief Bounded reader over [offset, offset + length) of one file
 *
 * Move-only. Never reads past the range it was opened for.
 */
class range_reader {
public:
    range_reader(range_reader&&) noexcept = default;
    auto operator=(range_reader&&) noexcept -> range_reader& = default;
    ~range_reader() = default;

    range_reader(const range_reader&) = delete;
    auto operator=(const range_reader&) -> range_reader& = delete;

    /**
     * @brief Read up to buffer.size() bytes, capped by remaining()
     * @return Bytes read, or io_error on a short read
     */
    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t>;

    [[nodiscard]] auto file_index() const -> uint32_t { return file_index_; }

    /// Absolute file offset of the next byte to be read
    [[nodiscard]] auto position() const -> uint64_t { return position_; }

    [[nodiscard]] auto remaining() const -> uint64_t { return remaining_; }

private:
    friend class file_catalog;

    range_reader(std::ifstream file, uint32_t file_index, uint64_t offset, uint64_t length);

    std::ifstream file_;
    uint32_t file_index_;
    uint64_t position_;
    uint64_t remaining_;
};

/**
 * @brief Ordered, read-only catalog of the files of one session
 *
 * Built once from already-validated inputs; indices follow input order and
 * never change. The catalog does not re-check the filesystem: a file that
 * disappears later is reported by open_range_reader() as io_error.
 */
class file_catalog {
public:
    file_catalog() = default;
    explicit file_catalog(std::vector<file_input> inputs);

    [[nodiscard]] auto count() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }

    /// Sum of all declared sizes
    [[nodiscard]] auto total_size() const noexcept -> uint64_t { return total_size_; }

    [[nodiscard]] auto entries() const noexcept -> std::span<const file_entry> {
        return entries_;
    }

    [[nodiscard]] auto entry(uint32_t index) const -> result<file_entry>;
    [[nodiscard]] auto name_of(uint32_t index) const -> result<std::string>;
    [[nodiscard]] auto size_of(uint32_t index) const -> result<uint64_t>;

    /**
     * @brief Look up an entry by name (first match)
     */
    [[nodiscard]] auto find(std::string_view name) const -> std::optional<uint32_t>;

    /**
     * @brief Open a bounded reader over a byte range of an entry
     *
     * Errors:
     * - index_out_of_range: no entry with @p index
     * - range_invalid: offset + length exceeds the declared size
     * - io_error: the file cannot be opened or positioned
     */
    [[nodiscard]] auto open_range_reader(uint32_t index, uint64_t offset,
                                         uint64_t length) const -> result<range_reader>;

private:
    std::vector<file_entry> entries_;
    uint64_t total_size_ = 0;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_CORE_FILE_CATALOG_H
