/**
 * @file input_resolver.h
 * @brief Expansion and validation of command-line file and folder arguments
 */

#ifndef USB_RESPONDER_INPUT_INPUT_RESOLVER_H
#define USB_RESPONDER_INPUT_INPUT_RESOLVER_H

#include <usb_responder/core/file_catalog.h>
#include <usb_responder/core/types.h>

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace usb_responder {

/**
 * @brief Case-insensitive extension filter
 *
 * An empty filter accepts every file.
 */
class extension_filter {
public:
    extension_filter() = default;

    /**
     * @brief Parse a comma separated list such as "nsp,XCI" or ".nsp"
     */
    [[nodiscard]] static auto parse(std::string_view list) -> extension_filter;

    [[nodiscard]] auto accepts(const std::filesystem::path& path) const -> bool;

    [[nodiscard]] auto empty() const -> bool { return extensions_.empty(); }

    [[nodiscard]] auto extensions() const -> const std::set<std::string>& {
        return extensions_;
    }

private:
    std::set<std::string> extensions_;  // lower case, without the dot
};

/**
 * @brief An argument or file left out, with the reason
 */
struct skipped_input {
    std::filesystem::path path;
    error reason;   ///< file_not_found, not_a_regular_file, empty_file, io_error
};

/**
 * @brief Outcome of resolving the command-line inputs
 */
struct input_resolution {
    std::vector<file_input> files;       ///< Sorted by file name
    std::vector<skipped_input> skipped;
    std::size_t filtered = 0;            ///< Files rejected by the extension filter
};

/**
 * @brief Expand files and folders into validated catalog inputs
 *
 * Folders are walked recursively. Missing, non-regular and empty files are
 * skipped with a reason. Paths are made absolute. When two files share a
 * name the one found last is kept; names shown to the peer stay unique.
 */
[[nodiscard]] auto resolve_inputs(const std::vector<std::string>& arguments,
                                  const extension_filter& filter = {}) -> input_resolution;

/**
 * @brief Check one path as a catalog input
 */
[[nodiscard]] auto validate_input_file(const std::filesystem::path& path) -> result<file_input>;

}  // namespace usb_responder

#endif  // USB_RESPONDER_INPUT_INPUT_RESOLVER_H
