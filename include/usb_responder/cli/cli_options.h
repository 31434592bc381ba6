/**
 * @file cli_options.h
 * @brief Command-line options of the usb-responder executable
 */

#ifndef USB_RESPONDER_CLI_CLI_OPTIONS_H
#define USB_RESPONDER_CLI_CLI_OPTIONS_H

#include <usb_responder/core/segment_config.h>
#include <usb_responder/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace usb_responder {

/**
 * @brief Parsed command line
 */
struct cli_options {
    std::vector<std::string> paths;
    bool debug = false;
    std::string filter;
    uint32_t retry_count = 3;
    std::chrono::milliseconds timeout{0};
    std::size_t segment_size = segment_config::default_segment_size;
    bool log_json = false;
    bool mask_paths = false;
    bool wait_for_device = true;
    bool help = false;
};

/**
 * @brief Parse arguments (without the program name)
 *
 * Fails with invalid_configuration on an unknown option, a missing or
 * malformed value, or when no path is given and --help is absent.
 */
[[nodiscard]] auto parse_cli_options(const std::vector<std::string>& args)
    -> result<cli_options>;

void print_usage(std::ostream& out, const std::string& program);

}  // namespace usb_responder

#endif  // USB_RESPONDER_CLI_CLI_OPTIONS_H
