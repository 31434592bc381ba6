/**
 * @file cli_options.cpp
 * @brief Command-line parsing
 */

#include <usb_responder/cli/cli_options.h>

#include <charconv>
#include <string_view>

namespace usb_responder {

namespace {

template <typename T>
auto parse_number(std::string_view option, std::string_view text) -> result<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                std::string(option) + " expects a non-negative number, got '" +
                                std::string(text) + "'"});
    }
    return value;
}

auto missing_value(std::string_view option) -> error {
    return error{error_code::invalid_configuration,
                 std::string(option) + " requires an argument"};
}

}  // namespace

auto parse_cli_options(const std::vector<std::string>& args) -> result<cli_options> {
    cli_options options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--log-json") {
            options.log_json = true;
        } else if (arg == "--mask-paths") {
            options.mask_paths = true;
        } else if (arg == "--no-wait") {
            options.wait_for_device = false;
        } else if (arg == "--filter") {
            if (++i >= args.size()) {
                return unexpected(missing_value(arg));
            }
            options.filter = args[i];
        } else if (arg == "--retry-count") {
            if (++i >= args.size()) {
                return unexpected(missing_value(arg));
            }
            auto value = parse_number<uint32_t>(arg, args[i]);
            if (!value.has_value()) {
                return unexpected(value.error());
            }
            options.retry_count = value.value();
        } else if (arg == "--timeout") {
            if (++i >= args.size()) {
                return unexpected(missing_value(arg));
            }
            auto value = parse_number<uint32_t>(arg, args[i]);
            if (!value.has_value()) {
                return unexpected(value.error());
            }
            options.timeout = std::chrono::milliseconds{value.value()};
        } else if (arg == "--segment-size") {
            if (++i >= args.size()) {
                return unexpected(missing_value(arg));
            }
            auto value = parse_number<std::size_t>(arg, args[i]);
            if (!value.has_value()) {
                return unexpected(value.error());
            }
            options.segment_size = value.value();
        } else if (arg.size() > 1 && arg.front() == '-') {
            return unexpected(error{error_code::invalid_configuration,
                                    "unknown option: " + arg});
        } else {
            options.paths.push_back(arg);
        }
    }

    if (!options.help && options.paths.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "at least one file or folder is required"});
    }

    if (auto valid = segment_config(options.segment_size).validate(); !valid.has_value()) {
        return unexpected(valid.error());
    }

    return options;
}

void print_usage(std::ostream& out, const std::string& program) {
    out << "usb-responder - serve local files to a USB-attached device\n"
        << "\n"
        << "Usage: " << program << " [options] <file|folder>...\n"
        << "\n"
        << "Options:\n"
        << "  --debug                 Enable debug logging\n"
        << "  --filter EXT[,EXT...]   Only serve files with these extensions (e.g. \"nsp,xci\")\n"
        << "  --retry-count N         Reconnect attempts after a connection loss (default: 3)\n"
        << "  --timeout MS            USB I/O timeout in milliseconds (default: 0 = none)\n"
        << "  --segment-size BYTES    Bytes per response frame (default: 1048576)\n"
        << "  --log-json              Write log records as JSON\n"
        << "  --mask-paths            Mask directories and file names in log records\n"
        << "  --no-wait               Fail instead of waiting for the device\n"
        << "  --help                  Show this help message\n"
        << "\n"
        << "Exit codes: 0 success, 1 session failed, 2 input error, 130 cancelled\n";
}

}  // namespace usb_responder
