/**
 * @file protocol_types.cpp
 * @brief Wire profile lookup and validation
 */

#include <usb_responder/core/protocol_types.h>

#include <algorithm>

namespace usb_responder {

auto wire_profile::standard() -> wire_profile {
    wire_profile profile;
    profile.revision = "DBI0-r1";
    profile.magic = {std::byte{'D'}, std::byte{'B'}, std::byte{'I'}, std::byte{'0'}};

    // request, response, error
    profile.type_codes = {0, 1, 3};

    // exit, list, file_range, file_count, file_name, file_size
    profile.command_codes = {0, 3, 2, 4, 5, 6};
    return profile;
}

auto wire_profile::type_from_code(uint8_t code) const -> std::optional<frame_type> {
    for (std::size_t i = 0; i < type_codes.size(); ++i) {
        if (type_codes[i] == code) {
            return static_cast<frame_type>(i);
        }
    }
    return std::nullopt;
}

auto wire_profile::command_from_code(uint8_t code) const -> std::optional<command_id> {
    for (std::size_t i = 0; i < command_codes.size(); ++i) {
        if (command_codes[i] == code) {
            return static_cast<command_id>(i);
        }
    }
    return std::nullopt;
}

namespace {

template <std::size_t N>
auto has_duplicates(std::array<uint8_t, N> codes) -> bool {
    std::sort(codes.begin(), codes.end());
    return std::adjacent_find(codes.begin(), codes.end()) != codes.end();
}

}  // namespace

auto wire_profile::validate() const -> result<void> {
    if (has_duplicates(type_codes)) {
        return unexpected(error{error_code::invalid_configuration,
                                "wire profile " + revision + ": duplicate frame type code"});
    }
    if (has_duplicates(command_codes)) {
        return unexpected(error{error_code::invalid_configuration,
                                "wire profile " + revision + ": duplicate command code"});
    }
    return {};
}

}  // namespace usb_responder
