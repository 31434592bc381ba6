/**
 * @file retry_policy.cpp
 * @brief Implementation of the reconnect policy
 */

#include <usb_responder/session/retry_policy.h>

#include <algorithm>
#include <string>

namespace usb_responder {

auto retry_policy::delay_for(uint32_t attempt) const -> std::chrono::milliseconds {
    if (attempt <= 1) {
        return std::min(initial_delay, max_delay);
    }

    auto delay = static_cast<double>(initial_delay.count());
    const auto cap = static_cast<double>(max_delay.count());
    for (uint32_t i = 1; i < attempt && delay < cap; ++i) {
        delay *= backoff_multiplier;
    }

    return std::chrono::milliseconds{static_cast<int64_t>(std::min(delay, cap))};
}

auto retry_policy::validate() const -> result<void> {
    if (initial_delay.count() < 0 || max_delay.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "retry delays must not be negative"});
    }
    if (backoff_multiplier < 1.0) {
        return unexpected(error{error_code::invalid_configuration,
                                "backoff multiplier must be at least 1.0, got " +
                                std::to_string(backoff_multiplier)});
    }
    return {};
}

}  // namespace usb_responder
