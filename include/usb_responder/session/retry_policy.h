/**
 * @file retry_policy.h
 * @brief Bounded reconnect policy with exponential backoff
 */

#ifndef USB_RESPONDER_SESSION_RETRY_POLICY_H
#define USB_RESPONDER_SESSION_RETRY_POLICY_H

#include <usb_responder/core/types.h>

#include <chrono>
#include <cstdint>

namespace usb_responder {

/**
 * @brief Reconnect policy
 *
 * Only consecutive failures count against max_retries: the session resets
 * its retry count after the first command served on a new connection.
 */
struct retry_policy {
    /// Reconnect attempts after the initial connection (0 = never reconnect)
    uint32_t max_retries = 3;

    /// Delay before the first reconnect
    std::chrono::milliseconds initial_delay{1000};

    /// Growth factor applied per further attempt
    double backoff_multiplier = 2.0;

    /// Upper bound on any single delay
    std::chrono::milliseconds max_delay{8000};

    /**
     * @brief Delay before reconnect attempt @p attempt (1-based)
     */
    [[nodiscard]] auto delay_for(uint32_t attempt) const -> std::chrono::milliseconds;

    [[nodiscard]] auto validate() const -> result<void>;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_SESSION_RETRY_POLICY_H
