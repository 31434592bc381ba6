/**
 * @file cancellation_token.h
 * @brief Cooperative cancellation flag shared between a session and its owner
 */

#ifndef USB_RESPONDER_CORE_CANCELLATION_TOKEN_H
#define USB_RESPONDER_CORE_CANCELLATION_TOKEN_H

#include <atomic>
#include <memory>

namespace usb_responder {

/**
 * @brief Shared cancellation flag
 *
 * Copies observe the same flag. cancel() only performs a lock-free atomic
 * store, so it may be called from a signal handler.
 */
class cancellation_token {
public:
    cancellation_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { flag_->store(true, std::memory_order_relaxed); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return flag_->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_CORE_CANCELLATION_TOKEN_H
