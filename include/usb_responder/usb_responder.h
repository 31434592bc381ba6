/**
 * @file usb_responder.h
 * @brief Main header for the usb_responder library
 *
 * This is the primary include file for the usb_responder library.
 * Include this header to access the serving session and its building blocks.
 *
 * @code
 * #include <usb_responder/usb_responder.h>
 *
 * using namespace usb_responder;
 *
 * auto inputs = resolve_inputs({"/path/to/files"});
 * auto controller = session_controller::builder()
 *     .with_catalog(file_catalog(std::move(inputs.files)))
 *     .with_transport(std::move(transport))
 *     .build();
 * @endcode
 */

#ifndef USB_RESPONDER_USB_RESPONDER_H
#define USB_RESPONDER_USB_RESPONDER_H

#include <cstdint>
#include <string>

// Core types
#include "usb_responder/core/types.h"
#include "usb_responder/core/logging.h"
#include "usb_responder/core/protocol_types.h"
#include "usb_responder/core/frame_codec.h"
#include "usb_responder/core/file_catalog.h"
#include "usb_responder/core/progress_aggregator.h"
#include "usb_responder/core/transfer_engine.h"

// Protocol
#include "usb_responder/protocol/frame_reader.h"
#include "usb_responder/protocol/command_dispatcher.h"

// Session
#include "usb_responder/session/retry_policy.h"
#include "usb_responder/session/session_types.h"
#include "usb_responder/session/session_controller.h"

// Transport
#include "usb_responder/transport/transport_interface.h"

// Input
#include "usb_responder/input/input_resolver.h"

namespace usb_responder {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 1;
    static constexpr int minor = 0;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace usb_responder

#endif  // USB_RESPONDER_USB_RESPONDER_H
