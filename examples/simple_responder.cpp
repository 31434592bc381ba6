/**
 * @file simple_responder.cpp
 * @brief Basic embedding example for the usb_responder library
 *
 * This example demonstrates how to:
 * - Resolve a folder into a file catalog
 * - Build a session over the USB transport
 * - Observe session events and progress
 * - Cancel the session from a signal handler
 */

#include <usb_responder/usb_responder.h>
#include <usb_responder/transport/usb_transport.h>

#include <csignal>
#include <iostream>
#include <string>

using namespace usb_responder;

// Token shared with the signal handler
static cancellation_token* g_token = nullptr;

void signal_handler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_token != nullptr) {
        g_token->cancel();
    }
}

/**
 * @brief Progress sink printing one line per completed file
 */
class completion_printer : public progress_sink {
public:
    void on_progress(const progress_snapshot& /*snapshot*/) override {}

    void on_file_completed(const progress_snapshot& snapshot) override {
        std::cout << "[Done] file " << snapshot.file_index << " ("
                  << snapshot.files_completed << "/" << snapshot.files_total << ")"
                  << std::endl;
    }
};

int main(int argc, char* argv[]) {
    std::string folder = ".";
    if (argc >= 2) {
        folder = argv[1];
    }

    std::cout << "=== USB Responder Example ===" << std::endl;
    std::cout << "Serving: " << folder << std::endl;

    auto inputs = resolve_inputs({folder}, extension_filter::parse("nsp,nsz,xci,xcz"));
    for (const auto& skipped : inputs.skipped) {
        std::cerr << "Skipped " << skipped.path << ": " << skipped.reason.message << std::endl;
    }
    if (inputs.files.empty()) {
        std::cerr << "No files to serve" << std::endl;
        return 1;
    }

    auto transport = usb_transport::create(
        transport_config_builder::usb().with_device(0x057E, 0x3000).build_usb());
    if (!transport) {
        std::cerr << "Failed to initialize libusb" << std::endl;
        return 1;
    }

    cancellation_token token;
    completion_printer printer;

    auto controller = session_controller::builder()
        .with_catalog(file_catalog(std::move(inputs.files)))
        .with_transport(std::move(transport))
        .with_device_wait(true)
        .with_progress_sink(&printer)
        .with_cancellation_token(token)
        .with_observer([](const session_event& event) {
            if (event.kind == session_event_kind::reconnecting) {
                std::cout << "[Reconnecting] attempt " << event.retry_count
                          << " in " << event.delay.count() << " ms" << std::endl;
            } else if (event.kind == session_event_kind::connected) {
                std::cout << "[Connected]" << std::endl;
            }
        })
        .build();

    if (!controller.has_value()) {
        std::cerr << "Failed to create session: " << controller.error().message << std::endl;
        return 1;
    }

    g_token = &token;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto report = controller.value().run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_token = nullptr;

    std::cout << "Session " << to_string(report.outcome) << ": "
              << report.state.bytes_sent << " bytes sent, "
              << report.state.commands_processed << " commands" << std::endl;
    if (report.failure) {
        std::cerr << "Reason: " << report.failure->message << std::endl;
    }

    return report.outcome == session_outcome::completed ? 0 : 1;
}
