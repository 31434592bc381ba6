/**
 * @file main.cpp
 * @brief usb-responder executable
 */

#include <usb_responder/usb_responder.h>
#include <usb_responder/cli/cli_options.h>
#include <usb_responder/cli/console_progress_sink.h>
#include <usb_responder/input/input_resolver.h>
#include <usb_responder/transport/usb_transport.h>

#include <csignal>
#include <iostream>
#include <string>
#include <vector>

using namespace usb_responder;

namespace {

constexpr int exit_success = 0;
constexpr int exit_failed = 1;
constexpr int exit_input_error = 2;
constexpr int exit_cancelled = 130;

cancellation_token* g_token = nullptr;

void signal_handler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_token != nullptr) {
        g_token->cancel();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "usb-responder";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto parsed = parse_cli_options(args);
    if (!parsed.has_value()) {
        std::cerr << "Error: " << parsed.error().message << "\n\n";
        print_usage(std::cerr, program);
        return exit_input_error;
    }
    const auto& options = parsed.value();

    if (options.help) {
        print_usage(std::cout, program);
        return exit_success;
    }

    auto& logger = get_logger();
    logger.initialize();
    logger.set_level(options.debug ? log_level::debug : log_level::info);
    logger.enable_json_output(options.log_json);
    if (options.mask_paths) {
        logger.set_masking_config(masking_config::all_masked());
    }

    UR_LOG_INFO(log_category::cli, "Starting usb-responder " + version::to_string());

    auto inputs = resolve_inputs(options.paths, extension_filter::parse(options.filter));
    if (inputs.files.empty()) {
        UR_LOG_ERROR(log_category::cli, "No valid files found to serve");
        return exit_input_error;
    }

    file_catalog catalog(std::move(inputs.files));
    console_progress_sink console(std::cout, catalog);

    auto transport_config = transport_config_builder::usb()
        .with_read_timeout(options.timeout)
        .with_write_timeout(options.timeout)
        .build_usb();

    auto transport = usb_transport::create(transport_config);
    if (!transport) {
        UR_LOG_ERROR(log_category::cli, "USB subsystem unavailable");
        return exit_failed;
    }

    cancellation_token token;
    g_token = &token;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    retry_policy policy;
    policy.max_retries = options.retry_count;

    auto controller = session_controller::builder()
        .with_catalog(catalog)
        .with_transport(std::move(transport))
        .with_retry_policy(policy)
        .with_io_timeout(options.timeout)
        .with_device_wait(options.wait_for_device)
        .with_segment_size(options.segment_size)
        .with_progress_sink(&console)
        .with_observer(make_logging_observer())
        .with_observer([&console](const session_event& event) {
            console.on_session_event(event);
        })
        .with_cancellation_token(token)
        .build();

    if (!controller.has_value()) {
        UR_LOG_ERROR(log_category::cli,
            "Invalid configuration: " + controller.error().message);
        return exit_input_error;
    }

    UR_LOG_INFO(log_category::cli,
        "Serving " + std::to_string(catalog.count()) + " files (" +
        format_bytes(catalog.total_size()) + ")");

    auto report = controller.value().run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_token = nullptr;

    logger.flush();

    switch (report.outcome) {
        case session_outcome::completed:
            UR_LOG_INFO(log_category::cli,
                "Done: " + std::to_string(report.progress.files_completed) + "/" +
                std::to_string(report.progress.files_total) + " files, " +
                format_bytes(report.state.bytes_sent) + " sent");
            return exit_success;
        case session_outcome::cancelled:
            UR_LOG_INFO(log_category::cli, "Interrupted by user");
            return exit_cancelled;
        case session_outcome::failed:
        default:
            UR_LOG_ERROR(log_category::cli,
                "Session failed: " +
                (report.failure ? report.failure->message : std::string("unknown error")));
            return exit_failed;
    }
}
