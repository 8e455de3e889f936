// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/cli/commands.hpp>
#include <dashgrab/core/http_session.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stop_token>
#include <thread>

using namespace dashgrab::cli;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int) {
    g_interrupted = 1;
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(SIGINT, &sa, nullptr) == -1) {
        spdlog::warn("Failed to install SIGINT handler");
    }
    if (sigaction(SIGTERM, &sa, nullptr) == -1) {
        spdlog::warn("Failed to install SIGTERM handler");
    }
}

} // namespace

// Terminate handler to catch exceptions in noexcept functions
static void dashgrab_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(dashgrab_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    dashgrab::core::HttpSession::global_init();
    install_signal_handlers();

    // Turn SIGINT/SIGTERM into a stop request for the whole download
    std::stop_source cancel;
    std::jthread watcher([&cancel](std::stop_token stoken) {
        while (!stoken.stop_requested()) {
            if (g_interrupted) {
                std::cout << "\nReceived interrupt signal, stopping..." << std::endl;
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int exit_code = run(args, argv[0], cancel.get_token());

    watcher.request_stop();
    watcher.join();
    dashgrab::core::HttpSession::global_cleanup();
    return exit_code;
}
