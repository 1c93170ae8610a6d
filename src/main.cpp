#include "DeviceConfig.hpp"
#include "ServiceContext.hpp"
#include "Utils.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>   // For std::set_terminate
#include <execinfo.h>  // For backtrace
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {

std::atomic<bool> shutdown_requested{false};
std::atomic<int> shutdown_signal{0};

const char* ZKFLEET_VERSION = "1.0.0";

// Global terminate handler - catches uncaught exceptions from threads
void terminate_handler() {
    std::exception_ptr eptr = std::current_exception();

    if (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "💥 UNCAUGHT EXCEPTION: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "💥 UNCAUGHT EXCEPTION: Unknown type" << std::endl;
        }
    } else {
        std::cerr << "💥 std::terminate called (no active exception)" << std::endl;
    }

    void* frames[64];
    int frame_count = backtrace(frames, 64);
    std::cerr << "📋 Stack trace (" << frame_count << " frames):" << std::endl;
    backtrace_symbols_fd(frames, frame_count, STDERR_FILENO);

    std::cerr << "🔄 Service will auto-restart..." << std::endl;
    std::cerr.flush();

    // Exit with error code so systemd restarts
    _exit(1);
}

// Only touches atomics; the main loop does the actual shutdown
void signal_handler(int signum) {
    if (shutdown_requested.exchange(true)) {
        // Second signal: the graceful path is stuck, force exit
        _exit(128 + signum);
    }
    shutdown_signal.store(signum);
}

void crash_handler(int signum) {
    static const char message[] = "\n💥 CRASH DETECTED, stack trace:\n";
    ssize_t written = write(STDERR_FILENO, message, sizeof(message) - 1);
    (void)written;

    void* frames[64];
    int frame_count = backtrace(frames, 64);
    backtrace_symbols_fd(frames, frame_count, STDERR_FILENO);
    _exit(128 + signum);
}

const char* signal_name(int signum) {
    switch (signum) {
        case SIGINT:  return "SIGINT (Interrupt)";
        case SIGTERM: return "SIGTERM (Terminate)";
        case SIGHUP:  return "SIGHUP (Hangup)";
        default:      return "UNKNOWN";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    (void)argc;  // Unused
    (void)argv;  // Unused

    zkfleet::FleetConfig config = zkfleet::load_fleet_config();

    if (!config.log_file.empty() && !zkfleet::utils::setup_logging(config.log_file)) {
        std::cerr << "⚠️ Could not redirect logs to " << config.log_file << ", logging to terminal" << std::endl;
    }

    // Set global terminate handler for uncaught exceptions
    std::set_terminate(terminate_handler);

    std::cout << "\n╔════════════════════════════════════════════╗" << std::endl;
    std::cout << "║   zkfleet live capture v" << ZKFLEET_VERSION << "              ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════╝" << std::endl;
    std::cout << "🕒 " << zkfleet::utils::get_timestamp_string() << std::endl;

    // Register signal handlers for graceful shutdown AND crash detection
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGHUP, signal_handler);
    signal(SIGSEGV, crash_handler);
    signal(SIGABRT, crash_handler);
    signal(SIGFPE, crash_handler);
    signal(SIGBUS, crash_handler);
    // Writes to a device the peer already closed must fail with EPIPE, not kill us
    signal(SIGPIPE, SIG_IGN);

    if (config.devices.empty()) {
        std::cerr << "❌ No devices configured. Set DEVICES_CONFIG, DEVICE_1_IP or DEVICE_IP." << std::endl;
        return 1;
    }

    std::unique_ptr<zkfleet::ServiceContext> context;
    try {
        context = std::make_unique<zkfleet::ServiceContext>(config);
    } catch (const std::exception& e) {
        std::cerr << "❌ Service initialization failed: " << e.what() << std::endl;
        return 1;
    }

    if (!context->start()) {
        if (context->supervisor().status() == zkfleet::ServiceStatus::Error) {
            std::cerr << "❌ Live capture service failed to start" << std::endl;
            return 1;
        }
        std::cerr << "⚠️ No device online yet, waiting for the monitor to bring them up" << std::endl;
    }

    std::cout << "✅ Service running. Press Ctrl+C to stop." << std::endl;
    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n🛑 Shutdown signal received (" << signal_name(shutdown_signal.load()) << ")" << std::endl;
    std::cout << "Cleaning up resources..." << std::endl;
    context->shutdown();
    context.reset();
    std::cout << "Cleanup complete." << std::endl;
    return 0;
}
