#pragma once

#include <atomic>

namespace itemvault {
namespace runtime {

// Turns SIGINT/SIGTERM into a shutdown flag polled by Runtime::run()
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Test hook / programmatic shutdown
    static void request_shutdown();
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace itemvault
