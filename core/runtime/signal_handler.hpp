#pragma once

#include <atomic>

namespace micsync {
namespace runtime {

// SIGINT/SIGTERM set a flag that the runtime loops poll
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Same effect as a signal; also used to reset between tests
    static void request_shutdown();
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace micsync
