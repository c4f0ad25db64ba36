#pragma once

#include <atomic>

namespace spaserve {
namespace runtime {

// Records SIGINT/SIGTERM in an atomic flag polled by the run loop
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Clears the flag (tests reuse the process)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace spaserve
