// =============================================================================
// railmr - Signal Guard Implementation
// =============================================================================

#include "signal_guard.h"

#include <atomic>
#include <chrono>

#include "railmr/common/logger.h"

namespace railmr::commands {

namespace {

std::atomic<int> gReceived{0};

extern "C" void onTerminationSignal(int signal) {
    gReceived.store(signal, std::memory_order_relaxed);
}

constexpr std::chrono::milliseconds kWatchInterval{100};

}  // namespace

SignalGuard::SignalGuard(std::function<void()> onSignal) : onSignal_(std::move(onSignal)) {
    gReceived.store(0, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = onTerminationSignal;
    action.sa_flags = SA_RESETHAND;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, &previousInt_);
    sigaction(SIGTERM, &action, &previousTerm_);

    watcher_ = std::jthread([this](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (int signal = gReceived.load(std::memory_order_relaxed); signal != 0) {
                std::signal(SIGINT, SIG_DFL);
                std::signal(SIGTERM, SIG_DFL);
                RAILMR_LOG_WARNING("Received signal {}, cancelling (repeat to abort)", signal);
                onSignal_();
                return;
            }
            std::this_thread::sleep_for(kWatchInterval);
        }
    });
}

SignalGuard::~SignalGuard() {
    watcher_.request_stop();
    if (watcher_.joinable()) {
        watcher_.join();
    }
    sigaction(SIGINT, &previousInt_, nullptr);
    sigaction(SIGTERM, &previousTerm_, nullptr);
}

int SignalGuard::received() noexcept {
    return gReceived.load(std::memory_order_relaxed);
}

}  // namespace railmr::commands
