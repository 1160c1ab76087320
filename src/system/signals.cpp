#include "system/signals.hpp"

#include <signal.h>

namespace rehash {

std::atomic_bool g_cancel{false};

namespace {

void RequestStop(int) { g_cancel.store(true, std::memory_order_relaxed); }

} // namespace

bool InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = RequestStop;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART | SA_RESETHAND;
    for (int sig : {SIGINT, SIGTERM}) {
        if (sigaction(sig, &sa, nullptr) != 0) {
            return false;
        }
    }
    return true;
}

} // namespace rehash
