#include <cerrno>
#include <csignal>
#include <system_error>

#include <signal.h>

#include "rollup-signals.h"

namespace dapp {

static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_signal_handler(int signum) {
    (void) signum;
    g_shutdown_requested = 1;
}

/// \brief Installs a signal handler
template <typename HANDLER>
static void install_signal_handler(int signum, HANDLER handler) {
    struct sigaction act {};
    if (sigemptyset(&act.sa_mask) < 0) {
        throw std::system_error{errno, std::generic_category(), "sigemptyset failed"};
    }
    act.sa_handler = handler; // NOLINT(cppcoreguidelines-pro-type-union-access)
    act.sa_flags = SA_RESTART;
    if (sigaction(signum, &act, nullptr) < 0) {
        throw std::system_error{errno, std::generic_category(), "sigaction failed"};
    }
}

void install_signal_handlers(void) {
    // Prevent this process from crashing on SIGPIPE when the dispatcher closes the connection
    install_signal_handler(SIGPIPE, SIG_IGN);
    install_signal_handler(SIGTERM, shutdown_signal_handler);
    install_signal_handler(SIGINT, shutdown_signal_handler);
}

void request_shutdown(void) {
    g_shutdown_requested = 1;
}

void clear_shutdown_request(void) {
    g_shutdown_requested = 0;
}

bool shutdown_requested(void) {
    return g_shutdown_requested != 0;
}

} // namespace dapp
