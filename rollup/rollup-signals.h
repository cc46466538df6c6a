#ifndef DAPP_ROLLUP_SIGNALS_H
#define DAPP_ROLLUP_SIGNALS_H

namespace dapp {

/// \brief Installs all signal handlers
/// \detail SIGPIPE is ignored, SIGTERM and SIGINT request a shutdown
void install_signal_handlers(void);

/// \brief Marks the process for shutdown
void request_shutdown(void);

/// \brief Clears a previous shutdown request
void clear_shutdown_request(void);

/// \brief Returns true once SIGTERM or SIGINT was received or request_shutdown() was called
bool shutdown_requested(void);

} // namespace dapp

#endif
