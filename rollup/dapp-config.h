#ifndef DAPP_DAPP_CONFIG_H
#define DAPP_DAPP_CONFIG_H

#include <cstdint>
#include <cstdio>
#include <string>

#include "echo-model.h"

namespace dapp {

constexpr const char *DEFAULT_DISPATCHER_URL = "http://127.0.0.1:5004";
constexpr const char *DISPATCHER_URL_ENV = "ROLLUP_HTTP_SERVER_URL";

struct dapp_config_type {
    echo_config_type echo;      ///< Outputs per request
    std::string dispatcher_url; ///< Dispatcher base URL
    uint64_t timeout_ms = 0;    ///< Per-request HTTP timeout, 0 waits forever
    bool help = false;          ///< Usage was requested
};

/// \brief Builds the process configuration from the command line and the environment
/// \param argc Number of arguments
/// \param argv Arguments, argv[0] being the program name
/// \param config Receives the configuration
/// \returns True on success, false after printing a diagnostic
bool parse_dapp_config(int argc, char *argv[], dapp_config_type &config);

/// \brief Prints command-line usage
void print_usage(FILE *out, const char *name);

} // namespace dapp

#endif
