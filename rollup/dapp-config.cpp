#include <cctype>
#include <cinttypes>
#include <cstdlib>
#include <cstring>

#include "dapp-config.h"

namespace dapp {

static constexpr const char *DISPATCHER_URL_OPTION = "--dispatcher-url=";

// Numeric option values must be all digits, since sscanf wraps negative numbers
static bool has_digits_value(const char *arg) {
    const char *value = strchr(arg, '=');
    if (!value || value[1] == 0) {
        return false;
    }
    for (++value; *value != 0; ++value) {
        if (!isdigit(static_cast<unsigned char>(*value))) {
            return false;
        }
    }
    return true;
}

void print_usage(FILE *out, const char *name) {
    (void) fprintf(out, R"(Usage:

  %s [options]

Processes rollup requests forever, echoing every input back as outputs.

  --vouchers=<n>
    number of vouchers emitted for each advance state request (default: 0)

  --notices=<n>
    number of notices emitted for each advance state request (default: 0)

  --reports=<n>
    number of reports emitted for each request (default: 0)

  --dispatcher-url=<url>
    rollup dispatcher base URL
    (default: $%s, or %s when unset)

  --timeout-ms=<n>
    maximum time to wait for each dispatcher response, 0 waits forever (default: 0)

  --help
    prints this message and exits

)",
        name, DISPATCHER_URL_ENV, DEFAULT_DISPATCHER_URL);
}

bool parse_dapp_config(int argc, char *argv[], dapp_config_type &config) {
    config = dapp_config_type{};
    const char *env_url = getenv(DISPATCHER_URL_ENV);
    config.dispatcher_url = (env_url && *env_url) ? env_url : DEFAULT_DISPATCHER_URL;
    int end = 0;
    for (int i = 1; i < argc; ++i) {
        end = 0;
        const bool digits = has_digits_value(argv[i]);
        if (digits && sscanf(argv[i], "--vouchers=%" SCNu64 "%n", &config.echo.vouchers, &end) == 1 &&
            argv[i][end] == 0) {
            ;
        } else if (digits && sscanf(argv[i], "--notices=%" SCNu64 "%n", &config.echo.notices, &end) == 1 &&
            argv[i][end] == 0) {
            ;
        } else if (digits && sscanf(argv[i], "--reports=%" SCNu64 "%n", &config.echo.reports, &end) == 1 &&
            argv[i][end] == 0) {
            ;
        } else if (digits && sscanf(argv[i], "--timeout-ms=%" SCNu64 "%n", &config.timeout_ms, &end) == 1 &&
            argv[i][end] == 0) {
            ;
        } else if (strncmp(argv[i], DISPATCHER_URL_OPTION, strlen(DISPATCHER_URL_OPTION)) == 0 &&
            argv[i][strlen(DISPATCHER_URL_OPTION)] != 0) {
            config.dispatcher_url = argv[i] + strlen(DISPATCHER_URL_OPTION);
        } else if (strcmp(argv[i], "--help") == 0) {
            config.help = true;
        } else {
            (void) fprintf(stderr, "[dapp] invalid argument '%s'\n", argv[i]);
            return false;
        }
    }
    return true;
}

} // namespace dapp
