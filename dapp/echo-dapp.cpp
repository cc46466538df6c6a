#include <cstdio>
#include <exception>

#include "dapp-config.h"
#include "echo-model.h"
#include "rollup-dispatcher.h"
#include "rollup-http-transport.h"
#include "rollup-loop.h"
#include "rollup-signals.h"

int main(int argc, char *argv[]) try {
    dapp::dapp_config_type config;
    if (!dapp::parse_dapp_config(argc, argv, config)) {
        return 1;
    }
    if (config.help) {
        dapp::print_usage(stdout, argc > 0 ? argv[0] : "echo-dapp");
        return 0;
    }
    dapp::install_signal_handlers();
    (void) fprintf(stderr, "[dapp] dispatcher url: %s\n", config.dispatcher_url.c_str());
    (void) fprintf(stderr, "[dapp] outputs per request: %llu vouchers, %llu notices, %llu reports\n",
        static_cast<unsigned long long>(config.echo.vouchers), static_cast<unsigned long long>(config.echo.notices),
        static_cast<unsigned long long>(config.echo.reports));
    dapp::mongoose_http_transport transport(config.dispatcher_url, config.timeout_ms);
    dapp::http_dispatcher_client dispatcher(transport);
    dapp::echo_model model(config.echo);
    dapp::request_loop loop(dispatcher, model);
    return loop.run();
} catch (std::exception &x) {
    (void) fprintf(stderr, "[dapp] caught exception: %s\n", x.what());
    return 1;
}
