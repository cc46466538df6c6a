#include <cstdio>
#include <exception>
#include <iostream>
#include <utility>
#include <variant>

#include "rollup-emitter.h"
#include "rollup-errors.h"
#include "rollup-loop.h"
#include "rollup-router.h"
#include "rollup-signals.h"

namespace dapp {

std::ostream &operator<<(std::ostream &out, const loop_state &s) {
    switch (s) {
        case loop_state::awaiting_request:
            out << "awaiting_request";
            break;
        case loop_state::routing:
            out << "routing";
            break;
        case loop_state::processing:
            out << "processing";
            break;
        default:
            out << "unknown";
            break;
    }
    return out;
}

void request_loop::step(void) {
    switch (m_state) {
        case loop_state::awaiting_request:
            await_request();
            break;
        case loop_state::routing:
            route();
            break;
        case loop_state::processing:
            process();
            break;
    }
}

void request_loop::await_request(void) {
    // Finish previous request and wait for the next request.
    auto raw = m_dispatcher.finish(m_previous_verdict);
    // Previous request is done for good
    m_cycle = cycle_state_type{};
    m_raw_request = std::move(raw);
    m_state = loop_state::routing;
}

void request_loop::route(void) {
    m_cycle.request = route_request(m_raw_request);
    m_raw_request = nullptr;
    std::cerr << "[dapp] received " << get_request_what(m_cycle.request.value()) << " request\n";
    m_state = loop_state::processing;
}

void request_loop::process(void) {
    output_emitter emitter(m_dispatcher, m_cycle);
    const auto &request = m_cycle.request.value();
    finish_status verdict{};
    if (const auto *advance = std::get_if<advance_state_request>(&request)) {
        verdict = m_model.handle_advance(*advance, emitter);
    } else {
        verdict = m_model.handle_inspect(std::get<inspect_state_request>(request), emitter);
    }
    m_cycle.verdict = verdict;
    m_previous_verdict = verdict;
    ++m_processed_count;
    std::cerr << "[dapp] " << get_request_what(request) << " request finished with " << verdict << " after "
              << m_cycle.outputs.size() << " outputs\n";
    m_state = loop_state::awaiting_request;
}

// Reports a protocol violation to the dispatcher before giving up
int request_loop::abort_processing(const char *what, const std::string &message) {
    (void) fprintf(stderr, "[dapp] %s: %s\n", what, message.c_str());
    try {
        m_dispatcher.throw_exception(std::string(what) + ": " + message);
    } catch (std::exception &x) {
        (void) fprintf(stderr, "[dapp] unable to throw rollup exception: %s\n", x.what());
    }
    return 1;
}

int request_loop::run(void) {
    try {
        // Request loop, should loop forever.
        for (;;) {
            if (m_state == loop_state::awaiting_request && shutdown_requested()) {
                (void) fprintf(stderr, "[dapp] shutdown requested\n");
                return 0;
            }
            step();
        }
    } catch (shutdown_requested_error &) {
        (void) fprintf(stderr, "[dapp] shutdown requested while waiting for dispatcher\n");
        return 0;
    } catch (transport_error &x) {
        (void) fprintf(stderr, "[dapp] transport failure: %s\n", x.what());
        return 1;
    } catch (malformed_request_error &x) {
        return abort_processing("malformed request", x.what());
    } catch (malformed_response_error &x) {
        return abort_processing("malformed response", x.what());
    } catch (invalid_context_error &x) {
        return abort_processing("invalid output context", x.what());
    } catch (std::exception &x) {
        return abort_processing("unexpected failure", x.what());
    }
}

} // namespace dapp
