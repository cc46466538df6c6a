#include <cstdio>
#include <exception>
#include <stdexcept>

#include "rollup-errors.h"
#include "rollup-model.h"

namespace dapp {

template <typename REQUEST, typename HANDLER>
static finish_status guarded_handle(const char *what, const REQUEST &request, output_emitter &emitter,
    HANDLER handler) {
    try {
        return handler(request, emitter);
    } catch (transport_error &) {
        throw;
    } catch (malformed_response_error &) {
        throw;
    } catch (malformed_request_error &) {
        throw;
    } catch (invalid_context_error &) {
        throw;
    } catch (shutdown_requested_error &) {
        throw;
    } catch (std::domain_error &x) {
        (void) fprintf(stderr, "[dapp] rejecting %s request (%s)\n", what, x.what());
    } catch (std::invalid_argument &x) {
        (void) fprintf(stderr, "[dapp] rejecting invalid %s request (%s)\n", what, x.what());
    } catch (std::exception &x) {
        (void) fprintf(stderr, "[dapp] rejecting %s request after failure (%s)\n", what, x.what());
    }
    return finish_status::reject;
}

finish_status rollup_model::handle_advance(const advance_state_request &request, output_emitter &emitter) {
    return guarded_handle("advance state", request, emitter,
        [this](const advance_state_request &r, output_emitter &e) { return do_handle_advance(r, e); });
}

finish_status rollup_model::handle_inspect(const inspect_state_request &request, output_emitter &emitter) {
    return guarded_handle("inspect state", request, emitter,
        [this](const inspect_state_request &r, output_emitter &e) { return do_handle_inspect(r, e); });
}

} // namespace dapp
