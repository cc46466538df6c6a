#include <iostream>

#include "echo-model.h"

namespace dapp {

finish_status echo_model::do_handle_advance(const advance_state_request &request, output_emitter &emitter) {
    std::cerr << "[dapp] " << request << '\n';
    // Vouchers go back to whoever sent the input
    for (uint64_t i = 0; i < m_config.vouchers; ++i) {
        (void) emitter.emit_voucher(request.metadata.sender, request.payload);
    }
    for (uint64_t i = 0; i < m_config.notices; ++i) {
        (void) emitter.emit_notice(request.payload);
    }
    for (uint64_t i = 0; i < m_config.reports; ++i) {
        (void) emitter.emit_report(request.payload);
    }
    return finish_status::accept;
}

finish_status echo_model::do_handle_inspect(const inspect_state_request &request, output_emitter &emitter) {
    std::cerr << "[dapp] " << request << '\n';
    for (uint64_t i = 0; i < m_config.reports; ++i) {
        (void) emitter.emit_report(request.payload);
    }
    return finish_status::accept;
}

} // namespace dapp
