#ifndef DAPP_ROLLUP_EMITTER_H
#define DAPP_ROLLUP_EMITTER_H

#include <cstdint>

#include "io-types.h"
#include "rollup-dispatcher.h"

namespace dapp {

/// \brief Emits outputs on behalf of the model while a request is being processed
/// \detail Every emitted output is sent to the dispatcher right away and appended to the cycle state.
/// Vouchers and notices are only allowed while processing an advance state request.
class output_emitter {
public:
    /// \param dispatcher Dispatcher that receives the outputs
    /// \param cycle State of the current cycle, must hold the request being processed
    output_emitter(rollup_dispatcher &dispatcher, cycle_state_type &cycle);

    /// \brief Emits a voucher
    /// \returns Index of the voucher among the vouchers of this cycle
    /// \detail Throws invalid_context_error unless processing an advance state request
    uint64_t emit_voucher(const eth_address &destination, const bytes_type &payload);

    /// \brief Emits a notice
    /// \returns Index of the notice among the notices of this cycle
    /// \detail Throws invalid_context_error unless processing an advance state request
    uint64_t emit_notice(const bytes_type &payload);

    /// \brief Emits a report
    /// \returns Index of the report among the reports of this cycle
    uint64_t emit_report(const bytes_type &payload);

    request_what get_context() const {
        return m_context;
    }

private:
    void check_advance_context(output_what what) const;
    uint64_t record(output_type output, uint64_t index, uint64_t &next_index);

    rollup_dispatcher &m_dispatcher;
    cycle_state_type &m_cycle;
    request_what m_context;
    uint64_t m_next_voucher{0};
    uint64_t m_next_notice{0};
    uint64_t m_next_report{0};
};

} // namespace dapp

#endif
