#include <iostream>
#include <sstream>
#include <utility>

#include "rollup-emitter.h"
#include "rollup-errors.h"

namespace dapp {

output_emitter::output_emitter(rollup_dispatcher &dispatcher, cycle_state_type &cycle) :
    m_dispatcher(dispatcher),
    m_cycle(cycle),
    m_context(request_what::inspect_state) {
    if (!m_cycle.request.has_value()) {
        throw invalid_context_error("no request being processed");
    }
    m_context = get_request_what(m_cycle.request.value());
}

void output_emitter::check_advance_context(output_what what) const {
    if (m_context != request_what::advance_state) {
        std::ostringstream ss;
        ss << what << " not allowed while processing " << m_context;
        throw invalid_context_error(ss.str());
    }
}

uint64_t output_emitter::record(output_type output, uint64_t index, uint64_t &next_index) {
    if (index < next_index) {
        std::cerr << "[dapp] dispatcher reused " << get_output_what(output) << " index " << index << '\n';
    }
    next_index = index + 1;
    m_cycle.outputs.push_back(emitted_output_type{std::move(output), index});
    std::cerr << "[dapp] " << m_cycle.outputs.back() << '\n';
    return index;
}

uint64_t output_emitter::emit_voucher(const eth_address &destination, const bytes_type &payload) {
    check_advance_context(output_what::voucher);
    voucher_type voucher{destination, payload};
    const auto index = m_dispatcher.write_voucher(voucher);
    return record(std::move(voucher), index, m_next_voucher);
}

uint64_t output_emitter::emit_notice(const bytes_type &payload) {
    check_advance_context(output_what::notice);
    notice_type notice{payload};
    const auto index = m_dispatcher.write_notice(notice);
    return record(std::move(notice), index, m_next_notice);
}

uint64_t output_emitter::emit_report(const bytes_type &payload) {
    report_type report{payload};
    // Dispatcher may only acknowledge reports, in which case they are numbered here
    const auto index = m_dispatcher.write_report(report).value_or(m_next_report);
    return record(std::move(report), index, m_next_report);
}

} // namespace dapp
