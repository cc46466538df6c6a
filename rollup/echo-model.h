#ifndef DAPP_ECHO_MODEL_H
#define DAPP_ECHO_MODEL_H

#include <cstdint>

#include "rollup-model.h"

namespace dapp {

/// \brief Number of outputs the echo model emits for each request
struct echo_config_type {
    uint64_t vouchers = 0; ///< Vouchers per advance state request
    uint64_t notices = 0;  ///< Notices per advance state request
    uint64_t reports = 0;  ///< Reports per request of either kind
};

// Echoes every input back as outputs and accepts everything
class echo_model final : public rollup_model {
public:
    explicit echo_model(const echo_config_type &config) : m_config(config) {}

    const echo_config_type &get_config() const {
        return m_config;
    }

protected:
    finish_status do_handle_advance(const advance_state_request &request, output_emitter &emitter) override;
    finish_status do_handle_inspect(const inspect_state_request &request, output_emitter &emitter) override;

private:
    const echo_config_type m_config;
};

} // namespace dapp

#endif
