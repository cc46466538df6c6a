#ifndef DAPP_ROLLUP_MODEL_H
#define DAPP_ROLLUP_MODEL_H

#include "io-types.h"
#include "rollup-emitter.h"

namespace dapp {

/// \brief Business logic invoked for every request
/// \detail Implementations override do_handle_advance and do_handle_inspect.
/// Any std::exception they raise becomes a reject verdict, except the protocol failures
/// (transport, malformed request or response, invalid output context, shutdown), which propagate to the request loop.
class rollup_model {
public:
    virtual ~rollup_model() = default;

    /// \brief Processes an advance state request
    /// \param request Request being processed
    /// \param emitter Emitter for vouchers, notices and reports
    /// \returns Verdict of the request
    finish_status handle_advance(const advance_state_request &request, output_emitter &emitter);

    /// \brief Processes an inspect state request
    /// \param request Request being processed
    /// \param emitter Emitter for reports
    /// \returns Verdict of the request
    finish_status handle_inspect(const inspect_state_request &request, output_emitter &emitter);

protected:
    virtual finish_status do_handle_advance(const advance_state_request &request, output_emitter &emitter) = 0;
    virtual finish_status do_handle_inspect(const inspect_state_request &request, output_emitter &emitter) = 0;
};

} // namespace dapp

#endif
