#ifndef DAPP_ROLLUP_ROUTER_H
#define DAPP_ROLLUP_ROUTER_H

#include "nlohmann/json.hpp"

#include "io-types.h"

namespace dapp {

/// \brief Classifies a raw dispatcher request and validates its fields
/// \param raw Decoded body of a finish response
/// \returns The advance_state_request or inspect_state_request it describes
/// \detail Throws malformed_request_error if the "request_type" discriminator is missing or unknown,
/// or if a field required by the request kind is missing or ill-typed
rollup_request route_request(const nlohmann::json &raw);

} // namespace dapp

#endif
