#include <exception>
#include <string>

#include "json-util.h"
#include "rollup-errors.h"
#include "rollup-router.h"

namespace dapp {

rollup_request route_request(const nlohmann::json &raw) try {
    if (!raw.is_object()) {
        throw std::invalid_argument("request not an object");
    }
    request_what what{};
    ju_get_field(raw, "request_type"s, what);
    switch (what) {
        case request_what::advance_state: {
            advance_state_request advance{};
            ju_get_field(raw, "data"s, advance);
            return advance;
        }
        case request_what::inspect_state: {
            inspect_state_request inspect{};
            ju_get_field(raw, "data"s, inspect);
            return inspect;
        }
    }
    throw std::invalid_argument("unknown request kind");
} catch (std::invalid_argument &x) {
    throw malformed_request_error(x.what());
}

} // namespace dapp
