#ifndef DAPP_ROLLUP_LOOP_H
#define DAPP_ROLLUP_LOOP_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "nlohmann/json.hpp"

#include "io-types.h"
#include "rollup-dispatcher.h"
#include "rollup-model.h"

namespace dapp {

/// \brief States of the request loop
enum class loop_state : uint8_t {
    awaiting_request, ///< Next step finishes the previous request and waits for a new one
    routing,          ///< Next step classifies the request just received
    processing,       ///< Next step hands the request to the model
};

std::ostream &operator<<(std::ostream &out, const loop_state &s);

/// \brief Drives the finish / route / process cycle against a dispatcher
class request_loop {
public:
    request_loop(rollup_dispatcher &dispatcher, rollup_model &model) : m_dispatcher(dispatcher), m_model(model) {}

    /// \brief Performs a single state transition
    /// \detail Throws whatever the dispatcher, the router or the model throws.
    /// The loop is left in the state it was in, and must not be stepped again after a failure.
    void step(void);

    /// \brief Processes requests until a fatal failure or a shutdown request
    /// \returns Process exit code: 0 after a shutdown request, 1 after a fatal failure
    int run(void);

    loop_state get_state(void) const {
        return m_state;
    }

    /// \brief Returns the cycle in progress (or, while awaiting a request, the last completed one)
    const cycle_state_type &get_cycle(void) const {
        return m_cycle;
    }

    /// \brief Returns the verdict that will be sent with the next finish, or nullopt before the first request
    std::optional<finish_status> get_previous_verdict(void) const {
        return m_previous_verdict;
    }

    /// \brief Returns the number of requests processed so far
    uint64_t get_processed_count(void) const {
        return m_processed_count;
    }

private:
    void await_request(void);
    void route(void);
    void process(void);
    int abort_processing(const char *what, const std::string &message);

    rollup_dispatcher &m_dispatcher;
    rollup_model &m_model;
    loop_state m_state{loop_state::awaiting_request};
    nlohmann::json m_raw_request;
    cycle_state_type m_cycle;
    std::optional<finish_status> m_previous_verdict;
    uint64_t m_processed_count{0};
};

} // namespace dapp

#endif
