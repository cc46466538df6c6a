#ifndef DAPP_ROLLUP_ERRORS_H
#define DAPP_ROLLUP_ERRORS_H

#include <stdexcept>
#include <string>

namespace dapp {

/// \brief Channel to the dispatcher failed (connection, timeout, non-success status)
class transport_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// \brief Dispatcher answered with a body that could not be decoded
class malformed_response_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// \brief Dispatcher handed out a request of unknown kind or with missing fields
class malformed_request_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// \brief Model tried to emit an output not allowed for the current request kind
class invalid_context_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// \brief Process was asked to terminate while blocked on the dispatcher
class shutdown_requested_error : public std::runtime_error {
public:
    shutdown_requested_error() : std::runtime_error("shutdown requested") {}
};

} // namespace dapp

#endif
