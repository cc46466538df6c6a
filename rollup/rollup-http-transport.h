#ifndef DAPP_ROLLUP_HTTP_TRANSPORT_H
#define DAPP_ROLLUP_HTTP_TRANSPORT_H

#include <cstdint>
#include <string>

#include "mongoose.h"

namespace dapp {

/// \brief Status and body of an HTTP response
struct http_response_type {
    int status = 0;
    std::string body;
};

/// \brief Blocking HTTP channel to the dispatcher
class http_transport {
public:
    virtual ~http_transport() = default;

    /// \brief Sends a JSON body to path and waits for the answer
    /// \param path Path relative to the dispatcher base URL (e.g. "/finish")
    /// \param body JSON request body
    /// \returns Response status and body, whatever the status
    /// \detail Throws transport_error if no response could be obtained,
    /// and shutdown_requested_error if a shutdown was requested while waiting
    virtual http_response_type post(const std::string &path, const std::string &body) = 0;

    /// \brief Sends raw bytes to path and waits for the answer
    /// \detail Same as post, with an application/octet-stream body
    virtual http_response_type post_octets(const std::string &path, const std::string &body) = 0;

    /// \brief Fetches path and waits for the answer
    virtual http_response_type get(const std::string &path) = 0;

    /// \brief Pauses before a request is repeated
    virtual void wait_before_retry(void) = 0;
};

/// \brief http_transport over a Mongoose event manager
class mongoose_http_transport final : public http_transport {
public:
    /// \param base_url Dispatcher base URL, e.g. "http://127.0.0.1:5004"
    /// \param timeout_ms Maximum time to wait for each response, 0 waits forever
    mongoose_http_transport(std::string base_url, uint64_t timeout_ms);
    ~mongoose_http_transport() override;

    mongoose_http_transport(const mongoose_http_transport &) = delete;
    mongoose_http_transport &operator=(const mongoose_http_transport &) = delete;

    http_response_type post(const std::string &path, const std::string &body) override;
    http_response_type post_octets(const std::string &path, const std::string &body) override;
    http_response_type get(const std::string &path) override;
    void wait_before_retry(void) override;

private:
    http_response_type exchange(const char *method, const std::string &path, const char *content_type,
        const std::string &body);

    std::string m_base_url;
    uint64_t m_timeout_ms;
    mg_mgr m_event_manager;
};

} // namespace dapp

#endif
