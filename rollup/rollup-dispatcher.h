#ifndef DAPP_ROLLUP_DISPATCHER_H
#define DAPP_ROLLUP_DISPATCHER_H

#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

#include "io-types.h"
#include "rollup-http-transport.h"

namespace dapp {

/// \brief Calls exposed by the rollup dispatcher
class rollup_dispatcher {
public:
    virtual ~rollup_dispatcher() = default;

    /// \brief Finishes the previous request and blocks until the next one is available
    /// \param previous Verdict of the previous request, or nullopt if there was none
    /// \returns Raw decoded request, still to be routed
    virtual nlohmann::json finish(std::optional<finish_status> previous) = 0;

    /// \brief Emits a voucher
    /// \returns Index assigned by the dispatcher
    virtual uint64_t write_voucher(const voucher_type &voucher) = 0;

    /// \brief Emits a notice
    /// \returns Index assigned by the dispatcher
    virtual uint64_t write_notice(const notice_type &notice) = 0;

    /// \brief Emits a report
    /// \returns Index assigned by the dispatcher, or nullopt if it only acknowledged the report
    virtual std::optional<uint64_t> write_report(const report_type &report) = 0;

    /// \brief Tells the dispatcher the dapp cannot go on processing requests
    virtual void throw_exception(const std::string &message) = 0;

    /// \brief Forwards a generic I/O request to the host and waits for its response
    virtual gio_response_type gio_request(const gio_request_type &request) = 0;

    /// \brief Reads size bytes of raw state starting at offset
    virtual bytes_type raw_state_read(uint64_t offset, uint64_t size) = 0;

    /// \brief Overwrites raw state starting at offset
    virtual void raw_state_write(uint64_t offset, const bytes_type &data) = 0;

    /// \brief Returns the size of the raw state drive in bytes
    virtual uint64_t raw_state_size(void) = 0;
};

/// \brief Finishes the previous request and routes the next one
rollup_request next_request(rollup_dispatcher &dispatcher, std::optional<finish_status> previous);

/// \brief rollup_dispatcher speaking JSON over an http_transport
class http_dispatcher_client final : public rollup_dispatcher {
public:
    explicit http_dispatcher_client(http_transport &transport) : m_transport(transport) {}

    nlohmann::json finish(std::optional<finish_status> previous) override;
    uint64_t write_voucher(const voucher_type &voucher) override;
    uint64_t write_notice(const notice_type &notice) override;
    std::optional<uint64_t> write_report(const report_type &report) override;
    void throw_exception(const std::string &message) override;
    gio_response_type gio_request(const gio_request_type &request) override;
    bytes_type raw_state_read(uint64_t offset, uint64_t size) override;
    void raw_state_write(uint64_t offset, const bytes_type &data) override;
    uint64_t raw_state_size(void) override;

private:
    http_response_type post(const std::string &path, const nlohmann::json &body);

    http_transport &m_transport;
};

} // namespace dapp

#endif
