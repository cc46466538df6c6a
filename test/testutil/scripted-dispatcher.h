#ifndef DAPP_TEST_TESTUTIL_SCRIPTED_DISPATCHER_H
#define DAPP_TEST_TESTUTIL_SCRIPTED_DISPATCHER_H

#include <algorithm>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "json-util.h"
#include "rollup-dispatcher.h"
#include "rollup-errors.h"

namespace dapp::testutil {

inline bytes_type to_bytes(std::string_view s) {
    return bytes_type(s.begin(), s.end());
}

inline eth_address filled_address(uint8_t b) {
    eth_address address{};
    address.fill(b);
    return address;
}

/// \brief Body of a finish response carrying an advance state request
inline nlohmann::json make_advance_json(const eth_address &sender, const bytes_type &payload,
    uint64_t epoch_index = 0, uint64_t input_index = 0) {
    return nlohmann::json{{"request_type", "advance_state"},
        {"data",
            {{"metadata",
                 {{"msg_sender", encode_hex(sender)}, {"epoch_index", epoch_index}, {"input_index", input_index},
                     {"block_number", 42}, {"timestamp", 1700000000}}},
                {"payload", encode_hex(payload)}}}};
}

/// \brief Body of a finish response carrying an inspect state request
inline nlohmann::json make_inspect_json(const bytes_type &payload) {
    return nlohmann::json{{"request_type", "inspect_state"}, {"data", {{"payload", encode_hex(payload)}}}};
}

/// \brief In-memory dispatcher handing out a fixed list of requests
/// \detail Outputs get dispatcher indices starting at 0 per kind in every cycle.
/// Once the list is exhausted, finish fails with transport_error, or with
/// shutdown_requested_error when shutdown_when_exhausted is set.
class scripted_dispatcher : public rollup_dispatcher {
public:
    explicit scripted_dispatcher(std::deque<nlohmann::json> requests = {}) : pending(std::move(requests)) {}

    nlohmann::json finish(std::optional<finish_status> previous) override {
        calls.emplace_back("finish");
        finish_statuses.push_back(previous);
        m_next_voucher = m_next_notice = m_next_report = 0;
        if (pending.empty()) {
            if (shutdown_when_exhausted) {
                throw shutdown_requested_error{};
            }
            throw transport_error("no more requests");
        }
        auto next = std::move(pending.front());
        pending.pop_front();
        return next;
    }

    uint64_t write_voucher(const voucher_type &voucher) override {
        calls.emplace_back("voucher");
        vouchers.push_back(voucher);
        return m_next_voucher++;
    }

    uint64_t write_notice(const notice_type &notice) override {
        calls.emplace_back("notice");
        notices.push_back(notice);
        return m_next_notice++;
    }

    std::optional<uint64_t> write_report(const report_type &report) override {
        calls.emplace_back("report");
        reports.push_back(report);
        return m_next_report++;
    }

    void throw_exception(const std::string &message) override {
        calls.emplace_back("exception");
        exceptions.push_back(message);
    }

    // Echoes the request id back with code 0
    gio_response_type gio_request(const gio_request_type &request) override {
        calls.emplace_back("gio");
        return gio_response_type{0, request.id};
    }

    bytes_type raw_state_read(uint64_t offset, uint64_t size) override {
        calls.emplace_back("raw_state_read");
        check_raw_state_bounds(offset, size);
        return bytes_type(raw_state.begin() + static_cast<std::ptrdiff_t>(offset),
            raw_state.begin() + static_cast<std::ptrdiff_t>(offset + size));
    }

    void raw_state_write(uint64_t offset, const bytes_type &data) override {
        calls.emplace_back("raw_state_write");
        check_raw_state_bounds(offset, data.size());
        std::copy(data.begin(), data.end(), raw_state.begin() + static_cast<std::ptrdiff_t>(offset));
    }

    uint64_t raw_state_size(void) override {
        calls.emplace_back("raw_state_size");
        return raw_state.size();
    }

    std::deque<nlohmann::json> pending;
    bool shutdown_when_exhausted{false};
    std::vector<std::string> calls;
    std::vector<std::optional<finish_status>> finish_statuses;
    std::vector<voucher_type> vouchers;
    std::vector<notice_type> notices;
    std::vector<report_type> reports;
    std::vector<std::string> exceptions;
    bytes_type raw_state;

private:
    void check_raw_state_bounds(uint64_t offset, uint64_t size) const {
        if (offset > raw_state.size() || size > raw_state.size() - offset) {
            throw transport_error("dispatcher returned status 400 (offset and size exceed memory bounds)");
        }
    }

    uint64_t m_next_voucher{0};
    uint64_t m_next_notice{0};
    uint64_t m_next_report{0};
};

} // namespace dapp::testutil

#endif
