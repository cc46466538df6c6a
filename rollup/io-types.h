#ifndef DAPP_IO_TYPES_H
#define DAPP_IO_TYPES_H

#include <array>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>
#include <variant>
#include <vector>

namespace dapp {

////////////////////////////////////////////////////////////////////////////////
// Auxiliary input/output types

using eth_address = std::array<uint8_t, 20>;

using bytes_type = std::vector<uint8_t>;

inline std::ostream &operator<<(std::ostream &out, const eth_address &s) {
    out << "0x";
    auto f = out.flags();
    for (const unsigned b : s) {
        out << std::hex << std::setfill('0') << std::setw(2) << b;
    }
    out.flags(f);
    return out;
}

inline std::ostream &operator<<(std::ostream &out, const bytes_type &s) {
    out << "0x";
    auto f = out.flags();
    for (const unsigned b : s) {
        out << std::hex << std::setfill('0') << std::setw(2) << b;
    }
    out.flags(f);
    return out;
}

struct input_metadata_type {
    eth_address sender;
    uint64_t block_number;
    uint64_t timestamp;
    uint64_t epoch_index;
    uint64_t input_index;
};

inline std::ostream &operator<<(std::ostream &out, const input_metadata_type &s) {
    out << "input_metadata{";
    out << "sender:" << s.sender << ',';
    out << "block_number:" << s.block_number << ',';
    out << "timestamp:" << s.timestamp << ',';
    out << "epoch_index:" << s.epoch_index << ',';
    out << "input_index:" << s.input_index;
    out << '}';
    return out;
}

////////////////////////////////////////////////////////////////////////////////
// Requests handed out by the dispatcher

enum class request_what : uint8_t {
    advance_state = 0,
    inspect_state = 1,
};

inline std::ostream &operator<<(std::ostream &out, const request_what &s) {
    switch (s) {
        case request_what::advance_state:
            out << "advance_state";
            break;
        case request_what::inspect_state:
            out << "inspect_state";
            break;
        default:
            out << "unknown";
            break;
    }
    return out;
}

// Input derived from an on-chain transaction. Mutates dapp state.
struct advance_state_request {
    input_metadata_type metadata;
    bytes_type payload;
};

inline std::ostream &operator<<(std::ostream &out, const advance_state_request &s) {
    out << "advance_state{";
    out << "metadata:" << s.metadata << ',';
    out << "payload:" << s.payload;
    out << '}';
    return out;
}

// Read-only query. Answered with reports only.
struct inspect_state_request {
    bytes_type payload;
};

inline std::ostream &operator<<(std::ostream &out, const inspect_state_request &s) {
    out << "inspect_state{";
    out << "payload:" << s.payload;
    out << '}';
    return out;
}

using rollup_request = std::variant<advance_state_request, inspect_state_request>;

inline request_what get_request_what(const rollup_request &r) {
    return std::holds_alternative<advance_state_request>(r) ? request_what::advance_state :
                                                              request_what::inspect_state;
}

inline std::ostream &operator<<(std::ostream &out, const rollup_request &s) {
    std::visit([&out](const auto &r) { out << r; }, s);
    return out;
}

////////////////////////////////////////////////////////////////////////////////
// Verdict reported to the dispatcher when a request is finished

enum class finish_status : uint8_t {
    accept = 0,
    reject = 1,
};

inline std::ostream &operator<<(std::ostream &out, const finish_status &s) {
    switch (s) {
        case finish_status::accept:
            out << "accept";
            break;
        case finish_status::reject:
            out << "reject";
            break;
        default:
            out << "unknown";
            break;
    }
    return out;
}

////////////////////////////////////////////////////////////////////////////////
// Outputs

enum class output_what : uint8_t {
    voucher = 'V',
    notice = 'N',
    report = 'R',
};

inline std::ostream &operator<<(std::ostream &out, const output_what &s) {
    switch (s) {
        case output_what::voucher:
            out << "voucher";
            break;
        case output_what::notice:
            out << "notice";
            break;
        case output_what::report:
            out << "report";
            break;
        default:
            out << "unknown";
            break;
    }
    return out;
}

// Deferred call to destination, executable on-chain once the epoch is settled
struct voucher_type {
    eth_address destination;
    bytes_type payload;
};

inline std::ostream &operator<<(std::ostream &out, const voucher_type &s) {
    out << "voucher{";
    out << "destination:" << s.destination << ',';
    out << "payload:" << s.payload;
    out << '}';
    return out;
}

// Provable statement about the dapp state
struct notice_type {
    bytes_type payload;
};

inline std::ostream &operator<<(std::ostream &out, const notice_type &s) {
    out << "notice{";
    out << "payload:" << s.payload;
    out << '}';
    return out;
}

// Diagnostics, not provable
struct report_type {
    bytes_type payload;
};

inline std::ostream &operator<<(std::ostream &out, const report_type &s) {
    out << "report{";
    out << "payload:" << s.payload;
    out << '}';
    return out;
}

using output_type = std::variant<voucher_type, notice_type, report_type>;

inline output_what get_output_what(const output_type &o) {
    switch (o.index()) {
        case 0:
            return output_what::voucher;
        case 1:
            return output_what::notice;
        default:
            return output_what::report;
    }
}

struct emitted_output_type {
    output_type output;
    uint64_t index; // position among outputs of the same kind in the cycle
};

inline std::ostream &operator<<(std::ostream &out, const emitted_output_type &s) {
    std::visit([&out](const auto &o) { out << o; }, s.output);
    out << '#' << s.index;
    return out;
}

////////////////////////////////////////////////////////////////////////////////
// Generic I/O requests forwarded by the dispatcher to the host

struct gio_request_type {
    uint16_t domain; ///< Service the request is addressed to
    bytes_type id;   ///< Request contents, meaning defined by the domain
};

inline std::ostream &operator<<(std::ostream &out, const gio_request_type &s) {
    out << "gio_request{";
    out << "domain:" << s.domain << ',';
    out << "id:" << s.id;
    out << '}';
    return out;
}

struct gio_response_type {
    uint16_t code; ///< Result code defined by the domain
    bytes_type data;
};

inline std::ostream &operator<<(std::ostream &out, const gio_response_type &s) {
    out << "gio_response{";
    out << "code:" << s.code << ',';
    out << "data:" << s.data;
    out << '}';
    return out;
}

////////////////////////////////////////////////////////////////////////////////
// State threaded through a single request/finish cycle

struct cycle_state_type {
    std::optional<rollup_request> request;    ///< Request being processed, if any
    std::vector<emitted_output_type> outputs; ///< Outputs emitted so far, in order
    std::optional<finish_status> verdict;     ///< Verdict once the model returned
};

} // namespace dapp

#endif
