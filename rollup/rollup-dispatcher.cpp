#include <cstdint>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>

#include "json-util.h"
#include "rollup-dispatcher.h"
#include "rollup-errors.h"
#include "rollup-router.h"
#include "rollup-signals.h"

namespace dapp {

// Dispatcher has no pending request yet; finish must be repeated
constexpr int HTTP_STATUS_ACCEPTED = 202;

static bool is_success(int status) {
    return status >= 200 && status < 300;
}

// Throws transport_error unless the dispatcher reported success
static void check_success(const std::string &path, const http_response_type &response) {
    if (!is_success(response.status)) {
        throw transport_error("dispatcher returned status "s + std::to_string(response.status) + " for "s + path +
            (response.body.empty() ? ""s : " ("s + response.body + ")"s));
    }
}

// Decodes a response body into a JSON object
static nlohmann::json parse_body(const std::string &path, const std::string &body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (std::exception &x) {
        throw malformed_response_error("unable to parse response to "s + path + " ("s + x.what() + ")"s);
    }
    if (!j.is_object()) {
        throw malformed_response_error("response to "s + path + " not an object"s);
    }
    return j;
}

// Extracts the output index from a response body
static uint64_t parse_index(const std::string &path, const std::string &body) {
    const auto j = parse_body(path, body);
    uint64_t index = 0;
    try {
        ju_get_field(j, "index"s, index, path + "/"s);
    } catch (std::invalid_argument &x) {
        throw malformed_response_error(x.what());
    }
    return index;
}

rollup_request next_request(rollup_dispatcher &dispatcher, std::optional<finish_status> previous) {
    return route_request(dispatcher.finish(previous));
}

http_response_type http_dispatcher_client::post(const std::string &path, const nlohmann::json &body) {
    return m_transport.post(path, body.dump());
}

nlohmann::json http_dispatcher_client::finish(std::optional<finish_status> previous) {
    // Without a previous request, the dispatcher takes accept as a no-op
    const nlohmann::json body{{"status", previous.value_or(finish_status::accept)}};
    for (;;) {
        const auto response = post("/finish", body);
        if (response.status == HTTP_STATUS_ACCEPTED) {
            if (shutdown_requested()) {
                throw shutdown_requested_error{};
            }
            (void) fprintf(stderr, "[dapp] no pending rollup request, trying again\n");
            m_transport.wait_before_retry();
            continue;
        }
        check_success("/finish", response);
        return parse_body("/finish", response.body);
    }
}

uint64_t http_dispatcher_client::write_voucher(const voucher_type &voucher) {
    const auto response = post("/voucher", voucher);
    check_success("/voucher", response);
    return parse_index("/voucher", response.body);
}

uint64_t http_dispatcher_client::write_notice(const notice_type &notice) {
    const auto response = post("/notice", notice);
    check_success("/notice", response);
    return parse_index("/notice", response.body);
}

std::optional<uint64_t> http_dispatcher_client::write_report(const report_type &report) {
    const auto response = post("/report", report);
    check_success("/report", response);
    if (response.body.empty()) {
        return std::nullopt;
    }
    return parse_index("/report", response.body);
}

void http_dispatcher_client::throw_exception(const std::string &message) {
    const nlohmann::json body{{"payload", encode_hex(reinterpret_cast<const uint8_t *>(message.data()), message.size())}};
    check_success("/exception", post("/exception", body));
}

gio_response_type http_dispatcher_client::gio_request(const gio_request_type &request) {
    const auto response = post("/gio", request);
    check_success("/gio", response);
    const auto j = parse_body("/gio", response.body);
    gio_response_type gio{};
    try {
        uint64_t code = 0;
        ju_get_field(j, "code"s, code, "/gio/"s);
        if (code > UINT16_MAX) {
            throw std::invalid_argument("field \"/gio/code\" out of range");
        }
        gio.code = static_cast<uint16_t>(code);
        ju_get_field(j, "data"s, gio.data, "/gio/"s);
    } catch (std::invalid_argument &x) {
        throw malformed_response_error(x.what());
    }
    return gio;
}

bytes_type http_dispatcher_client::raw_state_read(uint64_t offset, uint64_t size) {
    const auto path = "/raw_state_read/"s + std::to_string(offset) + "/"s + std::to_string(size);
    const auto response = m_transport.get(path);
    check_success(path, response);
    if (response.body.size() != size) {
        throw malformed_response_error("expected "s + std::to_string(size) + " bytes from "s + path + ", got "s +
            std::to_string(response.body.size()));
    }
    return bytes_type(response.body.begin(), response.body.end());
}

void http_dispatcher_client::raw_state_write(uint64_t offset, const bytes_type &data) {
    const auto path = "/raw_state_write/"s + std::to_string(offset);
    check_success(path, m_transport.post_octets(path, std::string(data.begin(), data.end())));
}

uint64_t http_dispatcher_client::raw_state_size(void) {
    const auto response = m_transport.get("/raw_state_size");
    check_success("/raw_state_size", response);
    const auto j = parse_body("/raw_state_size", response.body);
    uint64_t size = 0;
    try {
        ju_get_field(j, "size"s, size, "/raw_state_size/"s);
    } catch (std::invalid_argument &x) {
        throw malformed_response_error(x.what());
    }
    return size;
}

} // namespace dapp
