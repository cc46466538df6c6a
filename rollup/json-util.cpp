#include <algorithm>
#include <cmath>
#include <exception>
#include <string>

#include "json-util.h"

namespace dapp {

std::string to_string(const std::string &s) {
    return s;
}

std::string to_string(const char *s) {
    return s;
}

// Returns the value of a hex digit, or 16 if c is not one
static unsigned hex_digit_value(char c) {
    if (c >= '0' && c <= '9') {
        return static_cast<unsigned>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<unsigned>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<unsigned>(c - 'A' + 10);
    }
    return 16;
}

std::string encode_hex(const uint8_t *data, size_t length) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(2 * length + 2);
    out += "0x";
    for (size_t i = 0; i < length; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

std::string encode_hex(const bytes_type &data) {
    return encode_hex(data.data(), data.size());
}

std::string encode_hex(const eth_address &address) {
    return encode_hex(address.data(), address.size());
}

bytes_type decode_hex(std::string_view hex) {
    if (hex.size() < 2 || hex[0] != '0' || (hex[1] != 'x' && hex[1] != 'X')) {
        throw std::invalid_argument{"input doesn't start with 0x"};
    }
    hex.remove_prefix(2);
    if (hex.size() & 1) {
        throw std::invalid_argument{"input has odd length"};
    }
    bytes_type out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const unsigned n0 = hex_digit_value(hex[i]);
        const unsigned n1 = hex_digit_value(hex[i + 1]);
        if (n0 > 15 || n1 > 15) {
            throw std::invalid_argument{"input not hex encoded"};
        }
        out.push_back(static_cast<uint8_t>((n0 << 4) + n1));
    }
    return out;
}

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, std::string &value, const std::string &path) {
    if (!contains(j, key)) {
        return;
    }
    const auto &jk = j[key];
    if (!jk.is_string()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not a string");
    }
    value = jk.template get<std::string>();
}

template void ju_get_opt_field<uint64_t>(const nlohmann::json &j, const uint64_t &key, std::string &value,
    const std::string &path);
template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key, std::string &value,
    const std::string &path);

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, uint64_t &value, const std::string &path) {
    if (!contains(j, key)) {
        return;
    }
    const auto &jk = j[key];
    if (!jk.is_number_integer() && !jk.is_number_unsigned() && !jk.is_number_float()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not an unsigned integer");
    }
    if (jk.is_number_float()) {
        auto f = jk.template get<nlohmann::json::number_float_t>();
        if (f < 0 || std::fmod(f, static_cast<nlohmann::json::number_float_t>(1.0)) != 0 ||
            f >= static_cast<nlohmann::json::number_float_t>(UINT64_MAX)) {
            throw std::invalid_argument("field \""s + path + to_string(key) + "\" not an unsigned integer");
        }
        value = static_cast<uint64_t>(f);
        return;
    }
    if (jk.is_number_unsigned()) {
        value = jk.template get<uint64_t>();
        return;
    }
    auto i = jk.template get<nlohmann::json::number_integer_t>();
    if (i < 0) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not an unsigned integer");
    }
    value = static_cast<uint64_t>(i);
}

template void ju_get_opt_field<uint64_t>(const nlohmann::json &j, const uint64_t &key, uint64_t &value,
    const std::string &path);
template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key, uint64_t &value,
    const std::string &path);

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, bytes_type &value, const std::string &path) {
    if (!contains(j, key)) {
        return;
    }
    const auto &jk = j[key];
    if (!jk.is_string()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not a string");
    }
    try {
        value = decode_hex(jk.template get_ref<const std::string &>());
    } catch (std::invalid_argument &x) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not hex-encoded ("s + x.what() + ")"s);
    }
}

template void ju_get_opt_field<uint64_t>(const nlohmann::json &j, const uint64_t &key, bytes_type &value,
    const std::string &path);
template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key, bytes_type &value,
    const std::string &path);

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, eth_address &value, const std::string &path) {
    if (!contains(j, key)) {
        return;
    }
    bytes_type address;
    ju_get_opt_field(j, key, address, path);
    if (address.size() != value.size()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not a hex-encoded eth-address");
    }
    std::copy(address.begin(), address.end(), value.begin());
}

template void ju_get_opt_field<uint64_t>(const nlohmann::json &j, const uint64_t &key, eth_address &value,
    const std::string &path);
template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key, eth_address &value,
    const std::string &path);

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, input_metadata_type &value, const std::string &path) {
    if (!contains(j, key)) {
        return;
    }
    const auto &metadata = j[key];
    const auto new_path = path + to_string(key) + "/";
    if (!metadata.is_object()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not an object");
    }
    ju_get_field(metadata, "msg_sender"s, value.sender, new_path);
    ju_get_field(metadata, "epoch_index"s, value.epoch_index, new_path);
    ju_get_field(metadata, "input_index"s, value.input_index, new_path);
    ju_get_field(metadata, "block_number"s, value.block_number, new_path);
    ju_get_field(metadata, "timestamp"s, value.timestamp, new_path);
}

template void ju_get_opt_field<uint64_t>(const nlohmann::json &j, const uint64_t &key, input_metadata_type &value,
    const std::string &path);
template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key,
    input_metadata_type &value, const std::string &path);

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, advance_state_request &value, const std::string &path) {
    if (!contains(j, key)) {
        return;
    }
    const auto &advance = j[key];
    const auto new_path = path + to_string(key) + "/";
    if (!advance.is_object()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not an object");
    }
    ju_get_field(advance, "metadata"s, value.metadata, new_path);
    ju_get_field(advance, "payload"s, value.payload, new_path);
}

template void ju_get_opt_field<uint64_t>(const nlohmann::json &j, const uint64_t &key, advance_state_request &value,
    const std::string &path);
template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key,
    advance_state_request &value, const std::string &path);

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, inspect_state_request &value, const std::string &path) {
    if (!contains(j, key)) {
        return;
    }
    const auto &inspect = j[key];
    const auto new_path = path + to_string(key) + "/";
    if (!inspect.is_object()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not an object");
    }
    ju_get_field(inspect, "payload"s, value.payload, new_path);
}

template void ju_get_opt_field<uint64_t>(const nlohmann::json &j, const uint64_t &key, inspect_state_request &value,
    const std::string &path);
template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key,
    inspect_state_request &value, const std::string &path);

template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, request_what &value, const std::string &path) {
    if (!contains(j, key)) {
        return;
    }
    const auto &jk = j[key];
    if (!jk.is_string()) {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not a request_what");
    }
    const auto &what = jk.template get_ref<const std::string &>();
    if (what == "advance_state") {
        value = request_what::advance_state;
    } else if (what == "inspect_state") {
        value = request_what::inspect_state;
    } else {
        throw std::invalid_argument("field \""s + path + to_string(key) + "\" not a request_what");
    }
}

template void ju_get_opt_field<uint64_t>(const nlohmann::json &j, const uint64_t &key, request_what &value,
    const std::string &path);
template void ju_get_opt_field<std::string>(const nlohmann::json &j, const std::string &key, request_what &value,
    const std::string &path);

void to_json(nlohmann::json &j, const finish_status &status) {
    switch (status) {
        case finish_status::accept:
            j = "accept";
            break;
        case finish_status::reject:
            j = "reject";
            break;
        default:
            throw std::invalid_argument{"invalid finish status"};
    }
}

void to_json(nlohmann::json &j, const voucher_type &voucher) {
    j = nlohmann::json{{"destination", encode_hex(voucher.destination)}, {"payload", encode_hex(voucher.payload)}};
}

void to_json(nlohmann::json &j, const notice_type &notice) {
    j = nlohmann::json{{"payload", encode_hex(notice.payload)}};
}

void to_json(nlohmann::json &j, const report_type &report) {
    j = nlohmann::json{{"payload", encode_hex(report.payload)}};
}

void to_json(nlohmann::json &j, const gio_request_type &request) {
    j = nlohmann::json{{"domain", request.domain}, {"id", encode_hex(request.id)}};
}

} // namespace dapp
