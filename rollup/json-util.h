#ifndef DAPP_JSON_UTIL_H
#define DAPP_JSON_UTIL_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include "nlohmann/json.hpp"

#include "io-types.h"

namespace dapp {

using namespace std::string_literals;

// Allow using to_string when the input type is already a string
using std::to_string;
std::string to_string(const std::string &s);
std::string to_string(const char *s);

/// \brief Encodes binary data as a 0x-prefixed lowercase hex string
std::string encode_hex(const uint8_t *data, size_t length);
std::string encode_hex(const bytes_type &data);
std::string encode_hex(const eth_address &address);

/// \brief Decodes a 0x-prefixed hex string (either case) into binary data
/// \detail Throws std::invalid_argument if the input is not properly encoded
bytes_type decode_hex(std::string_view hex);

// Forward declaration of generic ju_get_field
template <typename T, typename K>
void ju_get_field(const nlohmann::json &j, const K &key, T &value, const std::string &path = ""s);

// Allows use contains when the index is an integer and j contains an array
template <typename I>
inline std::enable_if_t<std::is_integral_v<I>, bool> contains(const nlohmann::json &j, I i) {
    if constexpr (std::is_signed_v<I>) {
        return j.is_array() && i >= 0 && i < static_cast<I>(j.size());
    } else {
        return j.is_array() && i < j.size();
    }
}

// Overload for case where index is a string and j contains an object
inline bool contains(const nlohmann::json &j, const std::string &s) {
    return j.is_object() && j.contains(s);
}

/// \brief Attempts to load a string from a field in a JSON object
/// \tparam K Key type (explicit extern declarations for uint64_t and std::string are provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, std::string &value, const std::string &path = ""s);

/// \brief Attempts to load an uint64_t from a field in a JSON object
/// \tparam K Key type (explicit extern declarations for uint64_t and std::string are provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, uint64_t &value, const std::string &path = ""s);

/// \brief Attempts to load a hex-encoded eth_address from a field in a JSON object
/// \tparam K Key type (explicit extern declarations for uint64_t and std::string are provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, eth_address &value, const std::string &path = ""s);

/// \brief Attempts to load hex-encoded binary data from a field in a JSON object
/// \tparam K Key type (explicit extern declarations for uint64_t and std::string are provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, bytes_type &value, const std::string &path = ""s);

/// \brief Attempts to load an input_metadata_type from a field in a JSON object
/// \tparam K Key type (explicit extern declarations for uint64_t and std::string are provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, input_metadata_type &value,
    const std::string &path = ""s);

/// \brief Attempts to load an advance_state_request from a field in a JSON object
/// \tparam K Key type (explicit extern declarations for uint64_t and std::string are provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, advance_state_request &value,
    const std::string &path = ""s);

/// \brief Attempts to load an inspect_state_request from a field in a JSON object
/// \tparam K Key type (explicit extern declarations for uint64_t and std::string are provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, inspect_state_request &value,
    const std::string &path = ""s);

/// \brief Attempts to load a request_what from a field in a JSON object
/// \tparam K Key type (explicit extern declarations for uint64_t and std::string are provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
template <typename K>
void ju_get_opt_field(const nlohmann::json &j, const K &key, request_what &value, const std::string &path = ""s);

/// \brief Loads an object from a field in a JSON object.
/// \tparam K Key type (explicit extern declarations for uint64_t and std::string are provided)
/// \param j JSON object to load from
/// \param key Key to load value from
/// \param value Object to store value
/// \param path Path to j
/// \detail Throws error if field is missing
template <typename T, typename K>
void ju_get_field(const nlohmann::json &j, const K &key, T &value, const std::string &path) {
    if (!contains(j, key)) {
        throw std::invalid_argument("missing field \""s + path + to_string(key) + "\""s);
    }
    ju_get_opt_field(j, key, value, path);
}

// Automatic conversion functions from io-types to nlohmann::json
void to_json(nlohmann::json &j, const finish_status &status);
void to_json(nlohmann::json &j, const voucher_type &voucher);
void to_json(nlohmann::json &j, const notice_type &notice);
void to_json(nlohmann::json &j, const report_type &report);
void to_json(nlohmann::json &j, const gio_request_type &request);

// Extern template declarations
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, std::string &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const uint64_t &key, std::string &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, uint64_t &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const uint64_t &key, uint64_t &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, eth_address &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const uint64_t &key, eth_address &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, bytes_type &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const uint64_t &key, bytes_type &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, input_metadata_type &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const uint64_t &key, input_metadata_type &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, advance_state_request &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const uint64_t &key, advance_state_request &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, inspect_state_request &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const uint64_t &key, inspect_state_request &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const std::string &key, request_what &value,
    const std::string &path);
extern template void ju_get_opt_field(const nlohmann::json &j, const uint64_t &key, request_what &value,
    const std::string &path);

} // namespace dapp

#endif
