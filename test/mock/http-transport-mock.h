#ifndef DAPP_TEST_MOCK_HTTP_TRANSPORT_MOCK_H
#define DAPP_TEST_MOCK_HTTP_TRANSPORT_MOCK_H

#include <gmock/gmock.h>

#include "rollup-http-transport.h"

namespace dapp {

class http_transport_mock : public http_transport {
public:
    ~http_transport_mock() override = default;

    MOCK_METHOD(http_response_type, post, (const std::string &path, const std::string &body), (override));
    MOCK_METHOD(http_response_type, post_octets, (const std::string &path, const std::string &body), (override));
    MOCK_METHOD(http_response_type, get, (const std::string &path), (override));
    MOCK_METHOD(void, wait_before_retry, (), (override));
};

} // namespace dapp

#endif
