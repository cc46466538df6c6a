#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "echo-model.h"
#include "mock/rollup-dispatcher-mock.h"
#include "rollup-errors.h"
#include "rollup-loop.h"
#include "rollup-signals.h"
#include "testutil/scripted-dispatcher.h"

using namespace dapp;
using dapp::testutil::filled_address;
using dapp::testutil::make_advance_json;
using dapp::testutil::make_inspect_json;
using dapp::testutil::scripted_dispatcher;
using dapp::testutil::to_bytes;
using ::testing::_;

class RequestLoopTest : public ::testing::Test {
protected:
    void TearDown() override {
        clear_shutdown_request();
    }

    echo_model model_{echo_config_type{.vouchers = 1, .notices = 1, .reports = 1}};
};

/**
 * @given a fresh loop
 * @when it is stepped through a request
 * @then it goes from awaiting to routing to processing and back to awaiting
 */
TEST_F(RequestLoopTest, StepsThroughStates) {
    scripted_dispatcher dispatcher({make_inspect_json(to_bytes("testquery"))});
    request_loop loop(dispatcher, model_);
    EXPECT_EQ(loop.get_state(), loop_state::awaiting_request);
    EXPECT_EQ(loop.get_previous_verdict(), std::nullopt);

    loop.step();
    EXPECT_EQ(loop.get_state(), loop_state::routing);
    EXPECT_FALSE(loop.get_cycle().request.has_value());

    loop.step();
    EXPECT_EQ(loop.get_state(), loop_state::processing);
    ASSERT_TRUE(loop.get_cycle().request.has_value());
    EXPECT_EQ(get_request_what(loop.get_cycle().request.value()), request_what::inspect_state);
    EXPECT_EQ(loop.get_processed_count(), 0);

    loop.step();
    EXPECT_EQ(loop.get_state(), loop_state::awaiting_request);
    EXPECT_EQ(loop.get_processed_count(), 1);
    EXPECT_EQ(loop.get_previous_verdict(), std::optional<finish_status>{finish_status::accept});
}

/**
 * @given a dispatcher with several requests
 * @when the loop runs until the dispatcher asks for a shutdown
 * @then every request is finished once, outputs of each request follow its finish,
 * and each finish carries the verdict of the request before it
 */
TEST_F(RequestLoopTest, FinishesEveryRequestOnce) {
    scripted_dispatcher dispatcher({make_advance_json(filled_address(0xaa), bytes_type{0x01}),
        make_inspect_json(to_bytes("testquery")), make_advance_json(filled_address(0xbb), bytes_type{0x02}, 0, 1)});
    dispatcher.shutdown_when_exhausted = true;
    request_loop loop(dispatcher, model_);
    EXPECT_EQ(loop.run(), 0);
    EXPECT_EQ(loop.get_processed_count(), 3);

    const std::vector<std::string> expected_calls{"finish", "voucher", "notice", "report", "finish", "report",
        "finish", "voucher", "notice", "report", "finish"};
    EXPECT_EQ(dispatcher.calls, expected_calls);
    ASSERT_EQ(dispatcher.finish_statuses.size(), 4);
    EXPECT_EQ(dispatcher.finish_statuses[0], std::nullopt);
    for (size_t i = 1; i < dispatcher.finish_statuses.size(); ++i) {
        EXPECT_EQ(dispatcher.finish_statuses[i], std::optional<finish_status>{finish_status::accept});
    }
    EXPECT_TRUE(dispatcher.exceptions.empty());
}

/**
 * @given a request without a request_type
 * @when the loop runs
 * @then it reports an exception to the dispatcher and exits with 1
 */
TEST_F(RequestLoopTest, MalformedRequestIsFatal) {
    auto raw = make_inspect_json(to_bytes("testquery"));
    raw.erase("request_type");
    scripted_dispatcher dispatcher({raw});
    request_loop loop(dispatcher, model_);
    EXPECT_EQ(loop.run(), 1);
    const std::vector<std::string> expected_calls{"finish", "exception"};
    EXPECT_EQ(dispatcher.calls, expected_calls);
    ASSERT_EQ(dispatcher.exceptions.size(), 1);
    EXPECT_EQ(dispatcher.exceptions[0].rfind("malformed request", 0), 0);
    EXPECT_EQ(loop.get_processed_count(), 0);
}

/**
 * @given a dispatcher that becomes unreachable
 * @when the loop runs
 * @then it exits with 1 without trying to report an exception
 */
TEST_F(RequestLoopTest, TransportFailureIsFatal) {
    scripted_dispatcher dispatcher({make_inspect_json(to_bytes("testquery"))});
    request_loop loop(dispatcher, model_);
    EXPECT_EQ(loop.run(), 1);
    EXPECT_EQ(loop.get_processed_count(), 1);
    EXPECT_TRUE(dispatcher.exceptions.empty());
}

/**
 * @given a dispatcher answering finish with an undecodable response
 * @when the loop runs
 * @then the exception is reported and the loop exits with 1 even if reporting fails
 */
TEST_F(RequestLoopTest, MalformedResponseIsFatal) {
    rollup_dispatcher_mock dispatcher;
    EXPECT_CALL(dispatcher, finish(_)).WillOnce(::testing::Throw(malformed_response_error("not json")));
    EXPECT_CALL(dispatcher, throw_exception("malformed response: not json"))
        .WillOnce(::testing::Throw(transport_error("connection refused")));
    request_loop loop(dispatcher, model_);
    EXPECT_EQ(loop.run(), 1);
}

/**
 * @given a shutdown requested before the loop starts
 * @when the loop runs
 * @then it exits with 0 without contacting the dispatcher
 */
TEST_F(RequestLoopTest, HonorsShutdownRequest) {
    rollup_dispatcher_mock dispatcher;
    EXPECT_CALL(dispatcher, finish(_)).Times(0);
    request_shutdown();
    EXPECT_TRUE(shutdown_requested());
    request_loop loop(dispatcher, model_);
    EXPECT_EQ(loop.run(), 0);
}

/**
 * @given the loop states
 * @when they are printed
 * @then their names are shown
 */
TEST(LoopStateTest, PrintsNames) {
    std::ostringstream ss;
    ss << loop_state::awaiting_request << ' ' << loop_state::routing << ' ' << loop_state::processing;
    EXPECT_EQ(ss.str(), "awaiting_request routing processing");
}
