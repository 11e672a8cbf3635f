#include <unity.h>
#include <string>
#include <vector>

#include "Modules/StationModule/CommandRouter.h"
#include "support/FakeBus.h"
#include "support/LogCapture.h"

namespace {

class RecordingActuator : public ActuatorDevice {
public:
    explicit RecordingActuator(const char* name) : ActuatorDevice(name) {}

    ErrorCode begin() override { return ErrorCode::None; }
    ErrorCode handleMessage(const char* payload, size_t len) override
    {
        calls.push_back(std::string(payload, len));
        return result;
    }

    std::vector<std::string> calls;
    ErrorCode result = ErrorCode::None;
};

LogCapture logs;

}  // namespace

void setUp() { logs.install(); }
void tearDown() { logs.uninstall(); }

void test_unknown_topic_is_logged_and_actuates_nothing()
{
    ShutdownSignal shutdown;
    CommandRouter router(shutdown);
    RecordingActuator pump("pump");
    RecordingActuator lcd("lcd");
    router.addRoute("c/pump", &pump);
    router.addRoute("c/lcd", &lcd);

    router.dispatch("c/valve", "on", 2);

    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)pump.calls.size());
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)lcd.calls.size());
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)logs.count(LogLevel::Warn, "unknown topic c/valve (2 bytes): UnknownTopic"));
    TEST_ASSERT_EQUAL_UINT32(1, router.unknown());
    TEST_ASSERT_NULL(router.route("c/valve"));
}

void test_pump_topic_forwards_payload_verbatim()
{
    ShutdownSignal shutdown;
    CommandRouter router(shutdown);
    RecordingActuator pump("pump");
    RecordingActuator lcd("lcd");
    router.addRoute("c/pump", &pump);
    router.addRoute("c/lcd", &lcd);

    const char payload[] = {' ', 'O', 'n', '\0', '!'};
    router.dispatch("c/pump", payload, sizeof(payload));

    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)pump.calls.size());
    TEST_ASSERT_EQUAL_UINT32(sizeof(payload), (uint32_t)pump.calls[0].size());
    TEST_ASSERT_EQUAL_MEMORY(payload, pump.calls[0].data(), sizeof(payload));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)lcd.calls.size());
    TEST_ASSERT_EQUAL_UINT32(1, router.handled());
}

void test_handler_failure_is_isolated_per_message()
{
    FakeBus bus;
    ShutdownSignal shutdown;
    CommandRouter router(shutdown);
    RecordingActuator pump("pump");
    router.addRoute("c/pump", &pump);
    TEST_ASSERT_TRUE(router.subscribeAll(bus.service()));

    pump.result = ErrorCode::IoError;
    TEST_ASSERT_TRUE(bus.deliver("c/pump", "on"));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)logs.count(LogLevel::Warn, "c/pump -> pump failed: IoError"));

    pump.result = ErrorCode::None;
    TEST_ASSERT_TRUE(bus.deliver("c/pump", "off"));

    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)pump.calls.size());
    TEST_ASSERT_EQUAL_STRING("off", pump.calls[1].c_str());
    TEST_ASSERT_TRUE(bus.isSubscribed("c/pump"));
    TEST_ASSERT_EQUAL_UINT32(1, router.failures());
    TEST_ASSERT_EQUAL_UINT32(1, router.handled());
}

void test_subscribe_and_unsubscribe_every_route_once()
{
    FakeBus bus;
    ShutdownSignal shutdown;
    CommandRouter router(shutdown);
    RecordingActuator pump("pump");
    RecordingActuator lcd("lcd");
    router.addRoute("c/pump", &pump);
    router.addRoute("c/lcd", &lcd);
    router.addMonitor("d/soil");

    TEST_ASSERT_TRUE(router.subscribeAll(bus.service()));
    TEST_ASSERT_TRUE(router.subscribeAll(bus.service()));
    TEST_ASSERT_EQUAL_UINT32(3, (uint32_t)bus.subscriptions.size());

    bus.deliver("c/lcd", "hello");
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)lcd.calls.size());

    router.unsubscribeAll();
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)bus.subscriptions.size());
    TEST_ASSERT_FALSE(router.route("c/lcd")->subscribed);
}

void test_subscribe_refusal_is_reported()
{
    FakeBus bus;
    bus.subscribeResult = false;
    ShutdownSignal shutdown;
    CommandRouter router(shutdown);
    RecordingActuator pump("pump");
    router.addRoute("c/pump", &pump);

    TEST_ASSERT_FALSE(router.subscribeAll(bus.service()));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)logs.count(LogLevel::Error, "subscribe failed topic=c/pump"));
}

void test_monitor_routes_never_actuate()
{
    ShutdownSignal shutdown;
    CommandRouter router(shutdown);
    RecordingActuator pump("pump");
    router.addRoute("c/pump", &pump);
    router.addMonitor("d/on");

    router.dispatch("d/on", "on", 2);

    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)pump.calls.size());
    TEST_ASSERT_EQUAL_UINT32(0, router.unknown());
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)logs.count(LogLevel::Debug, "observed d/on on"));
}

void test_each_topic_maps_to_one_handler()
{
    ShutdownSignal shutdown;
    CommandRouter router(shutdown);
    RecordingActuator pump("pump");
    RecordingActuator other("other");

    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)router.addRoute("c/pump", &pump));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::DuplicateName, (int)router.addRoute("c/pump", &other));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::DuplicateName, (int)router.addMonitor("c/pump"));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::InvalidArg, (int)router.addRoute("c/x", nullptr));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::InvalidArg, (int)router.addRoute("", &pump));

    TEST_ASSERT_EQUAL_PTR(&pump, router.route("c/pump")->actuator);
    TEST_ASSERT_EQUAL_UINT8(1, router.count());
}

void test_commands_after_shutdown_are_dropped()
{
    FakeBus bus;
    ShutdownSignal shutdown;
    CommandRouter router(shutdown);
    RecordingActuator pump("pump");
    router.addRoute("c/pump", &pump);
    TEST_ASSERT_TRUE(router.subscribeAll(bus.service()));

    FakeBus::Subscription pending = bus.subscriptions[0];
    TEST_ASSERT_TRUE(shutdown.trigger());
    router.unsubscribeAll();

    pending.fn(pending.ctx, "c/pump", "on", 2);
    router.dispatch("c/valve", "on", 2);

    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)pump.calls.size());
    TEST_ASSERT_EQUAL_UINT32(0, router.handled());
    TEST_ASSERT_EQUAL_UINT32(0, router.unknown());
    TEST_ASSERT_EQUAL_UINT32(2, router.dropped());
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)logs.count(LogLevel::Debug, "stopping, dropped c/pump"));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_unknown_topic_is_logged_and_actuates_nothing);
    RUN_TEST(test_pump_topic_forwards_payload_verbatim);
    RUN_TEST(test_handler_failure_is_isolated_per_message);
    RUN_TEST(test_subscribe_and_unsubscribe_every_route_once);
    RUN_TEST(test_subscribe_refusal_is_reported);
    RUN_TEST(test_monitor_routes_never_actuate);
    RUN_TEST(test_each_topic_maps_to_one_handler);
    RUN_TEST(test_commands_after_shutdown_are_dropped);
    return UNITY_END();
}
