#include <unity.h>
#include <math.h>

#include "Core/ShutdownSignal.h"
#include "Modules/StationModule/ReadingCodec.h"
#include "Modules/StationModule/SensorPoller.h"
#include "support/FakeBus.h"
#include "support/LogCapture.h"
#include "support/ManualActivityHost.h"

namespace {

class ScriptedSensor : public SensorDevice {
public:
    explicit ScriptedSensor(const char* name) : SensorDevice(name) {}

    ErrorCode begin() override { return ErrorCode::None; }
    ErrorCode sample(SensorSample& out) override
    {
        ++reads;
        if (fail != ErrorCode::None) return fail;
        out.type = SampleType::Scalar;
        out.value = value;
        return ErrorCode::None;
    }

    float value = 0.0f;
    ErrorCode fail = ErrorCode::None;
    int reads = 0;
};

LogCapture logs;

}  // namespace

void setUp() { logs.install(); }
void tearDown() { logs.uninstall(); }

void test_failing_sensor_keeps_firing_and_never_publishes()
{
    FakeBus bus;
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");
    soil.fail = ErrorCode::IoError;

    PollHandle h = poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2);
    TEST_ASSERT_NOT_EQUAL(POLL_HANDLE_INVALID, h);

    host.runUntil(10 * 1000);

    TEST_ASSERT_EQUAL_INT(10, soil.reads);
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)bus.published.size());
    TEST_ASSERT_EQUAL_UINT32(10, (uint32_t)logs.count(LogLevel::Warn, "soil read failed: IoError"));
    TEST_ASSERT_EQUAL_UINT8(1, host.running());
}

void test_fixed_value_is_published_with_two_decimals_every_tick()
{
    FakeBus bus;
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");
    soil.value = 0.4200f;

    poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2);
    host.runUntil(5 * 1000);

    TEST_ASSERT_EQUAL_UINT32(5, (uint32_t)bus.published.size());
    for (const FakeBusMessage& m : bus.published) {
        TEST_ASSERT_EQUAL_STRING("d/soil", m.topic.c_str());
        TEST_ASSERT_EQUAL_STRING(" 0.42", m.payload.c_str());
    }
}

void test_first_cycle_waits_one_interval()
{
    FakeBus bus;
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");

    poller.startPolling(&soil, "d/soil", 10000, &encodeFixed2);
    host.runUntil(9900);
    TEST_ASSERT_EQUAL_INT(0, soil.reads);

    host.runUntil(10000);
    TEST_ASSERT_EQUAL_INT(1, soil.reads);
}

void test_cycles_are_at_least_one_interval_apart()
{
    FakeBus bus;
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");

    poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2);
    // A late step does not queue up missed cycles.
    host.stepAll(3500);
    TEST_ASSERT_EQUAL_INT(1, soil.reads);
    host.stepAll(4000);
    TEST_ASSERT_EQUAL_INT(1, soil.reads);
    host.stepAll(4500);
    TEST_ASSERT_EQUAL_INT(2, soil.reads);
}

void test_stop_polling_prevents_further_reads()
{
    FakeBus bus;
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");
    ScriptedSensor env("env");

    PollHandle hs = poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2);
    poller.startPolling(&env, "d/env", 1000, &encodeFixed2);
    host.runUntil(2000);
    TEST_ASSERT_EQUAL_INT(2, soil.reads);

    TEST_ASSERT_TRUE(poller.stopPolling(hs));
    host.runUntil(6000);

    TEST_ASSERT_EQUAL_INT(2, soil.reads);
    TEST_ASSERT_EQUAL_INT(6, env.reads);
    TEST_ASSERT_EQUAL_UINT8(1, host.running());
    TEST_ASSERT_FALSE(poller.stopPolling(7));
}

void test_encode_failure_skips_cycle_and_continues()
{
    FakeBus bus;
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");
    soil.value = NAN;

    poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2);
    host.runUntil(2000);
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)bus.published.size());
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)logs.count(LogLevel::Warn, "encode failed"));

    soil.value = 1.5f;
    host.runUntil(3000);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)bus.published.size());
    TEST_ASSERT_EQUAL_STRING(" 1.50", bus.published[0].payload.c_str());
}

void test_publish_failure_is_logged_and_not_fatal()
{
    FakeBus bus;
    bus.publishResult = false;
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");
    soil.value = 0.1f;

    PollHandle h = poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2);
    host.runUntil(3000);
    TEST_ASSERT_EQUAL_UINT32(3, (uint32_t)logs.count(LogLevel::Warn, "publish failed topic=d/soil: PublishFailed"));

    bus.publishResult = true;
    host.runUntil(4000);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)bus.published.size());
    TEST_ASSERT_EQUAL_UINT32(1, poller.job(h)->published());
    TEST_ASSERT_EQUAL_UINT32(3, poller.job(h)->failures());
}

void test_shutdown_ends_every_job()
{
    FakeBus bus;
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");
    ScriptedSensor env("env");

    poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2);
    poller.startPolling(&env, "d/env", 1000, &encodeFixed2);
    host.runUntil(1000);
    const size_t before = bus.published.size();

    TEST_ASSERT_TRUE(shutdown.trigger());
    host.runUntil(10000);

    TEST_ASSERT_EQUAL_UINT32((uint32_t)before, (uint32_t)bus.published.size());
    TEST_ASSERT_EQUAL_UINT8(0, host.running());
    TEST_ASSERT_EQUAL_INT(1, soil.reads);
}

void test_start_rejects_bad_arguments_and_duplicates()
{
    FakeBus bus;
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");
    ErrorCode err = ErrorCode::None;

    TEST_ASSERT_EQUAL_INT8(POLL_HANDLE_INVALID, poller.startPolling(nullptr, "d/soil", 1000, &encodeFixed2, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::InvalidArg, (int)err);
    TEST_ASSERT_EQUAL_INT8(POLL_HANDLE_INVALID, poller.startPolling(&soil, "d/soil", 0, &encodeFixed2, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::InvalidArg, (int)err);

    TEST_ASSERT_NOT_EQUAL(POLL_HANDLE_INVALID, poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2, &err));
    TEST_ASSERT_EQUAL_INT8(POLL_HANDLE_INVALID, poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::Busy, (int)err);
    TEST_ASSERT_EQUAL_UINT8(1, poller.count());
}

void test_host_refusal_is_reported()
{
    FakeBus bus;
    ManualActivityHost host;
    host.acceptStart = false;
    ShutdownSignal shutdown;
    SensorPoller poller(bus.service(), host.service(), shutdown);
    ScriptedSensor soil("soil");
    ErrorCode err = ErrorCode::None;

    TEST_ASSERT_EQUAL_INT8(POLL_HANDLE_INVALID, poller.startPolling(&soil, "d/soil", 1000, &encodeFixed2, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::Failed, (int)err);
    TEST_ASSERT_EQUAL_UINT8(0, poller.count());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_failing_sensor_keeps_firing_and_never_publishes);
    RUN_TEST(test_fixed_value_is_published_with_two_decimals_every_tick);
    RUN_TEST(test_first_cycle_waits_one_interval);
    RUN_TEST(test_cycles_are_at_least_one_interval_apart);
    RUN_TEST(test_stop_polling_prevents_further_reads);
    RUN_TEST(test_encode_failure_skips_cycle_and_continues);
    RUN_TEST(test_publish_failure_is_logged_and_not_fatal);
    RUN_TEST(test_shutdown_ends_every_job);
    RUN_TEST(test_start_rejects_bad_arguments_and_duplicates);
    RUN_TEST(test_host_refusal_is_reported);
    return UNITY_END();
}
