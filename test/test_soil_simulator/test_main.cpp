#include <unity.h>

#include "Core/ShutdownSignal.h"
#include "Modules/Devices/Mock/MockDevices.h"
#include "Modules/StationModule/SoilSimulator.h"
#include "support/LogCapture.h"
#include "support/ManualActivityHost.h"

namespace {

class StuckPin : public IAnalogPinDriver {
public:
    const char* id() const override { return "stuck"; }
    bool begin() override { return true; }
    bool read(float& volts) const override
    {
        volts = 1.0f;
        return true;
    }
    bool write(float) override
    {
        ++writes;
        return false;
    }
    int writes = 0;
};

LogCapture logs;

}  // namespace

void setUp() { logs.install(); }
void tearDown() { logs.uninstall(); }

void test_value_drifts_by_delta_each_tick()
{
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SoilSimulator sim(host.service(), shutdown);
    const float v0 = 0.25f;
    const float delta = 0.02f;
    SyntheticAnalogPin pin("soil", v0);

    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)sim.startSimulation(&pin, 5000, delta));

    const uint32_t k = 37;
    host.runUntil(k * 5000, 500);

    float v = 0.0f;
    TEST_ASSERT_TRUE(pin.read(v));
    TEST_ASSERT_EQUAL_UINT32(k, sim.job(0)->ticks());
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, v0 + (float)k * delta, v);
}

void test_no_tick_before_first_interval()
{
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SoilSimulator sim(host.service(), shutdown);
    SyntheticAnalogPin pin("soil", 0.0f);

    sim.startSimulation(&pin, 5000, 0.02f);
    host.runUntil(4900);

    float v = -1.0f;
    pin.read(v);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, v);
}

void test_second_simulation_for_same_pin_is_rejected()
{
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SoilSimulator sim(host.service(), shutdown);
    SyntheticAnalogPin pin("soil", 0.0f);
    SyntheticAnalogPin other("other", 0.0f);

    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)sim.startSimulation(&pin, 1000, 0.1f));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::Busy, (int)sim.startSimulation(&pin, 1000, 0.1f));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)sim.startSimulation(&other, 1000, 0.1f));
    TEST_ASSERT_EQUAL_UINT8(2, sim.count());

    host.runUntil(3000);
    float v = 0.0f;
    pin.read(v);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.3f, v);
}

void test_simulation_exits_on_shutdown()
{
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SoilSimulator sim(host.service(), shutdown);
    SyntheticAnalogPin pin("soil", 0.0f);

    sim.startSimulation(&pin, 1000, 0.5f);
    host.runUntil(2000);
    shutdown.trigger();
    host.runUntil(10000);

    float v = 0.0f;
    pin.read(v);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 1.0f, v);
    TEST_ASSERT_EQUAL_UINT8(0, host.running());
    TEST_ASSERT_FALSE(sim.job(0)->isRunning());
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::NotReady, (int)sim.startSimulation(&pin, 1000, 0.5f));
}

void test_write_failure_is_logged_and_loop_continues()
{
    ManualActivityHost host;
    ShutdownSignal shutdown;
    SoilSimulator sim(host.service(), shutdown);
    StuckPin pin;

    sim.startSimulation(&pin, 1000, 0.5f);
    host.runUntil(4000);

    TEST_ASSERT_EQUAL_INT(4, pin.writes);
    TEST_ASSERT_EQUAL_UINT32(4, (uint32_t)logs.count(LogLevel::Warn, "stuck synthetic write failed"));
    TEST_ASSERT_EQUAL_UINT8(1, host.running());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_value_drifts_by_delta_each_tick);
    RUN_TEST(test_no_tick_before_first_interval);
    RUN_TEST(test_second_simulation_for_same_pin_is_rejected);
    RUN_TEST(test_simulation_exits_on_shutdown);
    RUN_TEST(test_write_failure_is_logged_and_loop_continues);
    return UNITY_END();
}
