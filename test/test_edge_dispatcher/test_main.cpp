#include <unity.h>

#include "Core/ShutdownSignal.h"
#include "Modules/Devices/Mock/MockDevices.h"
#include "Modules/StationModule/EdgeDispatcher.h"
#include "support/FakeBus.h"
#include "support/LogCapture.h"

namespace {
LogCapture logs;
}

void setUp() { logs.install(); }
void tearDown() { logs.uninstall(); }

void test_each_rising_edge_publishes_once_in_order()
{
    FakeBus bus;
    ShutdownSignal shutdown;
    EdgeDispatcher dispatcher(bus.service(), shutdown);
    MockButton on("on");
    MockButton off("off");

    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)dispatcher.attach(&on, "d/on", "on"));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)dispatcher.attach(&off, "d/off", "off"));

    const int n = 25;
    for (int i = 0; i < n; ++i) {
        if (i % 3 == 2) off.inject(EdgeType::Rising);
        else on.inject(EdgeType::Rising);
    }

    TEST_ASSERT_EQUAL_UINT32((uint32_t)n, (uint32_t)bus.published.size());
    for (int i = 0; i < n; ++i) {
        const FakeBusMessage& m = bus.published[(size_t)i];
        if (i % 3 == 2) {
            TEST_ASSERT_EQUAL_STRING("d/off", m.topic.c_str());
            TEST_ASSERT_EQUAL_STRING("off", m.payload.c_str());
        } else {
            TEST_ASSERT_EQUAL_STRING("d/on", m.topic.c_str());
            TEST_ASSERT_EQUAL_STRING("on", m.payload.c_str());
        }
    }
    TEST_ASSERT_EQUAL_UINT32((uint32_t)n, dispatcher.published());
}

void test_falling_edges_are_ignored()
{
    FakeBus bus;
    ShutdownSignal shutdown;
    EdgeDispatcher dispatcher(bus.service(), shutdown);
    MockButton on("on");
    dispatcher.attach(&on, "d/on", "on");

    on.inject(EdgeType::Falling);
    on.inject(EdgeType::Rising);
    on.inject(EdgeType::Falling);

    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)bus.published.size());
}

void test_publish_failure_is_logged_and_next_edge_still_publishes()
{
    FakeBus bus;
    ShutdownSignal shutdown;
    EdgeDispatcher dispatcher(bus.service(), shutdown);
    MockButton on("on");
    dispatcher.attach(&on, "d/on", "on");

    bus.publishResult = false;
    on.inject(EdgeType::Rising);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)logs.count(LogLevel::Warn, "on publish failed topic=d/on: PublishFailed"));
    TEST_ASSERT_EQUAL_UINT32(1, dispatcher.failures());

    bus.publishResult = true;
    on.inject(EdgeType::Rising);
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)bus.published.size());
}

void test_detach_removes_handlers()
{
    FakeBus bus;
    ShutdownSignal shutdown;
    EdgeDispatcher dispatcher(bus.service(), shutdown);
    MockButton on("on");
    dispatcher.attach(&on, "d/on", "on");
    TEST_ASSERT_EQUAL_UINT8(1, on.handlerCount());

    dispatcher.detachAll();
    TEST_ASSERT_EQUAL_UINT8(0, on.handlerCount());

    on.inject(EdgeType::Rising);
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)bus.published.size());

    // Second detach is harmless.
    dispatcher.detachAll();
}

void test_edges_after_shutdown_publish_nothing()
{
    FakeBus bus;
    ShutdownSignal shutdown;
    EdgeDispatcher dispatcher(bus.service(), shutdown);
    MockButton on("on");
    dispatcher.attach(&on, "d/on", "on");

    on.inject(EdgeType::Rising);
    shutdown.trigger();
    on.inject(EdgeType::Rising);
    on.inject(EdgeType::Rising);

    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)bus.published.size());
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::NotReady, (int)dispatcher.attach(&on, "d/on", "on"));
}

void test_attach_reports_exhausted_driver_slots()
{
    FakeBus bus;
    ShutdownSignal shutdown;
    EdgeDispatcher dispatcher(bus.service(), shutdown);
    MockButton on("on");

    EdgeSubscription sub;
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)dispatcher.attach(&on, "d/on", "on", &sub));
    TEST_ASSERT_EQUAL_PTR(&on, sub.input);
    TEST_ASSERT_TRUE(sub.handlerId >= 0);

    for (uint8_t i = 1; i < Limits::MaxEdgeHandlers; ++i) {
        TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)dispatcher.attach(&on, "d/on", "on"));
    }
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::Full, (int)dispatcher.attach(&on, "d/on", "on"));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::InvalidArg, (int)dispatcher.attach(nullptr, "d/on", "on"));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_each_rising_edge_publishes_once_in_order);
    RUN_TEST(test_falling_edges_are_ignored);
    RUN_TEST(test_publish_failure_is_logged_and_next_edge_still_publishes);
    RUN_TEST(test_detach_removes_handlers);
    RUN_TEST(test_edges_after_shutdown_publish_nothing);
    RUN_TEST(test_attach_reports_exhausted_driver_slots);
    return UNITY_END();
}
