#include <unity.h>
#include <string.h>

#include "Modules/StationModule/TerminationLatch.h"

void setUp() {}
void tearDown() {}

void test_restart_may_follow_stop()
{
    TerminationLatch latch;
    TEST_ASSERT_TRUE(latch.pending() == TerminationRequest::None);

    TEST_ASSERT_TRUE(latch.request(TerminationRequest::Stop));
    TEST_ASSERT_TRUE(latch.pending() == TerminationRequest::Stop);

    TEST_ASSERT_TRUE(latch.request(TerminationRequest::Restart));
    TEST_ASSERT_TRUE(latch.pending() == TerminationRequest::Restart);
}

void test_late_stop_never_downgrades_restart()
{
    TerminationLatch latch;
    TEST_ASSERT_TRUE(latch.request(TerminationRequest::Restart));

    TEST_ASSERT_FALSE(latch.request(TerminationRequest::Stop));
    TEST_ASSERT_FALSE(latch.request(TerminationRequest::Restart));
    TEST_ASSERT_FALSE(latch.request(TerminationRequest::None));
    TEST_ASSERT_TRUE(latch.pending() == TerminationRequest::Restart);
}

void test_repeated_stop_is_a_no_op()
{
    TerminationLatch latch;
    TEST_ASSERT_TRUE(latch.request(TerminationRequest::Stop));
    TEST_ASSERT_FALSE(latch.request(TerminationRequest::Stop));
    TEST_ASSERT_TRUE(latch.pending() == TerminationRequest::Stop);
}

void test_system_payloads_are_parsed_loosely()
{
    const char* stop = "  STOP\r\n";
    const char* restart = "Restart";
    const char* other = "reboot";

    TEST_ASSERT_TRUE(TerminationLatch::parse(stop, strlen(stop)) == TerminationRequest::Stop);
    TEST_ASSERT_TRUE(TerminationLatch::parse(restart, strlen(restart)) == TerminationRequest::Restart);
    TEST_ASSERT_TRUE(TerminationLatch::parse(other, strlen(other)) == TerminationRequest::None);
    TEST_ASSERT_TRUE(TerminationLatch::parse("stopped", 4) == TerminationRequest::Stop);
    TEST_ASSERT_TRUE(TerminationLatch::parse(nullptr, 0) == TerminationRequest::None);
    TEST_ASSERT_TRUE(TerminationLatch::parse("", 0) == TerminationRequest::None);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_restart_may_follow_stop);
    RUN_TEST(test_late_stop_never_downgrades_restart);
    RUN_TEST(test_repeated_stop_is_a_no_op);
    RUN_TEST(test_system_payloads_are_parsed_loosely);
    return UNITY_END();
}
