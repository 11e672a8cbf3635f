#include <unity.h>
#include <math.h>
#include <string.h>

#include "Modules/StationModule/ReadingCodec.h"

void setUp() {}
void tearDown() {}

static SensorSample scalar(float v)
{
    SensorSample s;
    s.type = SampleType::Scalar;
    s.value = v;
    return s;
}

void test_fixed2_pads_to_five_characters()
{
    char out[16];
    size_t len = 0;
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)encodeFixed2(scalar(0.42f), out, sizeof(out), len));
    TEST_ASSERT_EQUAL_STRING(" 0.42", out);
    TEST_ASSERT_EQUAL_UINT32(5, (uint32_t)len);
}

void test_fixed2_rounds_and_grows_past_width()
{
    char out[16];
    size_t len = 0;
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)encodeFixed2(scalar(2.0f), out, sizeof(out), len));
    TEST_ASSERT_EQUAL_STRING(" 2.00", out);
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)encodeFixed2(scalar(123.456f), out, sizeof(out), len));
    TEST_ASSERT_EQUAL_STRING("123.46", out);
    TEST_ASSERT_EQUAL_UINT32(6, (uint32_t)len);
}

void test_fixed2_rejects_non_finite_and_wrong_type()
{
    char out[16];
    size_t len = 0;
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EncodeFailed, (int)encodeFixed2(scalar(NAN), out, sizeof(out), len));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EncodeFailed, (int)encodeFixed2(scalar(INFINITY), out, sizeof(out), len));

    SensorSample env;
    env.type = SampleType::Environment;
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EncodeFailed, (int)encodeFixed2(env, out, sizeof(out), len));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)len);
}

void test_fixed2_rejects_short_buffer()
{
    char out[4];
    size_t len = 0;
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EncodeFailed, (int)encodeFixed2(scalar(0.42f), out, sizeof(out), len));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::InvalidArg, (int)encodeFixed2(scalar(0.42f), nullptr, 0, len));
}

void test_env_document_has_three_fields()
{
    SensorSample s;
    s.type = SampleType::Environment;
    s.env.temperatureC = 21.5f;
    s.env.humidityPct = 48.0f;
    s.env.pressureHpa = 1013.25f;

    char out[128];
    size_t len = 0;
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::None, (int)encodeEnvJson(s, out, sizeof(out), len));
    TEST_ASSERT_EQUAL_STRING("{\"temperature\":21.5,\"humidity\":48,\"pressure\":1013.25}", out);
    TEST_ASSERT_EQUAL_UINT32((uint32_t)strlen(out), (uint32_t)len);
}

void test_env_rejects_missing_values_and_small_buffer()
{
    SensorSample s;
    s.type = SampleType::Environment;
    s.env.temperatureC = NAN;
    s.env.humidityPct = 40.0f;
    s.env.pressureHpa = 1000.0f;

    char out[128];
    size_t len = 0;
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EncodeFailed, (int)encodeEnvJson(s, out, sizeof(out), len));

    s.env.temperatureC = 20.0f;
    char tiny[16];
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EncodeFailed, (int)encodeEnvJson(s, tiny, sizeof(tiny), len));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EncodeFailed, (int)encodeEnvJson(scalar(1.0f), out, sizeof(out), len));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_fixed2_pads_to_five_characters);
    RUN_TEST(test_fixed2_rounds_and_grows_past_width);
    RUN_TEST(test_fixed2_rejects_non_finite_and_wrong_type);
    RUN_TEST(test_fixed2_rejects_short_buffer);
    RUN_TEST(test_env_document_has_three_fields);
    RUN_TEST(test_env_rejects_missing_values_and_small_buffer);
    return UNITY_END();
}
