/**
 * @file TerminationLatch.cpp
 * @brief Implementation file.
 */
#include "TerminationLatch.h"
#include <ctype.h>
#include <string.h>

static bool payloadIs(const char* payload, size_t len, const char* word)
{
    while (len > 0 && isspace((unsigned char)payload[0])) { ++payload; --len; }
    while (len > 0 && isspace((unsigned char)payload[len - 1])) --len;
    const size_t wlen = strlen(word);
    if (len != wlen) return false;
    for (size_t i = 0; i < len; ++i) {
        if (tolower((unsigned char)payload[i]) != word[i]) return false;
    }
    return true;
}

bool TerminationLatch::request(TerminationRequest req)
{
    TerminationRequest prev = pending_.load();
    while ((uint8_t)req > (uint8_t)prev) {
        if (pending_.compare_exchange_weak(prev, req)) return true;
    }
    return false;
}

TerminationRequest TerminationLatch::parse(const char* payload, size_t len)
{
    if (!payload) return TerminationRequest::None;
    if (payloadIs(payload, len, "stop")) return TerminationRequest::Stop;
    if (payloadIs(payload, len, "restart")) return TerminationRequest::Restart;
    return TerminationRequest::None;
}
