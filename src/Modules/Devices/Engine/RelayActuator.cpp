/**
 * @file RelayActuator.cpp
 * @brief Implementation file.
 */

#include "RelayActuator.h"
#include <ctype.h>
#include <string.h>

namespace {

bool tokenIs(const char* s, size_t len, const char* word)
{
    if (strlen(word) != len) return false;
    for (size_t i = 0; i < len; ++i) {
        if (tolower((unsigned char)s[i]) != word[i]) return false;
    }
    return true;
}

}  // namespace

bool RelayActuator::parseState(const char* payload, size_t len, bool& on)
{
    if (!payload) return false;

    size_t start = 0;
    while (start < len && isspace((unsigned char)payload[start])) ++start;
    size_t end = len;
    while (end > start && isspace((unsigned char)payload[end - 1])) --end;

    const char* s = payload + start;
    const size_t n = end - start;

    if (tokenIs(s, n, "on") || tokenIs(s, n, "1") || tokenIs(s, n, "true")) {
        on = true;
        return true;
    }
    if (tokenIs(s, n, "off") || tokenIs(s, n, "0") || tokenIs(s, n, "false")) {
        on = false;
        return true;
    }
    return false;
}

ErrorCode RelayActuator::begin()
{
    if (!pin_) return ErrorCode::InvalidArg;
    if (!pin_->begin()) return ErrorCode::InitFailed;
    if (!pin_->write(false)) return ErrorCode::IoError;
    on_ = false;
    return ErrorCode::None;
}

ErrorCode RelayActuator::handleMessage(const char* payload, size_t len)
{
    bool want = false;
    if (!parseState(payload, len, want)) return ErrorCode::InvalidArg;
    if (!pin_) return ErrorCode::NotReady;
    if (!pin_->write(want)) return ErrorCode::IoError;
    on_ = want;
    return ErrorCode::None;
}
