#pragma once
/**
 * @file DisplayText.h
 * @brief Layout of a `c/lcd` payload on a character display.
 */

#include <stddef.h>
#include <stdint.h>

constexpr uint8_t DISPLAY_TEXT_MAX_ROWS = 4;
constexpr uint8_t DISPLAY_TEXT_MAX_COLS = 20;

struct DisplayText {
    uint8_t rows = 0;
    char line[DISPLAY_TEXT_MAX_ROWS][DISPLAY_TEXT_MAX_COLS + 1] = {};
};

/**
 * @brief Split a payload into display lines.
 *
 * A newline starts the next row; text longer than a row wraps. Non printable
 * bytes are dropped. Text beyond the last row is discarded.
 */
bool layoutDisplayText(const char* payload, size_t len, uint8_t cols, uint8_t rows, DisplayText& out);
