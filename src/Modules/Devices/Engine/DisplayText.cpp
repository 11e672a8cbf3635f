/**
 * @file DisplayText.cpp
 * @brief Implementation file.
 */

#include "DisplayText.h"

bool layoutDisplayText(const char* payload, size_t len, uint8_t cols, uint8_t rows, DisplayText& out)
{
    out = DisplayText{};
    if (cols == 0 || rows == 0) return false;
    if (cols > DISPLAY_TEXT_MAX_COLS || rows > DISPLAY_TEXT_MAX_ROWS) return false;
    if (!payload && len > 0) return false;

    out.rows = rows;
    uint8_t row = 0;
    uint8_t col = 0;

    for (size_t i = 0; i < len && row < rows; ++i) {
        const char c = payload[i];
        if (c == '\r') continue;
        if (c == '\n') {
            ++row;
            col = 0;
            continue;
        }
        if ((unsigned char)c < 0x20 || (unsigned char)c > 0x7E) continue;
        if (col >= cols) {
            ++row;
            col = 0;
            if (row >= rows) break;
        }
        out.line[row][col++] = c;
    }
    return true;
}
