#include "cursor_overlay.hpp"
#include <algorithm>

static uint32_t blend_channel(uint32_t dst, uint32_t src, uint32_t alpha)
{
    // XFixes cursor pixels are premultiplied
    return src + (dst * (255 - alpha) + 127) / 255;
}

void blend_cursor(FrameView frame, const CursorSprite &cursor)
{
    const int left = cursor.x - cursor.xhot;
    const int top = cursor.y - cursor.yhot;

    const int x_begin = std::max(0, left);
    const int y_begin = std::max(0, top);
    const int x_end = std::min(frame.width, left + cursor.width);
    const int y_end = std::min(frame.height, top + cursor.height);

    for (int y = y_begin; y < y_end; y++) {
        uint32_t *row = frame.data + static_cast<long>(y) * frame.stride;
        const unsigned long *cursor_row = cursor.pixels + static_cast<long>(y - top) * cursor.width;

        for (int x = x_begin; x < x_end; x++) {
            auto src = static_cast<uint32_t>(cursor_row[x - left] & 0xffffffffUL);
            uint32_t alpha = src >> 24;
            if (alpha == 0) continue;

            uint32_t dst = row[x];
            uint32_t r = blend_channel((dst >> 16) & 0xff, (src >> 16) & 0xff, alpha);
            uint32_t g = blend_channel((dst >> 8) & 0xff, (src >> 8) & 0xff, alpha);
            uint32_t b = blend_channel(dst & 0xff, src & 0xff, alpha);
            row[x] = (dst & 0xff000000) | (std::min(r, 255u) << 16) | (std::min(g, 255u) << 8) |
                     std::min(b, 255u);
        }
    }
}
