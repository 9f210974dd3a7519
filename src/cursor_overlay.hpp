#pragma once

#include <cstdint>

/**
 * A 32 bits per pixel frame in the server's native XRGB layout
 * (0x00RRGGBB in each pixel, alpha byte ignored).
 * Does not own the pixel memory.
 */
struct FrameView
{
    uint32_t *data;
    int width;
    int height;
    /** Distance between the starts of two consecutive rows, in pixels. */
    int stride;
};

/**
 * Cursor image as reported by XFixes: `pixels` holds `width * height` premultiplied
 * ARGB values, one per `unsigned long` (only the low 32 bits are used).
 * (x, y) is the pointer position, the hotspot is the sprite pixel placed there.
 */
struct CursorSprite
{
    int x, y;
    int xhot, yhot;
    int width, height;
    const unsigned long *pixels;
};

/**
 * Alpha-blends the cursor sprite into the frame. Parts of the sprite outside
 * of the frame are skipped.
 */
void blend_cursor(FrameView frame, const CursorSprite &cursor);
