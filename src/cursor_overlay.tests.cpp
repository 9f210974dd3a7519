#include <acutest.h>

#include "cursor_overlay.hpp"
#include <vector>

static const uint32_t BACKGROUND = 0x000000ff;
static const uint32_t PADDING = 0xdeadbeef;

struct TestFrame
{
    // 4x3 frame with 2 padding pixels at the end of each row
    std::vector<uint32_t> pixels = std::vector<uint32_t>(6 * 3, BACKGROUND);

    TestFrame()
    {
        for (int y = 0; y < 3; y++) {
            pixels[y * 6 + 4] = PADDING;
            pixels[y * 6 + 5] = PADDING;
        }
    }

    FrameView view() { return FrameView{ pixels.data(), 4, 3, 6 }; }
    uint32_t at(int x, int y) const { return pixels[y * 6 + x]; }
};

static void opaque_cursor_replaces_pixels()
{
    TestFrame frame;
    const unsigned long sprite[] = { 0xffff0000, 0x00000000, 0xff00ff00, 0xffffffff };
    blend_cursor(frame.view(), CursorSprite{ 1, 1, 0, 0, 2, 2, sprite });

    TEST_CHECK(frame.at(1, 1) == 0x00ff0000);
    TEST_CHECK(frame.at(2, 1) == BACKGROUND); // fully transparent
    TEST_CHECK(frame.at(1, 2) == 0x0000ff00);
    TEST_CHECK(frame.at(2, 2) == 0x00ffffff);
    TEST_CHECK(frame.at(0, 0) == BACKGROUND);
}

static void translucent_cursor_is_blended()
{
    TestFrame frame;
    // 50% red, premultiplied
    const unsigned long sprite[] = { 0x80800000 };
    blend_cursor(frame.view(), CursorSprite{ 0, 0, 0, 0, 1, 1, sprite });

    TEST_CHECK(frame.at(0, 0) == 0x0080007f);
    TEST_MSG("got 0x%08x", frame.at(0, 0));
}

static void hotspot_shifts_sprite()
{
    TestFrame frame;
    const unsigned long sprite[] = { 0x00000000, 0x00000000, 0x00000000, 0xff112233 };
    // hotspot is the bottom-right sprite pixel, placed at the pointer position
    blend_cursor(frame.view(), CursorSprite{ 2, 1, 1, 1, 2, 2, sprite });

    TEST_CHECK(frame.at(2, 1) == 0x00112233);
    TEST_CHECK(frame.at(1, 0) == BACKGROUND);
}

static void clipped_at_frame_edges()
{
    TestFrame frame;
    std::vector<unsigned long> sprite(4 * 4, 0xff00ff00);

    blend_cursor(frame.view(), CursorSprite{ 2, 1, 0, 0, 4, 4, sprite.data() });
    blend_cursor(frame.view(), CursorSprite{ -3, -3, 0, 0, 4, 4, sprite.data() });

    TEST_CHECK(frame.at(0, 0) == 0x0000ff00);
    TEST_CHECK(frame.at(1, 0) == BACKGROUND);
    TEST_CHECK(frame.at(3, 2) == 0x0000ff00);
    for (int y = 0; y < 3; y++) {
        TEST_CHECK(frame.pixels[y * 6 + 4] == PADDING);
        TEST_CHECK(frame.pixels[y * 6 + 5] == PADDING);
    }
}

static void cursor_outside_of_frame()
{
    TestFrame frame;
    const unsigned long sprite[] = { 0xffffffff };
    blend_cursor(frame.view(), CursorSprite{ 10, 10, 0, 0, 1, 1, sprite });
    blend_cursor(frame.view(), CursorSprite{ -1, 0, 0, 0, 1, 1, sprite });

    for (int y = 0; y < 3; y++) {
        for (int x = 0; x < 4; x++) {
            TEST_CHECK(frame.at(x, y) == BACKGROUND);
        }
    }
}

TEST_LIST = {
    { "opaque cursor replaces pixels", opaque_cursor_replaces_pixels },
    { "translucent cursor is blended", translucent_cursor_is_blended },
    { "hotspot shifts sprite", hotspot_shifts_sprite },
    { "clipped at frame edges", clipped_at_frame_edges },
    { "cursor outside of frame", cursor_outside_of_frame },
    { 0 }
};
