#pragma once

#include "display.hpp"
#include <memory>
#include <optional>
#include <string>

// Xlib defines `Display` and a pile of macros, keep it out of the header
struct _XDisplay;
struct _XImage;

/**
 * DisplayConnection to an X server.
 *
 * Freezing takes a snapshot of the root window and shows it in an
 * override-redirect window covering the whole screen, stacked above
 * everything else. Whatever is drawn underneath stays hidden until
 * `resume()` destroys the window.
 */
class XDisplay : public DisplayConnection
{
public:
    /**
     * Opens a connection to the X server.
     *
     * @param display_name - X display name (e.g. ":0"), $DISPLAY if empty
     * @param show_cursor - blend the mouse cursor into the frozen image; requires XFixes
     * @throws DisplayConnectError if the server cannot be reached
     */
    static std::unique_ptr<XDisplay> connect(const std::optional<std::string> &display_name,
                                             bool show_cursor);

    /** Takes ownership of an already opened connection. */
    XDisplay(_XDisplay *dpy, bool show_cursor);
    ~XDisplay() override;

    XDisplay(const XDisplay &) = delete;
    XDisplay &operator=(const XDisplay &) = delete;

    void suspend() override;
    void resume() override;

private:
    _XDisplay *dpy;
    bool show_cursor;
    /** Window showing the frozen frame, 0 when not frozen. */
    unsigned long freeze_window = 0;

    void overlay_cursor(_XImage *image);
    void sync_and_check(const char *what, bool on_release);
};
