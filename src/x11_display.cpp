#include "x11_display.hpp"
#include "cursor_overlay.hpp"
#include "lib/errors.hpp"
#include "log.hpp"
#include <X11/Xatom.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xfixes.h>
#include <string>

// Xlib reports protocol errors asynchronously through a global handler;
//  the default one calls exit(), which would leave the screen frozen
static int pending_x_error = Success;
static std::string pending_x_error_text{};

static int x_error_handler(Display *dpy, XErrorEvent *ev)
{
    char text[256];
    XGetErrorText(dpy, ev->error_code, text, sizeof(text));
    logger->debug("X error: {} (request {}.{}, resource 0x{:x})",
                  text,
                  ev->request_code,
                  ev->minor_code,
                  ev->resourceid);
    // keep the first error, later ones are usually its consequences
    if (pending_x_error == Success) {
        pending_x_error = ev->error_code;
        pending_x_error_text = text;
    }
    return 0;
}

std::unique_ptr<XDisplay> XDisplay::connect(const std::optional<std::string> &display_name,
                                            bool show_cursor)
{
    Display *dpy = XOpenDisplay(display_name ? display_name->c_str() : nullptr);
    if (!dpy) {
        throw DisplayConnectError("Cannot open X display `" +
                                  std::string(XDisplayName(display_name ? display_name->c_str()
                                                                        : nullptr)) +
                                  "`");
    }
    XSetErrorHandler(x_error_handler);
    logger->debug("Connected to X display `{}`", DisplayString(dpy));

    if (show_cursor) {
        int event_base, error_base;
        int major = 2, minor = 0;
        if (!XFixesQueryExtension(dpy, &event_base, &error_base) ||
            !XFixesQueryVersion(dpy, &major, &minor) || major < 2) {
            logger->warn("XFixes >= 2 is not available, the cursor will not be shown");
            show_cursor = false;
        }
    }
    return std::make_unique<XDisplay>(dpy, show_cursor);
}

XDisplay::XDisplay(Display *dpy, bool show_cursor)
    : dpy(dpy)
    , show_cursor(show_cursor)
{}

XDisplay::~XDisplay()
{
    if (freeze_window) {
        // the connection is going away, the server destroys the window with it anyway
        logger->warn("Closing X display connection while the screen is frozen");
    }
    XCloseDisplay(dpy);
}

void XDisplay::sync_and_check(const char *what, bool on_release)
{
    XSync(dpy, False);
    if (pending_x_error == Success) return;

    std::string msg = std::string(what) + ": " + pending_x_error_text;
    pending_x_error = Success;
    pending_x_error_text.clear();
    if (on_release) {
        throw ReleaseError(msg);
    }
    throw FreezeError(msg);
}

void XDisplay::overlay_cursor(XImage *image)
{
    if (image->bits_per_pixel != 32 || image->red_mask != 0xff0000 ||
        image->green_mask != 0xff00 || image->blue_mask != 0xff) {
        logger->warn("Unsupported pixel format ({} bpp), the cursor will not be shown",
                     image->bits_per_pixel);
        return;
    }

    XFixesCursorImage *cursor = XFixesGetCursorImage(dpy);
    if (!cursor) {
        logger->warn("Failed to get the cursor image");
        return;
    }

    FrameView frame{ reinterpret_cast<uint32_t *>(image->data),
                     image->width,
                     image->height,
                     image->bytes_per_line / 4 };
    CursorSprite sprite{ cursor->x,     cursor->y,     cursor->xhot,  cursor->yhot,
                         cursor->width, cursor->height, cursor->pixels };
    blend_cursor(frame, sprite);
    logger->debug("Cursor blended at {}x{}", cursor->x, cursor->y);
    XFree(cursor);
}

void XDisplay::suspend()
{
    if (freeze_window) {
        throw FreezeError("Display is already frozen");
    }

    const int screen = DefaultScreen(dpy);
    const Window root = RootWindow(dpy, screen);
    const unsigned width = DisplayWidth(dpy, screen);
    const unsigned height = DisplayHeight(dpy, screen);
    const int depth = DefaultDepth(dpy, screen);

    XImage *image = XGetImage(dpy, root, 0, 0, width, height, AllPlanes, ZPixmap);
    if (!image) {
        pending_x_error = Success;
        throw FreezeError("Failed to capture the root window");
    }
    if (show_cursor) {
        overlay_cursor(image);
    }

    Pixmap pixmap = XCreatePixmap(dpy, root, width, height, depth);
    GC gc = XCreateGC(dpy, pixmap, 0, nullptr);
    XPutImage(dpy, pixmap, gc, image, 0, 0, 0, 0, width, height);
    XFreeGC(dpy, gc);
    XDestroyImage(image);

    XSetWindowAttributes attrs{};
    attrs.override_redirect = True;
    attrs.background_pixmap = pixmap;
    attrs.event_mask = StructureNotifyMask;
    freeze_window = XCreateWindow(dpy,
                                  root,
                                  0,
                                  0,
                                  width,
                                  height,
                                  0,
                                  depth,
                                  InputOutput,
                                  DefaultVisual(dpy, screen),
                                  CWOverrideRedirect | CWBackPixmap | CWEventMask,
                                  &attrs);
    // the window holds its own reference to the background
    XFreePixmap(dpy, pixmap);

    XStoreName(dpy, freeze_window, "xfreeze");
    XClassHint class_hint{ const_cast<char *>("xfreeze"), const_cast<char *>("xfreeze") };
    XSetClassHint(dpy, freeze_window, &class_hint);

    // ask compositors to unredirect the window, so that it's shown without any effects
    Atom bypass = XInternAtom(dpy, "_NET_WM_BYPASS_COMPOSITOR", False);
    unsigned long bypass_on = 1;
    XChangeProperty(dpy,
                    freeze_window,
                    bypass,
                    XA_CARDINAL,
                    32,
                    PropModeReplace,
                    reinterpret_cast<unsigned char *>(&bypass_on),
                    1);

    XMapRaised(dpy, freeze_window);
    try {
        sync_and_check("Failed to create the freeze window", false);
    } catch (const FreezeError &) {
        XDestroyWindow(dpy, freeze_window);
        freeze_window = 0;
        XSync(dpy, False);
        pending_x_error = Success;
        throw;
    }

    // input focus can only be set on a viewable window
    XEvent ev;
    do {
        XWindowEvent(dpy, freeze_window, StructureNotifyMask, &ev);
    } while (ev.type != MapNotify);
    XSetInputFocus(dpy, freeze_window, RevertToParent, CurrentTime);
    XSync(dpy, False);
    if (pending_x_error != Success) {
        // not fatal, the screen is frozen already
        logger->debug("Failed to focus the freeze window: {}", pending_x_error_text);
        pending_x_error = Success;
    }

    logger->debug("Freeze window 0x{:x} mapped ({}x{})", freeze_window, width, height);
}

void XDisplay::resume()
{
    if (!freeze_window) return;

    const Window window = freeze_window;
    freeze_window = 0;
    XUnmapWindow(dpy, window);
    XDestroyWindow(dpy, window);
    sync_and_check("Failed to destroy the freeze window", true);
}
