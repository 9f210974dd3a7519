#pragma once

/**
 * An open connection to a display server which can stop showing screen updates.
 *
 * The only implementation talking to a real server is XDisplay (x11_display.hpp);
 * tests inject a recording fake. Lifetime of the object is the lifetime of
 * the connection.
 */
class DisplayConnection
{
public:
    virtual ~DisplayConnection() = default;

    /**
     * Freezes the screen contents as they are now.
     * Throws FreezeError if the server rejects the request.
     */
    virtual void suspend() = 0;

    /**
     * Shows live screen contents again.
     * Throws ReleaseError if the server rejects the request.
     */
    virtual void resume() = 0;
};
