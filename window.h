#ifndef CHIPVM_WINDOW_H
#define CHIPVM_WINDOW_H

#include <array>
#include <vector>
#include <string>
#include <cstdint>
#include <optional>

#include <MiniFB.h>

#include "framebuffer.h"

typedef std::array<uint8_t, 3> vec3ub;

vec3ub vec3ubFromInts(int r, int g, int b);

// Host display and keyboard.  Presents the pixel grid magnified and maps the
// left-hand block of the PC keyboard onto the 16 keys.
struct Window
{
    std::array<vec3ub, 2> colorTable;
    std::array<bool, 16> keyPressed;
    bool closed = false;

    bool succeeded = false;

    mfb_window *window;
    int windowWidth;
    int windowHeight;
    std::vector<uint32_t> windowBuffer;

    Window(const std::string& name, int scale);
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool present(const PixelGrid& display);
    bool pollEvents();
    std::optional<uint8_t> heldKey() const;

    void resize(int width, int height);
    void keyboard(mfb_key key, mfb_key_mod mod, bool isPressed);

    static void resizecb(mfb_window *window, int width, int height);
    static void keyboardcb(mfb_window *window, mfb_key key, mfb_key_mod mod, bool isPressed);
};

#endif // CHIPVM_WINDOW_H
