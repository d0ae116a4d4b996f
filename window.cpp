#include <cstdio>

#include "window.h"
#include "debug.h"

vec3ub vec3ubFromInts(int r, int g, int b)
{
    return { (uint8_t)r, (uint8_t)g, (uint8_t)b };
}

Window::Window(const std::string& name, int scale) :
    windowWidth(ScreenWidth * scale),
    windowHeight(ScreenHeight * scale)
{
    keyPressed.fill(false);
    colorTable[0] = {0, 0, 0};
    colorTable[1] = {255, 255, 255};
    window = mfb_open_ex(name.c_str(), windowWidth, windowHeight, WF_RESIZABLE);
    if (window) {
        windowBuffer.resize(windowWidth * windowHeight);
        mfb_set_user_data(window, (void *) this);
        mfb_set_resize_callback(window, resizecb);
        mfb_set_keyboard_callback(window, keyboardcb);
        succeeded = true;
    }
}

bool Window::present(const PixelGrid& display)
{
    if(closed) {
        return false;
    }
    for(int row = 0; row < windowHeight; row++) {
        int displayY = row * ScreenHeight / windowHeight;
        for(int col = 0; col < windowWidth; col++) {
            int displayX = col * ScreenWidth / windowWidth;
            uint8_t pixel = display.at(displayY).at(displayX);
            auto &c = colorTable.at(pixel);
            windowBuffer[col + row * windowWidth] = MFB_RGB(c[0], c[1], c[2]);
        }
    }
    int status = mfb_update_ex(window, windowBuffer.data(), windowWidth, windowHeight);
    closed = closed || (status < 0);
    return !closed;
}

bool Window::pollEvents()
{
    if(closed) {
        return false;
    }
    closed = (mfb_update_events(window) < 0);
    return !closed;
}

std::optional<uint8_t> Window::heldKey() const
{
    for(uint8_t i = 0; i < 16; i++) {
        if(keyPressed[i]) {
            return i;
        }
    }
    return std::nullopt;
}

void Window::resize(int width, int height)
{
    windowWidth = width;
    windowHeight = height;
    windowBuffer.resize(windowWidth * windowHeight);
}

void Window::resizecb(mfb_window *window, int width, int height)
{
    Window *ifc = static_cast<Window *>(mfb_get_user_data(window));
    ifc->resize(width, height);
    mfb_set_viewport(window, 0, 0, width, height);
}

void Window::keyboard(mfb_key key, mfb_key_mod mod, bool isPressed)
{
    switch(key) {
        case KB_KEY_ESCAPE:
            if(isPressed) {
                mfb_close(window);
                closed = true;
            }
            break;
        case KB_KEY_1: keyPressed[0x1] = isPressed; break;
        case KB_KEY_2: keyPressed[0x2] = isPressed; break;
        case KB_KEY_3: keyPressed[0x3] = isPressed; break;
        case KB_KEY_4: keyPressed[0xC] = isPressed; break;
        case KB_KEY_Q: keyPressed[0x4] = isPressed; break;
        case KB_KEY_W: keyPressed[0x5] = isPressed; break;
        case KB_KEY_E: keyPressed[0x6] = isPressed; break;
        case KB_KEY_R: keyPressed[0xD] = isPressed; break;
        case KB_KEY_A: keyPressed[0x7] = isPressed; break;
        case KB_KEY_S: keyPressed[0x8] = isPressed; break;
        case KB_KEY_D: keyPressed[0x9] = isPressed; break;
        case KB_KEY_F: keyPressed[0xE] = isPressed; break;
        case KB_KEY_Z: keyPressed[0xA] = isPressed; break;
        case KB_KEY_X: keyPressed[0x0] = isPressed; break;
        case KB_KEY_C: keyPressed[0xB] = isPressed; break;
        case KB_KEY_V: keyPressed[0xF] = isPressed; break;
        default: /* pass */ break;
    }
    if(debug & DEBUG_KEYS) {
        printf("host key %d %s\n", (int)key, isPressed ? "down" : "up");
    }
}

void Window::keyboardcb(mfb_window *window, mfb_key key, mfb_key_mod mod, bool isPressed)
{
    Window *ifc = static_cast<Window *>(mfb_get_user_data(window));
    ifc->keyboard(key, mod, isPressed);
}
