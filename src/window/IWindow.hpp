#pragma once

#include <string>

namespace snarp {

struct InputState {
    int mouseX = 0;
    int mouseY = 0;
    bool mouseLeft = false;
    bool mouseRight = false;
    bool keyEscape = false;
    bool keyQ = false;
};

struct WindowConfig {
    int width = 0;
    int height = 0;
    int x = 0;
    int y = 0;
    // Bypass the window manager and grab pointer and keyboard, as a
    // selection overlay must.
    bool overlay = true;
    std::string title = "snarp";
};

class IWindow {
public:
    virtual ~IWindow() = default;
    virtual void pollEvents() = 0;
    virtual bool shouldClose() const = 0;
    virtual InputState input() const = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual void swap() = 0;
};

}  // namespace snarp
