#include "window/X11WindowGlx.hpp"

#include <GL/gl.h>
#include <GL/glx.h>
#include <GL/glxext.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/cursorfont.h>
#include <X11/keysym.h>

#include <chrono>
#include <memory>
#include <thread>

namespace snarp {

namespace {

using CreateContextAttribsFn = GLXContext (*)(Display*, GLXFBConfig,
                                              GLXContext, Bool, const int*);

constexpr int kGrabAttempts = 20;
constexpr auto kGrabRetryDelay = std::chrono::milliseconds(50);

}  // namespace

// Undecorated window covering the desktop, with a GL 3.3 context current on
// the calling thread. Pointer and keyboard are grabbed so the selection
// gesture cannot leak to the windows underneath.
class X11WindowGlx final : public IWindow {
public:
    explicit X11WindowGlx(LogSink& log) : log_(log) {}

    ~X11WindowGlx() override {
        if (!display_) {
            return;
        }
        if (context_) {
            glXMakeCurrent(display_, None, nullptr);
            glXDestroyContext(display_, context_);
        }
        if (grabbed_) {
            XUngrabKeyboard(display_, CurrentTime);
            XUngrabPointer(display_, CurrentTime);
        }
        if (window_) {
            XDestroyWindow(display_, window_);
        }
        if (cursor_) {
            XFreeCursor(display_, cursor_);
        }
        if (colormap_) {
            XFreeColormap(display_, colormap_);
        }
        // The overlay must be off screen before anything is captured.
        XSync(display_, False);
        XCloseDisplay(display_);
    }

    bool create(const WindowConfig& config) {
        display_ = XOpenDisplay(nullptr);
        if (!display_) {
            LOG_ERROR(log_, "X11: cannot open display");
            return false;
        }
        GLXFBConfig fbConfig = nullptr;
        if (!chooseFbConfig(fbConfig) || !createWindow(config, fbConfig)) {
            return false;
        }
        if (config.overlay) {
            grabInput();
        }
        return createContext(fbConfig);
    }

    void pollEvents() override {
        while (XPending(display_)) {
            XEvent ev{};
            XNextEvent(display_, &ev);
            handleEvent(ev);
        }
    }

    bool shouldClose() const override {
        return shouldClose_;
    }
    InputState input() const override {
        return input_;
    }
    int width() const override {
        return width_;
    }
    int height() const override {
        return height_;
    }

    void swap() override {
        glXSwapBuffers(display_, window_);
    }

private:
    bool chooseFbConfig(GLXFBConfig& out) {
        const int attribs[] = {GLX_X_RENDERABLE,  True,
                               GLX_DRAWABLE_TYPE, GLX_WINDOW_BIT,
                               GLX_RENDER_TYPE,   GLX_RGBA_BIT,
                               GLX_X_VISUAL_TYPE, GLX_TRUE_COLOR,
                               GLX_RED_SIZE,      8,
                               GLX_GREEN_SIZE,    8,
                               GLX_BLUE_SIZE,     8,
                               GLX_DOUBLEBUFFER,  True,
                               None};
        int count = 0;
        GLXFBConfig* configs = glXChooseFBConfig(
            display_, DefaultScreen(display_), attribs, &count);
        if (!configs || count == 0) {
            if (configs) {
                XFree(configs);
            }
            LOG_ERROR(log_, "X11: no suitable GLX framebuffer config");
            return false;
        }
        out = configs[0];
        XFree(configs);
        return true;
    }

    bool createWindow(const WindowConfig& config, GLXFBConfig fbConfig) {
        XVisualInfo* visual = glXGetVisualFromFBConfig(display_, fbConfig);
        if (!visual) {
            LOG_ERROR(log_, "X11: no visual for framebuffer config");
            return false;
        }

        const int screen = DefaultScreen(display_);
        const Window root = RootWindow(display_, screen);
        width_ = config.width > 0 ? config.width : DisplayWidth(display_, screen);
        height_ =
            config.height > 0 ? config.height : DisplayHeight(display_, screen);

        colormap_ = XCreateColormap(display_, root, visual->visual, AllocNone);
        XSetWindowAttributes attrs{};
        attrs.colormap = colormap_;
        attrs.override_redirect = config.overlay ? True : False;
        attrs.event_mask = KeyPressMask | KeyReleaseMask | ButtonPressMask |
                           ButtonReleaseMask | PointerMotionMask |
                           StructureNotifyMask;
        window_ = XCreateWindow(
            display_, root, config.x, config.y,
            static_cast<unsigned int>(width_),
            static_cast<unsigned int>(height_), 0, visual->depth, InputOutput,
            visual->visual, CWColormap | CWEventMask | CWOverrideRedirect,
            &attrs);
        XFree(visual);
        if (!window_) {
            LOG_ERROR(log_, "X11: cannot create overlay window");
            return false;
        }

        XStoreName(display_, window_, config.title.c_str());
        wmDelete_ = XInternAtom(display_, "WM_DELETE_WINDOW", False);
        XSetWMProtocols(display_, window_, &wmDelete_, 1);

        cursor_ = XCreateFontCursor(display_, XC_crosshair);
        XDefineCursor(display_, window_, cursor_);

        XMapRaised(display_, window_);
        // Grabs fail with GrabNotViewable until the map has been processed.
        XSync(display_, False);
        return true;
    }

    bool createContext(GLXFBConfig fbConfig) {
        auto createAttribs = reinterpret_cast<CreateContextAttribsFn>(
            glXGetProcAddressARB(reinterpret_cast<const GLubyte*>(
                "glXCreateContextAttribsARB")));
        if (createAttribs) {
            const int attribs[] = {GLX_CONTEXT_MAJOR_VERSION_ARB,
                                   3,
                                   GLX_CONTEXT_MINOR_VERSION_ARB,
                                   3,
                                   GLX_CONTEXT_PROFILE_MASK_ARB,
                                   GLX_CONTEXT_CORE_PROFILE_BIT_ARB,
                                   None};
            context_ = createAttribs(display_, fbConfig, nullptr, True,
                                     attribs);
        }
        if (!context_) {
            LOG_DEBUG(log_, "X11: no core profile context, trying legacy");
            context_ = glXCreateNewContext(display_, fbConfig, GLX_RGBA_TYPE,
                                           nullptr, True);
        }
        if (!context_) {
            LOG_ERROR(log_, "X11: cannot create GLX context");
            return false;
        }
        if (!glXMakeCurrent(display_, window_, context_)) {
            LOG_ERROR(log_, "X11: cannot make GLX context current");
            return false;
        }
        return true;
    }

    // The key that launched us may still hold a grab for a moment.
    void grabInput() {
        const unsigned int pointerMask =
            ButtonPressMask | ButtonReleaseMask | PointerMotionMask;
        for (int attempt = 0; attempt < kGrabAttempts; ++attempt) {
            bool pointer =
                XGrabPointer(display_, window_, True, pointerMask,
                             GrabModeAsync, GrabModeAsync, window_, cursor_,
                             CurrentTime) == GrabSuccess;
            bool keyboard = XGrabKeyboard(display_, window_, True,
                                          GrabModeAsync, GrabModeAsync,
                                          CurrentTime) == GrabSuccess;
            if (pointer && keyboard) {
                grabbed_ = true;
                return;
            }
            if (pointer) {
                XUngrabPointer(display_, CurrentTime);
            }
            if (keyboard) {
                XUngrabKeyboard(display_, CurrentTime);
            }
            std::this_thread::sleep_for(kGrabRetryDelay);
        }
        LOG_WARN(log_, "X11: could not grab pointer and keyboard");
    }

    void setButton(unsigned int button, bool down) {
        if (button == Button1) {
            input_.mouseLeft = down;
        } else if (button == Button3) {
            input_.mouseRight = down;
        }
    }

    void handleEvent(const XEvent& ev) {
        switch (ev.type) {
            case MotionNotify:
                input_.mouseX = ev.xmotion.x;
                input_.mouseY = ev.xmotion.y;
                break;
            case ButtonPress:
            case ButtonRelease:
                input_.mouseX = ev.xbutton.x;
                input_.mouseY = ev.xbutton.y;
                setButton(ev.xbutton.button, ev.type == ButtonPress);
                break;
            case KeyPress:
            case KeyRelease: {
                XKeyEvent key = ev.xkey;
                KeySym sym = XLookupKeysym(&key, 0);
                bool down = ev.type == KeyPress;
                if (sym == XK_Escape) {
                    input_.keyEscape = down;
                } else if (sym == XK_q || sym == XK_Q) {
                    input_.keyQ = down;
                }
                break;
            }
            case ConfigureNotify:
                width_ = ev.xconfigure.width;
                height_ = ev.xconfigure.height;
                break;
            case ClientMessage:
                if (static_cast<Atom>(ev.xclient.data.l[0]) == wmDelete_) {
                    shouldClose_ = true;
                }
                break;
            default:
                break;
        }
    }

    LogSink& log_;
    Display* display_ = nullptr;
    Window window_ = 0;
    Colormap colormap_ = 0;
    Cursor cursor_ = 0;
    GLXContext context_ = nullptr;
    Atom wmDelete_ = 0;
    bool grabbed_ = false;
    bool shouldClose_ = false;

    InputState input_{};
    int width_ = 0;
    int height_ = 0;
};

std::unique_ptr<IWindow> CreateX11WindowGlx(const WindowConfig& config,
                                            LogSink& log) {
    auto window = std::make_unique<X11WindowGlx>(log);
    if (!window->create(config)) {
        return nullptr;
    }
    return window;
}

}  // namespace snarp
