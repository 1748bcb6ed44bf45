#pragma once

#include "capture/CaptureTypes.hpp"
#include "platform/Log.hpp"

namespace snarp {

struct SelectionOverlayState {
    bool hasSelection = false;
    // Selection rectangle in window pixels, top-left origin.
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
    int screenW = 0;
    int screenH = 0;
    float tintR = 0.0f;
    float tintG = 0.0f;
    float tintB = 0.0f;
    float tintA = 0.55f;
    float borderR = 1.0f;
    float borderG = 0.0f;
    float borderB = 0.0f;
    float borderPx = 2.0f;
    float dashPx = 5.0f;
};

// Draws a full-window snapshot with the selection overlay. Requires a
// current OpenGL 3.3 context.
class RendererGL {
public:
    explicit RendererGL(LogSink& log) : log_(log) {}
    ~RendererGL();

    RendererGL(const RendererGL&) = delete;
    RendererGL& operator=(const RendererGL&) = delete;

    bool initGL();
    bool uploadSnapshotTexture(const Image& image);
    void renderFrame(const SelectionOverlayState& state);

private:
    struct Uniforms {
        int tex = -1;
        int screenSize = -1;
        int selection = -1;
        int hasSelection = -1;
        int tint = -1;
        int borderColor = -1;
        int borderPx = -1;
        int dashPx = -1;
    };

    bool buildProgram();
    void createQuad();

    LogSink& log_;
    Uniforms uniforms_;
    unsigned int program_ = 0;
    unsigned int vao_ = 0;
    unsigned int vbo_ = 0;
    unsigned int tex_ = 0;
};

}  // namespace snarp
