#pragma once

namespace snarp {

inline const char* kVertexShaderSource = R"(#version 330 core
layout(location = 0) in vec2 a_pos;
layout(location = 1) in vec2 a_uv;
out vec2 v_uv;
void main() {
    // Texture row 0 is the top of the snapshot.
    v_uv = vec2(a_uv.x, 1.0 - a_uv.y);
    gl_Position = vec4(a_pos, 0.0, 1.0);
}
)";

// Dims everything outside u_selection (pixels, top-left origin, x0 y0 x1 y1)
// and draws a dashed border just inside it.
inline const char* kFragmentShaderSource = R"(#version 330 core
in vec2 v_uv;
out vec4 fragColor;
uniform sampler2D u_tex;
uniform vec2 u_screenSize;
uniform vec4 u_selection;
uniform int u_hasSelection;
uniform vec4 u_tint;
uniform vec3 u_borderColor;
uniform float u_borderPx;
uniform float u_dashPx;
void main() {
    vec3 color = texture(u_tex, v_uv).rgb;
    vec2 p = vec2(gl_FragCoord.x, u_screenSize.y - gl_FragCoord.y);
    bool inside = u_hasSelection == 1 &&
                  p.x >= u_selection.x && p.x < u_selection.z &&
                  p.y >= u_selection.y && p.y < u_selection.w;
    if (!inside) {
        fragColor = vec4(mix(color, u_tint.rgb, u_tint.a), 1.0);
        return;
    }
    float edge = min(min(p.x - u_selection.x, u_selection.z - p.x),
                     min(p.y - u_selection.y, u_selection.w - p.y));
    if (edge < u_borderPx && mod(floor((p.x + p.y) / u_dashPx), 2.0) < 1.0) {
        color = u_borderColor;
    }
    fragColor = vec4(color, 1.0);
}
)";

}  // namespace snarp
