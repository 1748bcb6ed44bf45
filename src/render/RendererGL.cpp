#include "render/RendererGL.hpp"

#define GL_GLEXT_PROTOTYPES 1
#include <GL/gl.h>
#include <GL/glext.h>

#include <string>

#include "render/ShaderSources.hpp"

namespace snarp {

namespace {

// Info log of a shader or program object, for error messages.
std::string infoLog(GLuint object, bool isProgram) {
    GLint len = 0;
    if (isProgram) {
        glGetProgramiv(object, GL_INFO_LOG_LENGTH, &len);
    } else {
        glGetShaderiv(object, GL_INFO_LOG_LENGTH, &len);
    }
    if (len <= 1) {
        return "unknown";
    }
    std::string text(static_cast<size_t>(len), '\0');
    if (isProgram) {
        glGetProgramInfoLog(object, len, nullptr, &text[0]);
    } else {
        glGetShaderInfoLog(object, len, nullptr, &text[0]);
    }
    // Drop the terminator the driver wrote.
    return std::string(text.c_str());
}

GLuint compileStage(GLenum stage, const char* source, std::string& err) {
    GLuint shader = glCreateShader(stage);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);
    GLint ok = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (ok != GL_TRUE) {
        err = infoLog(shader, false);
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}

}  // namespace

RendererGL::~RendererGL() {
    glDeleteTextures(1, &tex_);
    glDeleteBuffers(1, &vbo_);
    glDeleteVertexArrays(1, &vao_);
    if (program_) {
        glDeleteProgram(program_);
    }
}

bool RendererGL::buildProgram() {
    std::string err;
    GLuint vertex = compileStage(GL_VERTEX_SHADER, kVertexShaderSource, err);
    GLuint fragment =
        vertex ? compileStage(GL_FRAGMENT_SHADER, kFragmentShaderSource, err)
               : 0;
    if (!vertex || !fragment) {
        LOG_ERROR(log_, "overlay shader compile failed: %s", err.c_str());
        if (vertex) {
            glDeleteShader(vertex);
        }
        return false;
    }

    GLuint program = glCreateProgram();
    glAttachShader(program, vertex);
    glAttachShader(program, fragment);
    glLinkProgram(program);
    glDetachShader(program, vertex);
    glDetachShader(program, fragment);
    glDeleteShader(vertex);
    glDeleteShader(fragment);

    GLint linked = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &linked);
    if (linked != GL_TRUE) {
        LOG_ERROR(log_, "overlay shader link failed: %s",
                  infoLog(program, true).c_str());
        glDeleteProgram(program);
        return false;
    }

    program_ = program;
    uniforms_.tex = glGetUniformLocation(program_, "u_tex");
    uniforms_.screenSize = glGetUniformLocation(program_, "u_screenSize");
    uniforms_.selection = glGetUniformLocation(program_, "u_selection");
    uniforms_.hasSelection = glGetUniformLocation(program_, "u_hasSelection");
    uniforms_.tint = glGetUniformLocation(program_, "u_tint");
    uniforms_.borderColor = glGetUniformLocation(program_, "u_borderColor");
    uniforms_.borderPx = glGetUniformLocation(program_, "u_borderPx");
    uniforms_.dashPx = glGetUniformLocation(program_, "u_dashPx");
    return true;
}

// Full-screen quad as a triangle strip: clip-space position, then uv.
void RendererGL::createQuad() {
    static const GLfloat kQuad[] = {
        -1.0f, -1.0f, 0.0f, 0.0f,  //
        1.0f,  -1.0f, 1.0f, 0.0f,  //
        -1.0f, 1.0f,  0.0f, 1.0f,  //
        1.0f,  1.0f,  1.0f, 1.0f,  //
    };
    const GLsizei stride = 4 * sizeof(GLfloat);

    glGenVertexArrays(1, &vao_);
    glBindVertexArray(vao_);
    glGenBuffers(1, &vbo_);
    glBindBuffer(GL_ARRAY_BUFFER, vbo_);
    glBufferData(GL_ARRAY_BUFFER, sizeof(kQuad), kQuad, GL_STATIC_DRAW);
    for (GLuint attr = 0; attr < 2; ++attr) {
        glEnableVertexAttribArray(attr);
        glVertexAttribPointer(
            attr, 2, GL_FLOAT, GL_FALSE, stride,
            reinterpret_cast<const void*>(attr * 2 * sizeof(GLfloat)));
    }
    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

bool RendererGL::initGL() {
    const GLubyte* version = glGetString(GL_VERSION);
    if (!version) {
        LOG_ERROR(log_, "no current OpenGL context");
        return false;
    }
    LOG_DEBUG(log_, "overlay GL %s", reinterpret_cast<const char*>(version));

    if (!buildProgram()) {
        return false;
    }
    createQuad();

    // The snapshot maps 1:1 onto the window.
    glGenTextures(1, &tex_);
    glBindTexture(GL_TEXTURE_2D, tex_);
    const GLenum params[][2] = {{GL_TEXTURE_MIN_FILTER, GL_NEAREST},
                                {GL_TEXTURE_MAG_FILTER, GL_NEAREST},
                                {GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE},
                                {GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE}};
    for (const auto& param : params) {
        glTexParameteri(GL_TEXTURE_2D, param[0], static_cast<GLint>(param[1]));
    }
    glBindTexture(GL_TEXTURE_2D, 0);
    return true;
}

bool RendererGL::uploadSnapshotTexture(const Image& image) {
    if (image.empty() || image.pixels.size() < image.expectedSize()) {
        LOG_ERROR(log_, "snapshot is empty or truncated (%dx%d)", image.w,
                  image.h);
        return false;
    }
    const GLenum format = image.order == PixelOrder::BGR ? GL_BGR : GL_RGB;
    glBindTexture(GL_TEXTURE_2D, tex_);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGB8, image.w, image.h, 0, format,
                 GL_UNSIGNED_BYTE, image.pixels.data());
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    glBindTexture(GL_TEXTURE_2D, 0);
    return true;
}

void RendererGL::renderFrame(const SelectionOverlayState& state) {
    if (!program_ || !tex_) {
        return;
    }
    glViewport(0, 0, state.screenW, state.screenH);
    glDisable(GL_DEPTH_TEST);
    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    glUseProgram(program_);
    glUniform1i(uniforms_.tex, 0);
    glUniform2f(uniforms_.screenSize, static_cast<float>(state.screenW),
                static_cast<float>(state.screenH));
    // Edges as x0, y0, x1, y1 in window pixels.
    glUniform4f(uniforms_.selection, state.x, state.y, state.x + state.w,
                state.y + state.h);
    glUniform1i(uniforms_.hasSelection, state.hasSelection ? 1 : 0);
    glUniform4f(uniforms_.tint, state.tintR, state.tintG, state.tintB,
                state.tintA);
    glUniform3f(uniforms_.borderColor, state.borderR, state.borderG,
                state.borderB);
    glUniform1f(uniforms_.borderPx, state.borderPx);
    glUniform1f(uniforms_.dashPx, state.dashPx);

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, tex_);
    glBindVertexArray(vao_);
    glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
    glBindVertexArray(0);
    glUseProgram(0);
}

}  // namespace snarp
