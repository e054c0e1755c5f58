#pragma once

#include <string>
#include <SDL3/SDL.h>

struct WindowDesc {
    std::string title = "ptview";
    int width = 1280;
    int height = 720;
    bool vsync = true;
};

// SDL window with an OpenGL 4.3+ core context. Throws std::runtime_error if no suitable
// context can be created or the GL loader fails.
class Window {
public:
    explicit Window(const WindowDesc& desc);
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    SDL_Window* getSDLWindow() const noexcept { return window; }
    SDL_GLContext getGLContext() const noexcept { return glContext; }
    const char* getContextLabel() const noexcept { return contextLabel; }

    // Drawable size in pixels.
    void getDrawableSize(int& outWidth, int& outHeight) const;

    bool isMinimized() const;
    bool isContextCurrent() const;

    bool setVSync(bool enabled);
    bool getVSync(bool& outEnabled) const;

    bool setRelativeMouseMode(bool enabled);

    bool swapBuffers();

private:
    SDL_Window* window = nullptr;
    SDL_GLContext glContext = nullptr;
    const char* contextLabel = "";
};
