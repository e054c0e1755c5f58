#include "Window.h"

#include <glad/glad.h>

#include <SDL3/SDL.h>
#include <iostream>
#include <stdexcept>

#if defined(_WIN32)
#  define PT_GLAPIENTRY __stdcall
#else
#  define PT_GLAPIENTRY
#endif

static void PT_GLAPIENTRY GLDebugCallback_(GLenum source, GLenum type, GLuint id,
    GLenum severity, GLsizei length, const GLchar* message, const void* userParam)
{
    (void)source; (void)type; (void)length; (void)userParam;
    if (severity == GL_DEBUG_SEVERITY_NOTIFICATION) return;
    if (id == 131185 || id == 131218 || id == 131204) return;

    std::cerr << "[GL] " << (message ? message : "(null)") << "\n";
}

static void InstallGLDebugOutput_()
{
    if (!GLAD_GL_VERSION_4_3 || !glDebugMessageCallback) return;

    glEnable(GL_DEBUG_OUTPUT);
    glDebugMessageCallback(GLDebugCallback_, nullptr);
    glDebugMessageControl(GL_DONT_CARE, GL_DONT_CARE, GL_DONT_CARE, 0, nullptr, GL_TRUE);
}

static const char* SDLError()
{
    const char* e = SDL_GetError();
    return (e && *e) ? e : "(no message)";
}

struct GLAttempt {
    int major = 4;
    int minor = 3;
    const char* label = "4.3 core";
};

Window::Window(const WindowDesc& desc)
{
    if (!SDL_WasInit(SDL_INIT_VIDEO) && !SDL_InitSubSystem(SDL_INIT_VIDEO)) {
        throw std::runtime_error(std::string("SDL_InitSubSystem(SDL_INIT_VIDEO) failed: ") + SDLError());
    }

    // Compute shaders and image load/store need 4.3.
    const GLAttempt tries[] = {
        {4, 6, "4.6 core"},
        {4, 5, "4.5 core"},
        {4, 3, "4.3 core"},
    };

    auto try_one = [&](const GLAttempt& a) -> bool {
        SDL_GL_ResetAttributes();
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, a.major);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, a.minor);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
        SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);
        SDL_GL_SetAttribute(SDL_GL_DEPTH_SIZE, 0);
        SDL_GL_SetAttribute(SDL_GL_STENCIL_SIZE, 0);

        window = SDL_CreateWindow(desc.title.c_str(),
            desc.width,
            desc.height,
            SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
        if (!window) {
            std::cerr << "[Window] GL " << a.label << ": SDL_CreateWindow failed: " << SDLError() << "\n";
            return false;
        }

        glContext = SDL_GL_CreateContext(window);
        if (!glContext) {
            std::cerr << "[Window] GL " << a.label << ": SDL_GL_CreateContext failed: " << SDLError() << "\n";
            SDL_DestroyWindow(window);
            window = nullptr;
            return false;
        }

        if (SDL_GL_GetCurrentContext() != glContext && !SDL_GL_MakeCurrent(window, glContext)) {
            std::cerr << "[Window] GL " << a.label << ": SDL_GL_MakeCurrent failed: " << SDLError() << "\n";
            SDL_GL_DestroyContext(glContext);
            glContext = nullptr;
            SDL_DestroyWindow(window);
            window = nullptr;
            return false;
        }

        contextLabel = a.label;
        std::cerr << "[Window] GL " << a.label << " context created\n";
        return true;
        };

    bool created = false;
    for (const auto& attempt : tries) {
        if (try_one(attempt)) { created = true; break; }
    }

    if (!created) {
        throw std::runtime_error("no OpenGL 4.3+ core context available");
    }

    if (!gladLoadGLLoader((GLADloadproc)SDL_GL_GetProcAddress)) {
        SDL_GL_DestroyContext(glContext);
        glContext = nullptr;
        SDL_DestroyWindow(window);
        window = nullptr;
        throw std::runtime_error("gladLoadGLLoader failed");
    }

    if (!GLAD_GL_VERSION_4_3) {
        SDL_GL_DestroyContext(glContext);
        glContext = nullptr;
        SDL_DestroyWindow(window);
        window = nullptr;
        throw std::runtime_error("OpenGL 4.3 entry points not available");
    }

    std::cerr << "[Window] GL_VERSION " << reinterpret_cast<const char*>(glGetString(GL_VERSION))
        << " / " << reinterpret_cast<const char*>(glGetString(GL_RENDERER)) << "\n";

    InstallGLDebugOutput_();

    (void)setVSync(desc.vsync);
}

Window::~Window()
{
    if (glContext) {
        SDL_GL_DestroyContext(glContext);
        glContext = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
}

void Window::getDrawableSize(int& outWidth, int& outHeight) const
{
    outWidth = 0;
    outHeight = 0;
    if (window && !SDL_GetWindowSizeInPixels(window, &outWidth, &outHeight)) {
        std::cerr << "[Window] SDL_GetWindowSizeInPixels failed: " << SDLError() << "\n";
    }
}

bool Window::isMinimized() const
{
    return window && (SDL_GetWindowFlags(window) & SDL_WINDOW_MINIMIZED) != 0;
}

bool Window::isContextCurrent() const
{
    return glContext && SDL_GL_GetCurrentContext() == glContext;
}

bool Window::setVSync(bool enabled)
{
    if (!window || !glContext) {
        std::cerr << "[Window] setVSync called without a valid window/context\n";
        return false;
    }

    const int interval = enabled ? 1 : 0;
    if (!SDL_GL_SetSwapInterval(interval)) {
        std::cerr << "[Window] SDL_GL_SetSwapInterval(" << interval << ") failed: " << SDLError() << "\n";
        return false;
    }

    int actual = 0;
    if (SDL_GL_GetSwapInterval(&actual) && actual != interval) {
        std::cerr << "[Window] Requested swap interval " << interval
            << " but driver reports " << actual << "\n";
    }
    return true;
}

bool Window::getVSync(bool& outEnabled) const
{
    int interval = 0;
    if (!SDL_GL_GetSwapInterval(&interval)) {
        std::cerr << "[Window] SDL_GL_GetSwapInterval failed: " << SDLError() << "\n";
        return false;
    }
    outEnabled = (interval != 0);
    return true;
}

bool Window::setRelativeMouseMode(bool enabled)
{
    if (!window) return false;
    if (!SDL_SetWindowRelativeMouseMode(window, enabled)) {
        std::cerr << "[Window] SDL_SetWindowRelativeMouseMode failed: " << SDLError() << "\n";
        return false;
    }
    return true;
}

bool Window::swapBuffers()
{
    if (!window) return false;
    if (!SDL_GL_SwapWindow(window)) {
        std::cerr << "[Window] SDL_GL_SwapWindow failed: " << SDLError() << "\n";
        return false;
    }
    return true;
}
