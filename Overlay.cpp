#include "Overlay.h"

#include "FrameOrchestrator.h"
#include "GpuDevice.h"
#include "Window.h"

#include <imgui.h>
#include <imgui_impl_opengl3.h>
#include <imgui_impl_sdl3.h>

#include <stdexcept>

namespace diag {

    Overlay::Overlay(const Window& window) {
        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGuiIO& io = ImGui::GetIO();
        io.ConfigFlags |= ImGuiConfigFlags_NoMouse;
        io.IniFilename = nullptr;
        ImGui::StyleColorsDark();

        if (!ImGui_ImplSDL3_InitForOpenGL(window.getSDLWindow(), window.getGLContext())) {
            ImGui::DestroyContext();
            throw std::runtime_error("ImGui SDL3 backend initialization failed");
        }
        if (!ImGui_ImplOpenGL3_Init("#version 430")) {
            ImGui_ImplSDL3_Shutdown();
            ImGui::DestroyContext();
            throw std::runtime_error("ImGui OpenGL3 backend initialization failed");
        }
    }

    Overlay::~Overlay() {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
    }

    void Overlay::processEvent(const SDL_Event& ev) {
        ImGui_ImplSDL3_ProcessEvent(&ev);
    }

    void Overlay::build(const pt::FrameOrchestrator& orch, const pt::IGpuDevice& device, const FrameStats& stats) {
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        if (visible_) {
            const pt::FrameCounters c = orch.counters();
            const pt::Camera& cam = orch.camera();

            ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_FirstUseEver);
            ImGui::SetNextWindowBgAlpha(0.6f);
            if (ImGui::Begin("Path Tracer", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
                ImGui::Text("Samples: %u", c.samples);
                ImGui::Text("Frame: %u", c.frame);
                ImGui::Text("Resolution: %d x %d", orch.width(), orch.height());
                ImGui::Separator();
                ImGui::Text("Focal distance: %.2f", cam.focalDistance);
                ImGui::Text("Aperture: %.2f", cam.apertureRadius);
                ImGui::Text("Position: (%.2f, %.2f, %.2f)", cam.position.x, cam.position.y, cam.position.z);
                ImGui::Text("Input: %s", orch.input().locked() ? "locked (L)" : "free (L to lock)");
                ImGui::Separator();
                ImGui::Text("Frame: %.2f ms (%.1f fps, max %.2f)", stats.averageMs(), stats.fps(), stats.maxMs());
                ImGui::Text("Trace dispatch: %.2f ms", device.lastDispatchMs());
                ImGui::Text("Resets: %llu  Resizes: %llu  Skipped: %llu",
                    (unsigned long long)c.invalidations,
                    (unsigned long long)c.resizes,
                    (unsigned long long)c.skippedFrames);
            }
            ImGui::End();
        }

        ImGui::Render();
        built_ = true;
    }

    void Overlay::render() {
        if (!built_) return;
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        built_ = false;
    }

}
