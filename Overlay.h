#pragma once

#include "Stats.h"

class Window;
union SDL_Event;

namespace pt { class FrameOrchestrator; class IGpuDevice; }

namespace diag {

    // ImGui heads-up panel. Owns the ImGui context and its SDL3/OpenGL3 backends.
    class Overlay {
    public:
        explicit Overlay(const Window& window);
        ~Overlay();

        Overlay(const Overlay&) = delete;
        Overlay& operator=(const Overlay&) = delete;

        // Forwards raw SDL input to the ImGui backend.
        void processEvent(const SDL_Event& ev);

        void toggle() { visible_ = !visible_; }
        bool visible() const { return visible_; }

        // Builds the frame's draw data. Call once per redraw before rendering.
        void build(const pt::FrameOrchestrator& orch, const pt::IGpuDevice& device, const FrameStats& stats);

        // Records the built draw data into the current framebuffer.
        void render();

    private:
        bool visible_ = true;
        bool built_ = false;
    };

}
