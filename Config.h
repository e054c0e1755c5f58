#pragma once

#include "FrameOrchestrator.h"

#include <string>

namespace pt
{
    struct AppConfig
    {
        std::string title = "ptview";
        int width = 1280;
        int height = 720;
        bool vsync = true;

        std::string scenePath = "models/scene.glb";
        std::string shaderDir = "Shaders";
        std::string tracePath; // empty: no trace export

        OrchestratorSettings render;
        bool showHelp = false;
    };

    // Fills cfg from argv, starting from its current values. On failure returns false and
    // describes the problem in error; cfg may be partially updated.
    bool ParseArgs(int argc, const char* const* argv, AppConfig& cfg, std::string& error);

    const char* UsageText();
}
