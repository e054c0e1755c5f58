#pragma once

#include "AppEvent.h"
#include "Config.h"
#include "InputBackend.h"
#include "Platform.h"
#include "SceneTypes.h"
#include "Stats.h"

#include <memory>

class Window;
namespace diag { class Overlay; }

namespace pt
{
    class FrameOrchestrator;
    class GpuDeviceGL;

    // Owns the window, device and frame pipeline and runs the event loop.
    // Construction loads the scene and creates every GPU resource; it throws on failure.
    class App
    {
    public:
        explicit App(const AppConfig& config);
        ~App();

        App(const App&) = delete;
        App& operator=(const App&) = delete;

        int run();

    private:
        struct EventHandler;

        void onRedraw();
        void syncMouseCapture();

        AppConfig mConfig;
        Scene mScene;

        std::unique_ptr<Window> mWindow;
        std::unique_ptr<GpuDeviceGL> mDevice;
        std::unique_ptr<diag::Overlay> mOverlay;
        std::unique_ptr<FrameOrchestrator> mOrchestrator;

        plat::InputBackend mInput;
        plat::FrameClock mClock;
        diag::FrameStats mFrameStats;

        bool mQuit = false;
        bool mMouseCaptured = false;
    };
}
