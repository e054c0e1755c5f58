#include "App.h"

#include "FrameOrchestrator.h"
#include "GpuDeviceGL.h"
#include "GpuSceneEncoder.h"
#include "Instrument.h"
#include "Overlay.h"
#include "SceneLoader.h"
#include "TransformBaker.h"
#include "Window.h"

#include <cstdio>
#include <variant>
#include <vector>

namespace pt
{
    // One overload per AppEvent alternative; std::visit rejects the handler if one is missing.
    struct App::EventHandler
    {
        App& app;

        void operator()(const plat::CloseRequested&) const
        {
            app.mQuit = true;
        }

        void operator()(const plat::Resized& e) const
        {
            app.mOrchestrator->resize(e.width, e.height);
            app.mOrchestrator->requestRedraw();
        }

        void operator()(const plat::KeyInput& e) const
        {
            if (e.key == plat::Key::F1)
            {
                if (e.pressed && !e.repeat)
                    app.mOverlay->toggle();
                return;
            }

            if (app.mOrchestrator->handleKey(e.key, e.pressed, e.repeat))
                app.mQuit = true;
            app.syncMouseCapture();
        }

        void operator()(const plat::MouseMotion& e) const
        {
            app.mOrchestrator->handleMouseMotion(e.dx, e.dy);
        }

        void operator()(const plat::RedrawRequested&) const
        {
            app.mOrchestrator->requestRedraw();
        }
    };

    App::App(const AppConfig& config)
        : mConfig(config)
    {
        if (!mConfig.tracePath.empty())
            diag::Traces().setEnabled(true);

        {
            ZONE_CPU("App::loadScene");
            mScene.meshes = LoadScene(mConfig.scenePath);
            mScene.bake();
        }
        const EncodedScene encoded = Encode(mScene.bakedMeshes);

        WindowDesc desc;
        desc.title = mConfig.title;
        desc.width = mConfig.width;
        desc.height = mConfig.height;
        desc.vsync = mConfig.vsync;
        mWindow = std::make_unique<Window>(desc);

        bool vsync = false;
        if (mWindow->getVSync(vsync))
            std::fprintf(stderr, "[App] %s context, vsync %s\n", mWindow->getContextLabel(), vsync ? "on" : "off");

        mDevice = std::make_unique<GpuDeviceGL>(*mWindow);
        mDevice->initialize(mConfig.shaderDir);

        mOverlay = std::make_unique<diag::Overlay>(*mWindow);

        mOrchestrator = std::make_unique<FrameOrchestrator>(*mDevice, mConfig.render);
        mOrchestrator->setOverlayPass([this]() { mOverlay->render(); });

        int w = 0, h = 0;
        mWindow->getDrawableSize(w, h);
        mOrchestrator->initialize(encoded, w, h);
        mOrchestrator->resize(w, h);

        syncMouseCapture();
    }

    App::~App()
    {
        // Orchestrator releases its GL objects through the device, so it goes first.
        mOrchestrator.reset();
        mOverlay.reset();
        mDevice.reset();
        mWindow.reset();
    }

    void App::syncMouseCapture()
    {
        const bool capture = !mOrchestrator->input().locked();
        if (capture == mMouseCaptured)
            return;
        if (mWindow->setRelativeMouseMode(capture))
            mMouseCaptured = capture;
    }

    void App::onRedraw()
    {
        ZONE_CPU("App::redraw");

        const double dt = mClock.tick();
        mFrameStats.push(dt * 1000.0);

        mOverlay->build(*mOrchestrator, *mDevice, mFrameStats);
        mOrchestrator->update(static_cast<float>(dt));

        const SurfaceStatus status = mOrchestrator->render();
        switch (status)
        {
        case SurfaceStatus::Ok:
            break;
        case SurfaceStatus::Lost:
        case SurfaceStatus::Outdated:
        {
            int w = 0, h = 0;
            mWindow->getDrawableSize(w, h);
            mOrchestrator->resize(w, h);
            mOrchestrator->requestRedraw();
            break;
        }
        default:
            std::fprintf(stderr, "[App] Frame skipped: surface %s\n", SurfaceStatusName(status));
            mOrchestrator->requestRedraw();
            break;
        }
    }

    int App::run()
    {
        std::vector<plat::AppEvent> events;
        events.reserve(64);
        const EventHandler handler{ *this };

        mClock.reset();
        while (!mQuit)
        {
            events.clear();
            mInput.pumpEvents(events, [this](const SDL_Event& ev) { mOverlay->processEvent(ev); });

            for (const plat::AppEvent& ev : events)
            {
                std::visit(handler, ev);
                if (mQuit) break;
            }
            if (mQuit) break;

            if (!mWindow->isMinimized() && mOrchestrator->consumeRedrawRequest())
                onRedraw();
            else
                mInput.waitForEvents(16);
        }

        if (!mConfig.tracePath.empty())
        {
            const diag::TraceCollector& traces = diag::Traces();
            if (diag::WriteChromeTraceJSON(traces, mConfig.tracePath))
                std::fprintf(stderr, "[App] Wrote %zu trace events to %s (%zu dropped)\n",
                    traces.events().size(), mConfig.tracePath.c_str(), traces.dropped());
            else
                std::fprintf(stderr, "[App] Failed to write trace to %s\n", mConfig.tracePath.c_str());
        }

        const FrameCounters c = mOrchestrator->counters();
        std::fprintf(stderr, "[App] Exit after %u frames, %u samples in the final image\n", c.frame, c.samples);
        return 0;
    }
}
