#pragma once

#include "AccumulationManager.h"
#include "Camera.h"
#include "GpuDevice.h"
#include "GpuSceneEncoder.h"
#include "InputController.h"
#include "InputState.h"

#include <cstdint>
#include <functional>
#include <utility>

namespace pt
{
    constexpr std::uint32_t kWorkGroupSize = 8;

    constexpr std::uint32_t DispatchGroups(std::uint32_t extent)
    {
        return (extent + kWorkGroupSize - 1) / kWorkGroupSize;
    }

    struct OrchestratorSettings
    {
        InputSettings input;
        float focalDistance = 4.0f;
        float apertureRadius = 0.05f;
        float focalStep = 0.02f;
        float apertureStep = 0.02f;
    };

    struct FrameCounters
    {
        std::uint32_t frame = 0;
        std::uint32_t samples = 0;
        std::uint64_t invalidations = 0;
        std::uint64_t resizes = 0;
        std::uint64_t skippedFrames = 0;
    };

    // Drives update -> dispatch -> blit -> present against an explicit device.
    class FrameOrchestrator
    {
    public:
        explicit FrameOrchestrator(IGpuDevice& device, const OrchestratorSettings& settings = {});
        ~FrameOrchestrator();

        FrameOrchestrator(const FrameOrchestrator&) = delete;
        FrameOrchestrator& operator=(const FrameOrchestrator&) = delete;

        // Uploads the immutable scene buffers and allocates size-dependent textures.
        // The surface stays unconfigured until the first resize().
        void initialize(const EncodedScene& scene, int width, int height);

        void update(float dt);
        SurfaceStatus render();
        void resize(int width, int height);
        void invalidate();

        // Returns true when the key asks the application to quit.
        bool handleKey(plat::Key key, bool pressed, bool repeat = false);
        void handleMouseMotion(float dx, float dy);

        // Runs between the display blit and present (overlay drawing).
        void setOverlayPass(std::function<void()> pass) { mOverlayPass = std::move(pass); }

        bool redrawRequested() const { return mRedrawRequested; }
        void requestRedraw() { mRedrawRequested = true; }
        bool consumeRedrawRequest()
        {
            const bool r = mRedrawRequested;
            mRedrawRequested = false;
            return r;
        }

        const Camera& camera() const { return mCamera; }
        const InputController& input() const { return mInput; }
        const AccumulationManager& accumulation() const { return mAccum; }
        FrameCounters counters() const;
        bool isSurfaceConfigured() const { return mSurfaceConfigured; }
        int width() const { return mWidth; }
        int height() const { return mHeight; }
        TextureHandle renderTarget() const { return mRenderTarget; }

    private:
        void writeCamera();
        void recreateRenderTarget();
        void releaseBuffers();

        IGpuDevice& mDevice;
        OrchestratorSettings mSettings;

        Camera mCamera;
        InputController mInput;
        AccumulationManager mAccum;

        BufferHandle mCameraBuffer;
        BufferHandle mSceneInfoBuffer;
        BufferHandle mVertexBuffer;
        BufferHandle mFaceBuffer;
        BufferHandle mMaterialBuffer;
        BufferHandle mSeedBuffer;
        BufferHandle mSampleCountBuffer;
        TextureHandle mRenderTarget;

        std::function<void()> mOverlayPass;

        int mWidth = 0;
        int mHeight = 0;
        bool mSurfaceConfigured = false;
        bool mRedrawRequested = false;

        std::uint32_t mFrame = 0;
        std::uint64_t mInvalidations = 0;
        std::uint64_t mResizes = 0;
        std::uint64_t mSkippedFrames = 0;
    };
}
