#include "FrameOrchestrator.h"

#include "Instrument.h"

#include <algorithm>
#include <cstdio>

namespace pt
{
    const char* SurfaceStatusName(SurfaceStatus s)
    {
        switch (s)
        {
        case SurfaceStatus::Ok: return "Ok";
        case SurfaceStatus::Lost: return "Lost";
        case SurfaceStatus::Outdated: return "Outdated";
        case SurfaceStatus::Timeout: return "Timeout";
        case SurfaceStatus::OutOfMemory: return "OutOfMemory";
        case SurfaceStatus::Other: return "Other";
        }
        return "Unknown";
    }

    FrameOrchestrator::FrameOrchestrator(IGpuDevice& device, const OrchestratorSettings& settings)
        : mDevice(device)
        , mSettings(settings)
        , mInput(settings.input)
        , mAccum(device)
    {
        mCamera.focalDistance = settings.focalDistance;
        mCamera.apertureRadius = settings.apertureRadius;
        mCamera.updateBasis();
    }

    FrameOrchestrator::~FrameOrchestrator()
    {
        releaseBuffers();
        mDevice.destroyTexture(mRenderTarget);
    }

    void FrameOrchestrator::releaseBuffers()
    {
        mDevice.destroyBuffer(mCameraBuffer);
        mDevice.destroyBuffer(mSceneInfoBuffer);
        mDevice.destroyBuffer(mVertexBuffer);
        mDevice.destroyBuffer(mFaceBuffer);
        mDevice.destroyBuffer(mMaterialBuffer);
        mDevice.destroyBuffer(mSeedBuffer);
        mDevice.destroyBuffer(mSampleCountBuffer);
    }

    void FrameOrchestrator::initialize(const EncodedScene& scene, int width, int height)
    {
        ZONE_CPU("FrameOrchestrator::initialize");

        releaseBuffers();

        mWidth = std::max(width, 1);
        mHeight = std::max(height, 1);

        mVertexBuffer = mDevice.createStorageBuffer(scene.vertices.data(),
            scene.vertices.size() * sizeof(GpuVertex), "Vertices");
        mFaceBuffer = mDevice.createStorageBuffer(scene.faces.data(),
            scene.faces.size() * sizeof(GpuFace), "Faces");
        mMaterialBuffer = mDevice.createStorageBuffer(scene.materials.data(),
            scene.materials.size() * sizeof(GpuMaterial), "Materials");
        mSceneInfoBuffer = mDevice.createUniformBuffer(&scene.info, sizeof(GpuSceneInfo), "SceneInfo");

        const GpuCamera cam = PackCamera(mCamera, float(mWidth) / float(mHeight), mFrame);
        mCameraBuffer = mDevice.createUniformBuffer(&cam, sizeof(GpuCamera), "Camera");

        const std::uint32_t zero = 0;
        mSeedBuffer = mDevice.createUniformBuffer(&zero, sizeof(zero), "RandomSeed");
        mSampleCountBuffer = mDevice.createUniformBuffer(&zero, sizeof(zero), "SampleCount");

        recreateRenderTarget();
        mAccum.allocate(mWidth, mHeight);
        mAccum.resetParity();

        mSurfaceConfigured = false;
        mRedrawRequested = true;

        std::fprintf(stderr, "[Orchestrator] Initialized %dx%d: %u faces, %u materials\n",
            mWidth, mHeight, scene.info.faceCount, scene.info.materialCount);
    }

    void FrameOrchestrator::recreateRenderTarget()
    {
        mDevice.destroyTexture(mRenderTarget);
        mRenderTarget = mDevice.createTexture(mWidth, mHeight, TextureUsage::RenderTarget, "RenderTarget");
        mDevice.setDisplaySource(mRenderTarget);
    }

    void FrameOrchestrator::writeCamera()
    {
        const float aspect = mHeight > 0 ? float(mWidth) / float(mHeight) : 1.0f;
        const GpuCamera cam = PackCamera(mCamera, aspect, mFrame);
        mDevice.writeBuffer(mCameraBuffer, &cam, sizeof(cam));
    }

    void FrameOrchestrator::update(float dt)
    {
        ZONE_CPU("FrameOrchestrator::update");

        if (mInput.update(dt, mCamera))
            invalidate();

        writeCamera();
    }

    SurfaceStatus FrameOrchestrator::render()
    {
        if (!mSurfaceConfigured)
            return SurfaceStatus::Ok;

        ZONE_CPU("FrameOrchestrator::render");

        mAccum.refresh();
        const AccumulationBinding acc = mAccum.binding();
        const std::uint32_t samples = mAccum.sampleCount();
        mDevice.writeBuffer(mSeedBuffer, &mFrame, sizeof(mFrame));
        mDevice.writeBuffer(mSampleCountBuffer, &samples, sizeof(samples));

        ComputeDispatch d;
        d.camera = mCameraBuffer;
        d.sceneInfo = mSceneInfoBuffer;
        d.vertices = mVertexBuffer;
        d.faces = mFaceBuffer;
        d.materials = mMaterialBuffer;
        d.randomSeed = mSeedBuffer;
        d.sampleCount = mSampleCountBuffer;
        d.displayOutput = mRenderTarget;
        d.accumulationRead = acc.read();
        d.accumulationWrite = acc.write();
        d.groupsX = DispatchGroups((std::uint32_t)mWidth);
        d.groupsY = DispatchGroups((std::uint32_t)mHeight);

        mDevice.dispatchCompute(d);
        mAccum.flip();

        const SurfaceStatus status = mDevice.acquireSurface();
        if (status != SurfaceStatus::Ok)
        {
            MARK("surface-skip");
            ++mSkippedFrames;
            return status;
        }

        mDevice.drawDisplayPass();
        if (mOverlayPass)
            mOverlayPass();
        mDevice.present();

        ++mFrame;
        mAccum.addSample();
        mRedrawRequested = true;
        return SurfaceStatus::Ok;
    }

    void FrameOrchestrator::resize(int width, int height)
    {
        if (width <= 0 || height <= 0)
            return;

        ZONE_CPU("FrameOrchestrator::resize");

        mWidth = width;
        mHeight = height;
        mDevice.configureSurface(width, height);
        mSurfaceConfigured = true;

        recreateRenderTarget();
        mAccum.allocate(width, height);
        mAccum.resetParity();
        ++mResizes;
        MARK("resize");

        std::fprintf(stderr, "[Orchestrator] Resized to %dx%d\n", width, height);
    }

    void FrameOrchestrator::invalidate()
    {
        mAccum.invalidate();
        ++mInvalidations;
    }

    bool FrameOrchestrator::handleKey(plat::Key key, bool pressed, bool repeat)
    {
        if (!pressed)
        {
            mInput.keyUp(key);
            return false;
        }

        mInput.keyDown(key);

        switch (key)
        {
        case plat::Key::Escape:
            return true;
        case plat::Key::L:
            if (!repeat)
            {
                mInput.toggleLock();
                std::fprintf(stderr, "[Orchestrator] Input %s\n", mInput.locked() ? "locked" : "unlocked");
            }
            break;
        case plat::Key::Up:
            mCamera.focalDistance += mSettings.focalStep;
            invalidate();
            break;
        case plat::Key::Down:
            mCamera.focalDistance = std::max(mCamera.focalDistance - mSettings.focalStep, mSettings.focalStep);
            invalidate();
            break;
        // Aperture changes leave the accumulated image alone.
        case plat::Key::Left:
            mCamera.apertureRadius += mSettings.apertureStep;
            break;
        case plat::Key::Right:
            mCamera.apertureRadius = std::max(mCamera.apertureRadius - mSettings.apertureStep, 0.0f);
            break;
        default:
            break;
        }
        return false;
    }

    void FrameOrchestrator::handleMouseMotion(float dx, float dy)
    {
        if (mInput.locked())
            return;

        // Look direction follows the pointer: dragging right turns right, dragging down looks up.
        mInput.addMouseMotion(-dx, -dy);
        invalidate();
    }

    FrameCounters FrameOrchestrator::counters() const
    {
        FrameCounters c;
        c.frame = mFrame;
        c.samples = mAccum.sampleCount();
        c.invalidations = mInvalidations;
        c.resizes = mResizes;
        c.skippedFrames = mSkippedFrames;
        return c;
    }
}
