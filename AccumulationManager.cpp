#include "AccumulationManager.h"

namespace pt
{
    AccumulationManager::AccumulationManager(IGpuDevice& device)
        : mDevice(device)
    {
    }

    AccumulationManager::~AccumulationManager()
    {
        release();
    }

    void AccumulationManager::release()
    {
        for (TextureHandle& tex : mImages)
            mDevice.destroyTexture(tex);
    }

    void AccumulationManager::allocate(int width, int height)
    {
        release();
        mWidth = width;
        mHeight = height;
        mImages[0] = mDevice.createTexture(width, height, TextureUsage::Accumulation, "Accumulation A");
        mImages[1] = mDevice.createTexture(width, height, TextureUsage::Accumulation, "Accumulation B");
        mSampleCount = 0;
        mStale = false;
    }

    void AccumulationManager::invalidate() noexcept
    {
        mSampleCount = 0;
        mStale = true;
    }

    void AccumulationManager::refresh()
    {
        if (mStale && mWidth > 0 && mHeight > 0)
            allocate(mWidth, mHeight);
    }
}
