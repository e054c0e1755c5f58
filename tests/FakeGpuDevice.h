#pragma once

#include "GpuDevice.h"

#include <cstdint>
#include <cstring>
#include <deque>
#include <map>
#include <vector>

// Records every call so tests can assert on what the frame pipeline asked the GPU to do.
class FakeGpuDevice : public pt::IGpuDevice {
public:
    struct Texture {
        int width = 0;
        int height = 0;
        pt::TextureUsage usage = pt::TextureUsage::Accumulation;
    };

    void configureSurface(int width, int height) override {
        ++configureCalls;
        surfaceWidth = width;
        surfaceHeight = height;
    }

    pt::TextureHandle createTexture(int width, int height, pt::TextureUsage usage, const char*) override {
        const std::uint32_t id = nextId++;
        liveTextures[id] = Texture{ width, height, usage };
        ++texturesCreated;
        return pt::TextureHandle{ id };
    }

    void destroyTexture(pt::TextureHandle& tex) override {
        if (tex.valid()) {
            liveTextures.erase(tex.id);
            ++texturesDestroyed;
        }
        tex = {};
    }

    pt::BufferHandle createStorageBuffer(const void* data, std::size_t bytes, const char*) override {
        return makeBuffer(data, bytes);
    }

    pt::BufferHandle createUniformBuffer(const void* data, std::size_t bytes, const char*) override {
        return makeBuffer(data, bytes);
    }

    void writeBuffer(pt::BufferHandle buf, const void* data, std::size_t bytes) override {
        auto& b = buffers[buf.id];
        b.assign(static_cast<const unsigned char*>(data), static_cast<const unsigned char*>(data) + bytes);
    }

    void destroyBuffer(pt::BufferHandle& buf) override {
        if (buf.valid()) buffers.erase(buf.id);
        buf = {};
    }

    void setDisplaySource(pt::TextureHandle tex) override { displaySource = tex; }

    void dispatchCompute(const pt::ComputeDispatch& d) override { dispatches.push_back(d); }

    pt::SurfaceStatus acquireSurface() override {
        ++acquireCalls;
        if (statusQueue.empty()) return pt::SurfaceStatus::Ok;
        const pt::SurfaceStatus s = statusQueue.front();
        statusQueue.pop_front();
        return s;
    }

    void drawDisplayPass() override { ++blits; }
    void present() override { ++presents; }
    float lastDispatchMs() const override { return 0.0f; }

    std::uint32_t readU32(pt::BufferHandle buf) const {
        std::uint32_t v = 0;
        const auto it = buffers.find(buf.id);
        if (it != buffers.end() && it->second.size() >= sizeof(v))
            std::memcpy(&v, it->second.data(), sizeof(v));
        return v;
    }

    bool isLive(pt::TextureHandle tex) const { return liveTextures.count(tex.id) != 0; }

    std::map<std::uint32_t, Texture> liveTextures;
    std::map<std::uint32_t, std::vector<unsigned char>> buffers;
    std::vector<pt::ComputeDispatch> dispatches;
    std::deque<pt::SurfaceStatus> statusQueue;
    pt::TextureHandle displaySource;

    int configureCalls = 0;
    int surfaceWidth = 0;
    int surfaceHeight = 0;
    int texturesCreated = 0;
    int texturesDestroyed = 0;
    int acquireCalls = 0;
    int blits = 0;
    int presents = 0;

private:
    pt::BufferHandle makeBuffer(const void* data, std::size_t bytes) {
        const std::uint32_t id = nextId++;
        auto& b = buffers[id];
        if (data && bytes)
            b.assign(static_cast<const unsigned char*>(data), static_cast<const unsigned char*>(data) + bytes);
        return pt::BufferHandle{ id };
    }

    std::uint32_t nextId = 1;
};
