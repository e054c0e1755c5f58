#include "GpuDeviceGL.h"

#include "Shader.h"
#include "Window.h"

#include <cstdio>
#include <stdexcept>
#include <vector>

namespace
{
    // Binding points shared with Shaders/raytracer.comp.
    constexpr GLuint kCameraBinding = 0;
    constexpr GLuint kSceneInfoBinding = 1;
    constexpr GLuint kVertexBinding = 2;
    constexpr GLuint kFaceBinding = 3;
    constexpr GLuint kMaterialBinding = 4;
    constexpr GLuint kDisplayImageUnit = 5;
    constexpr GLuint kAccumReadImageUnit = 6;
    constexpr GLuint kAccumWriteImageUnit = 7;
    constexpr GLuint kSeedBinding = 8;
    constexpr GLuint kSampleCountBinding = 9;

    static const char* GLErrorName(GLenum e)
    {
        switch (e)
        {
        case GL_NO_ERROR: return "GL_NO_ERROR";
        case GL_INVALID_ENUM: return "GL_INVALID_ENUM";
        case GL_INVALID_VALUE: return "GL_INVALID_VALUE";
        case GL_INVALID_OPERATION: return "GL_INVALID_OPERATION";
        case GL_INVALID_FRAMEBUFFER_OPERATION: return "GL_INVALID_FRAMEBUFFER_OPERATION";
        case GL_OUT_OF_MEMORY: return "GL_OUT_OF_MEMORY";
        default: return "GL_UNKNOWN_ERROR";
        }
    }

    // Logs and clears pending errors. Returns the first one seen.
    static GLenum DrainGLErrors(const char* where)
    {
        GLenum first = GL_NO_ERROR;
        for (int i = 0; i < 16; ++i)
        {
            GLenum e = glGetError();
            if (e == GL_NO_ERROR) break;
            if (first == GL_NO_ERROR) first = e;
            std::fprintf(stderr, "[GpuDeviceGL] %s: %s (0x%04X)\n", where, GLErrorName(e), (unsigned)e);
        }
        return first;
    }

    static void ZeroTexture(GLuint tex, int w, int h)
    {
        if (GLAD_GL_VERSION_4_4)
        {
            glClearTexImage(tex, 0, GL_RGBA, GL_FLOAT, nullptr);
            return;
        }

        const std::vector<float> zeros((std::size_t)w * (std::size_t)h * 4u, 0.0f);
        glBindTexture(GL_TEXTURE_2D, tex);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, w, h, GL_RGBA, GL_FLOAT, zeros.data());
        glBindTexture(GL_TEXTURE_2D, 0);
    }

    static GLuint CreateBuffer(GLenum target, const void* data, std::size_t bytes, GLenum usage)
    {
        // Zero-sized buffers can't be bound; keep one std430 element worth of zeros instead.
        static const unsigned char kZeros[64] = {};
        if (bytes == 0)
        {
            data = kZeros;
            bytes = sizeof(kZeros);
        }

        GLuint buf = 0;
        glGenBuffers(1, &buf);
        glBindBuffer(target, buf);
        glBufferData(target, (GLsizeiptr)bytes, data, usage);
        glBindBuffer(target, 0);
        return buf;
    }
}

namespace pt
{
    void GpuDeviceGL::DispatchTimer::init()
    {
        shutdown();
        glGenQueries(kFrames, qBegin.data());
        glGenQueries(kFrames, qEnd.data());
        valid = DrainGLErrors("DispatchTimer::init") == GL_NO_ERROR;
        if (!valid)
            std::fprintf(stderr, "[GpuDeviceGL] Timer queries unavailable; dispatch timing disabled.\n");
    }

    void GpuDeviceGL::DispatchTimer::shutdown()
    {
        if (qBegin[0] || qEnd[0])
        {
            glDeleteQueries(kFrames, qBegin.data());
            glDeleteQueries(kFrames, qEnd.data());
        }
        qBegin.fill(0);
        qEnd.fill(0);
        valid = false;
    }

    void GpuDeviceGL::DispatchTimer::begin()
    {
        if (valid) glQueryCounter(qBegin[cursor % kFrames], GL_TIMESTAMP);
    }

    void GpuDeviceGL::DispatchTimer::end()
    {
        if (!valid) return;
        glQueryCounter(qEnd[cursor % kFrames], GL_TIMESTAMP);
        ++cursor;
    }

    // Reads the oldest slot still in flight; never stalls on a pending query.
    void GpuDeviceGL::DispatchTimer::resolve()
    {
        if (!valid || cursor < kFrames) return;

        const int idx = cursor % kFrames;
        GLuint available = 0;
        glGetQueryObjectuiv(qEnd[idx], GL_QUERY_RESULT_AVAILABLE, &available);
        if (!available) return;

        GLuint64 t0 = 0, t1 = 0;
        glGetQueryObjectui64v(qBegin[idx], GL_QUERY_RESULT, &t0);
        glGetQueryObjectui64v(qEnd[idx], GL_QUERY_RESULT, &t1);
        if (t1 >= t0)
            lastMs = float(double(t1 - t0) / 1.0e6);
    }

    GpuDeviceGL::GpuDeviceGL(Window& window)
        : mWindow(window)
    {
    }

    GpuDeviceGL::~GpuDeviceGL()
    {
        mTimer.shutdown();
        if (mEmptyVao) glDeleteVertexArrays(1, &mEmptyVao);
        mEmptyVao = 0;
    }

    void GpuDeviceGL::initialize(const std::string& shaderDir)
    {
        const std::string dir = shaderDir.empty() ? std::string(".") : shaderDir;

        mTraceProgram = std::make_unique<Shader>(dir + "/raytracer.comp");
        mDisplayProgram = std::make_unique<Shader>(dir + "/display.vert", dir + "/display.frag");

        glGenVertexArrays(1, &mEmptyVao);
        mTimer.init();

        if (DrainGLErrors("initialize") == GL_OUT_OF_MEMORY)
            throw std::runtime_error("out of GPU memory during device initialization");

        GLint groups[2] = {};
        glGetIntegeri_v(GL_MAX_COMPUTE_WORK_GROUP_COUNT, 0, &groups[0]);
        glGetIntegeri_v(GL_MAX_COMPUTE_WORK_GROUP_COUNT, 1, &groups[1]);
        std::fprintf(stderr, "[GpuDeviceGL] Ready (max work groups %d x %d)\n", groups[0], groups[1]);
    }

    void GpuDeviceGL::configureSurface(int width, int height)
    {
        mSurfaceWidth = width;
        mSurfaceHeight = height;
        glViewport(0, 0, width, height);
    }

    TextureHandle GpuDeviceGL::createTexture(int width, int height, TextureUsage usage, const char* label)
    {
        if (width < 1 || height < 1)
        {
            std::fprintf(stderr, "[GpuDeviceGL] createTexture(%s) invalid size %dx%d (refusing)\n",
                label ? label : "unnamed", width, height);
            return {};
        }
        DrainGLErrors("createTexture(pre)");

        GLuint tex = 0;
        glGenTextures(1, &tex);
        glBindTexture(GL_TEXTURE_2D, tex);
        glTexStorage2D(GL_TEXTURE_2D, 1, GL_RGBA32F, width, height);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_BASE_LEVEL, 0);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAX_LEVEL, 0);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glBindTexture(GL_TEXTURE_2D, 0);

        // Accumulation images are read back by the kernel; render targets are fully overwritten
        // by every dispatch before the display pass samples them.
        if (usage == TextureUsage::Accumulation)
            ZeroTexture(tex, width, height);

        if (glObjectLabel && label)
            glObjectLabel(GL_TEXTURE, tex, -1, label);

        if (DrainGLErrors(label ? label : "createTexture(post)") != GL_NO_ERROR)
        {
            std::fprintf(stderr, "[GpuDeviceGL] Allocation failed for %s; deleting tex=%u\n",
                label ? label : "unnamed", (unsigned)tex);
            glDeleteTextures(1, &tex);
            return {};
        }

        return TextureHandle{ tex };
    }

    void GpuDeviceGL::destroyTexture(TextureHandle& tex)
    {
        if (tex.valid())
        {
            if (mDisplaySource == tex)
                mDisplaySource = {};
            glDeleteTextures(1, &tex.id);
        }
        tex = {};
    }

    BufferHandle GpuDeviceGL::createStorageBuffer(const void* data, std::size_t bytes, const char* label)
    {
        const GLuint buf = CreateBuffer(GL_SHADER_STORAGE_BUFFER, data, bytes, GL_STATIC_DRAW);
        if (glObjectLabel && label)
            glObjectLabel(GL_BUFFER, buf, -1, label);
        DrainGLErrors(label ? label : "createStorageBuffer");
        return BufferHandle{ buf };
    }

    BufferHandle GpuDeviceGL::createUniformBuffer(const void* data, std::size_t bytes, const char* label)
    {
        const GLuint buf = CreateBuffer(GL_UNIFORM_BUFFER, data, bytes, GL_DYNAMIC_DRAW);
        if (glObjectLabel && label)
            glObjectLabel(GL_BUFFER, buf, -1, label);
        DrainGLErrors(label ? label : "createUniformBuffer");
        return BufferHandle{ buf };
    }

    void GpuDeviceGL::writeBuffer(BufferHandle buf, const void* data, std::size_t bytes)
    {
        if (!buf.valid() || bytes == 0) return;
        glBindBuffer(GL_COPY_WRITE_BUFFER, buf.id);
        glBufferSubData(GL_COPY_WRITE_BUFFER, 0, (GLsizeiptr)bytes, data);
        glBindBuffer(GL_COPY_WRITE_BUFFER, 0);
    }

    void GpuDeviceGL::destroyBuffer(BufferHandle& buf)
    {
        if (buf.valid())
            glDeleteBuffers(1, &buf.id);
        buf = {};
    }

    void GpuDeviceGL::dispatchCompute(const ComputeDispatch& d)
    {
        mTimer.resolve();

        mTraceProgram->use();

        glBindBufferBase(GL_UNIFORM_BUFFER, kCameraBinding, d.camera.id);
        glBindBufferBase(GL_UNIFORM_BUFFER, kSceneInfoBinding, d.sceneInfo.id);
        glBindBufferBase(GL_SHADER_STORAGE_BUFFER, kVertexBinding, d.vertices.id);
        glBindBufferBase(GL_SHADER_STORAGE_BUFFER, kFaceBinding, d.faces.id);
        glBindBufferBase(GL_SHADER_STORAGE_BUFFER, kMaterialBinding, d.materials.id);
        glBindBufferBase(GL_UNIFORM_BUFFER, kSeedBinding, d.randomSeed.id);
        glBindBufferBase(GL_UNIFORM_BUFFER, kSampleCountBinding, d.sampleCount.id);

        glBindImageTexture(kDisplayImageUnit, d.displayOutput.id, 0, GL_FALSE, 0, GL_WRITE_ONLY, GL_RGBA32F);
        glBindImageTexture(kAccumReadImageUnit, d.accumulationRead.id, 0, GL_FALSE, 0, GL_READ_ONLY, GL_RGBA32F);
        glBindImageTexture(kAccumWriteImageUnit, d.accumulationWrite.id, 0, GL_FALSE, 0, GL_WRITE_ONLY, GL_RGBA32F);

        mTimer.begin();
        glDispatchCompute(d.groupsX, d.groupsY, 1);
        mTimer.end();

        glMemoryBarrier(GL_SHADER_IMAGE_ACCESS_BARRIER_BIT | GL_TEXTURE_FETCH_BARRIER_BIT);

        glBindImageTexture(kDisplayImageUnit, 0, 0, GL_FALSE, 0, GL_WRITE_ONLY, GL_RGBA32F);
        glBindImageTexture(kAccumReadImageUnit, 0, 0, GL_FALSE, 0, GL_READ_ONLY, GL_RGBA32F);
        glBindImageTexture(kAccumWriteImageUnit, 0, 0, GL_FALSE, 0, GL_WRITE_ONLY, GL_RGBA32F);
        glUseProgram(0);
    }

    SurfaceStatus GpuDeviceGL::acquireSurface()
    {
        if (!mWindow.isContextCurrent())
            return SurfaceStatus::Lost;

        int w = 0, h = 0;
        mWindow.getDrawableSize(w, h);
        if (w != mSurfaceWidth || h != mSurfaceHeight)
            return SurfaceStatus::Outdated;

        if (mPresentFailed)
        {
            mPresentFailed = false;
            return SurfaceStatus::Other;
        }

        switch (DrainGLErrors("acquireSurface"))
        {
        case GL_NO_ERROR: return SurfaceStatus::Ok;
        case GL_OUT_OF_MEMORY: return SurfaceStatus::OutOfMemory;
        default: return SurfaceStatus::Ok;
        }
    }

    void GpuDeviceGL::drawDisplayPass()
    {
        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        glViewport(0, 0, mSurfaceWidth, mSurfaceHeight);
        glDisable(GL_DEPTH_TEST);
        glDisable(GL_BLEND);
        glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        if (!mDisplaySource.valid())
            return;

        mDisplayProgram->use();
        glActiveTexture(GL_TEXTURE0);
        glBindTexture(GL_TEXTURE_2D, mDisplaySource.id);
        glBindVertexArray(mEmptyVao);
        glDrawArrays(GL_TRIANGLES, 0, 6);
        glBindVertexArray(0);
        glBindTexture(GL_TEXTURE_2D, 0);
        glUseProgram(0);
    }

    void GpuDeviceGL::present()
    {
        if (!mWindow.swapBuffers())
            mPresentFailed = true;
    }
}
