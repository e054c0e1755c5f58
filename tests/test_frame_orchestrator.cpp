#include <doctest/doctest.h>
#include <glm/glm.hpp>

#include <cstring>

#include "FakeGpuDevice.h"
#include "FrameOrchestrator.h"
#include "GpuSceneEncoder.h"

static pt::EncodedScene makeScene() {
    pt::Mesh m;
    m.vertices = { {0, 0, 0}, {1, 0, 0}, {0, 1, 0} };
    pt::Face f;
    f.indices = { 0, 1, 2 };
    f.normals = { glm::vec3(0, 0, 1), glm::vec3(0, 0, 1), glm::vec3(0, 0, 1) };
    m.faces.push_back(f);
    m.materials.push_back(pt::Material{});
    return pt::Encode({ m });
}

struct Fixture {
    FakeGpuDevice device;
    pt::FrameOrchestrator orch{ device };

    explicit Fixture(bool configure = true) {
        orch.initialize(makeScene(), 100, 50);
        if (configure) orch.resize(100, 50);
    }
};

TEST_SUITE("FrameOrchestrator") {
    TEST_CASE("dispatch grid rounds up to whole work groups") {
        CHECK(pt::DispatchGroups(1) == 1);
        CHECK(pt::DispatchGroups(8) == 1);
        CHECK(pt::DispatchGroups(9) == 2);
        CHECK(pt::DispatchGroups(1280) == 160);
        CHECK(pt::DispatchGroups(721) == 91);

        Fixture fx;
        fx.orch.resize(17, 9);
        fx.orch.render();
        REQUIRE(fx.device.dispatches.size() == 1);
        CHECK(fx.device.dispatches[0].groupsX == 3);
        CHECK(fx.device.dispatches[0].groupsY == 2);
    }

    TEST_CASE("render before the surface is configured does nothing") {
        Fixture fx(false);
        CHECK_FALSE(fx.orch.isSurfaceConfigured());

        CHECK(fx.orch.render() == pt::SurfaceStatus::Ok);
        CHECK(fx.device.dispatches.empty());
        CHECK(fx.device.presents == 0);
        CHECK(fx.orch.counters().frame == 0);
        CHECK(fx.orch.accumulation().parity() == 0);
    }

    TEST_CASE("N renders give sample count N and flip parity each time") {
        Fixture fx;
        fx.orch.consumeRedrawRequest();

        for (std::uint32_t n = 1; n <= 5; ++n) {
            const std::uint32_t parityBefore = fx.orch.accumulation().parity();
            CHECK(fx.orch.render() == pt::SurfaceStatus::Ok);
            CHECK(fx.orch.accumulation().parity() == (parityBefore ^ 1u));
            CHECK(fx.orch.counters().samples == n);
            CHECK(fx.orch.counters().frame == n);
            CHECK(fx.orch.consumeRedrawRequest());
        }
        CHECK(fx.device.presents == 5);
        CHECK(fx.device.blits == 5);
    }

    TEST_CASE("each dispatch reads the image the previous one wrote") {
        Fixture fx;
        fx.orch.render();
        fx.orch.render();
        REQUIRE(fx.device.dispatches.size() == 2);

        const pt::ComputeDispatch& a = fx.device.dispatches[0];
        const pt::ComputeDispatch& b = fx.device.dispatches[1];
        CHECK(a.accumulationRead != a.accumulationWrite);
        CHECK(b.accumulationRead != b.accumulationWrite);
        CHECK(b.accumulationRead == a.accumulationWrite);
        CHECK(b.accumulationWrite == a.accumulationRead);
    }

    TEST_CASE("seed and sample count uniforms carry the pre-increment counters") {
        Fixture fx;
        fx.orch.render();
        fx.orch.render();

        const pt::ComputeDispatch& d = fx.device.dispatches.back();
        CHECK(fx.device.readU32(d.randomSeed) == 1);
        CHECK(fx.device.readU32(d.sampleCount) == 1);
        CHECK(d.displayOutput == fx.orch.renderTarget());
    }

    TEST_CASE("failed surface acquire skips blit and leaves counters alone") {
        Fixture fx;
        fx.orch.render();
        fx.device.statusQueue.push_back(pt::SurfaceStatus::Timeout);

        CHECK(fx.orch.render() == pt::SurfaceStatus::Timeout);
        CHECK(fx.orch.counters().samples == 1);
        CHECK(fx.orch.counters().frame == 1);
        CHECK(fx.orch.counters().skippedFrames == 1);
        CHECK(fx.device.presents == 1);
        // The dispatch already ran, so parity moved on.
        CHECK(fx.orch.accumulation().parity() == 0);
    }

    TEST_CASE("outdated surface recovers through resize") {
        Fixture fx;
        fx.orch.render();
        fx.device.statusQueue.push_back(pt::SurfaceStatus::Outdated);
        CHECK(fx.orch.render() == pt::SurfaceStatus::Outdated);

        fx.orch.resize(120, 80);
        CHECK(fx.orch.counters().samples == 0);
        CHECK(fx.orch.render() == pt::SurfaceStatus::Ok);
        CHECK(fx.orch.counters().samples == 1);
        CHECK(fx.device.surfaceWidth == 120);
        CHECK(fx.device.surfaceHeight == 80);
    }

    TEST_CASE("zero-sized resize leaves everything unchanged") {
        Fixture fx;
        fx.orch.render();
        fx.orch.render();
        fx.orch.render();

        const auto images = fx.orch.accumulation().images();
        const pt::TextureHandle target = fx.orch.renderTarget();
        const int configures = fx.device.configureCalls;
        const std::uint32_t parity = fx.orch.accumulation().parity();

        fx.orch.resize(0, 50);
        fx.orch.resize(100, 0);
        fx.orch.resize(0, 0);

        CHECK(fx.device.configureCalls == configures);
        CHECK(fx.orch.accumulation().images() == images);
        CHECK(fx.orch.renderTarget() == target);
        CHECK(fx.orch.counters().samples == 3);
        CHECK(fx.orch.accumulation().parity() == parity);
        CHECK(fx.orch.width() == 100);
        CHECK(fx.orch.height() == 50);
    }

    TEST_CASE("resize rebuilds textures, resets parity and samples") {
        Fixture fx;
        fx.orch.render();
        REQUIRE(fx.orch.accumulation().parity() == 1);
        const pt::TextureHandle oldTarget = fx.orch.renderTarget();

        fx.orch.resize(64, 48);

        CHECK(fx.orch.accumulation().parity() == 0);
        CHECK(fx.orch.counters().samples == 0);
        CHECK_FALSE(fx.device.isLive(oldTarget));
        CHECK(fx.device.displaySource == fx.orch.renderTarget());
        CHECK(fx.device.liveTextures[fx.orch.renderTarget().id].width == 64);
        CHECK(fx.device.liveTextures[fx.orch.accumulation().images()[0].id].height == 48);
        // Render target plus two accumulation images.
        CHECK(fx.device.liveTextures.size() == 3);
    }

    TEST_CASE("movement invalidates exactly once per update") {
        Fixture fx;
        fx.orch.render();
        fx.orch.render();

        fx.orch.handleKey(plat::Key::W, true);
        fx.orch.handleKey(plat::Key::D, true);
        const auto before = fx.orch.counters().invalidations;
        fx.orch.update(0.5f);

        CHECK(fx.orch.counters().invalidations == before + 1);
        CHECK(fx.orch.counters().samples == 0);
        CHECK(fx.orch.camera().position.y == doctest::Approx(1.0f));
    }

    TEST_CASE("idle update does not invalidate") {
        Fixture fx;
        fx.orch.render();
        fx.orch.update(0.016f);
        CHECK(fx.orch.counters().samples == 1);
        CHECK(fx.orch.counters().invalidations == 0);
    }

    TEST_CASE("update writes the camera uniform with the current aspect ratio") {
        Fixture fx;
        fx.orch.update(0.016f);
        fx.orch.render();

        const pt::BufferHandle cameraBuf = fx.device.dispatches.back().camera;
        const auto& bytes = fx.device.buffers[cameraBuf.id];
        REQUIRE(bytes.size() == sizeof(pt::GpuCamera));
        pt::GpuCamera g{};
        std::memcpy(&g, bytes.data(), sizeof(g));
        CHECK(g.aspectRatio == doctest::Approx(2.0f));
        CHECK(g.focalDistance == doctest::Approx(4.0f));
    }

    TEST_CASE("focal distance keys change focus and invalidate") {
        Fixture fx;
        fx.orch.render();

        fx.orch.handleKey(plat::Key::Up, true);
        CHECK(fx.orch.camera().focalDistance == doctest::Approx(4.02f));
        CHECK(fx.orch.counters().samples == 0);

        fx.orch.render();
        fx.orch.handleKey(plat::Key::Down, true);
        fx.orch.handleKey(plat::Key::Down, true);
        CHECK(fx.orch.camera().focalDistance == doctest::Approx(3.98f));
        CHECK(fx.orch.counters().samples == 0);
        CHECK(fx.orch.counters().invalidations == 3);
    }

    // Aperture changes deliberately keep the accumulated image; this pins that asymmetry.
    TEST_CASE("aperture keys change the lens without invalidating") {
        Fixture fx;
        fx.orch.render();
        fx.orch.render();

        fx.orch.handleKey(plat::Key::Left, true);
        CHECK(fx.orch.camera().apertureRadius == doctest::Approx(0.07f));
        fx.orch.handleKey(plat::Key::Right, true);
        fx.orch.handleKey(plat::Key::Right, true);
        CHECK(fx.orch.camera().apertureRadius == doctest::Approx(0.03f));

        CHECK(fx.orch.counters().samples == 2);
        CHECK(fx.orch.counters().invalidations == 0);
    }

    TEST_CASE("escape requests quit, other keys do not") {
        Fixture fx;
        CHECK(fx.orch.handleKey(plat::Key::Escape, true));
        CHECK_FALSE(fx.orch.handleKey(plat::Key::Escape, false));
        CHECK_FALSE(fx.orch.handleKey(plat::Key::W, true));
    }

    TEST_CASE("mouse motion turns the camera and invalidates") {
        Fixture fx;
        fx.orch.render();

        fx.orch.handleMouseMotion(10.0f, 0.0f);
        CHECK(fx.orch.counters().samples == 0);
        fx.orch.update(0.016f);
        // Dragging right turns toward +X.
        CHECK(fx.orch.camera().yaw > 0.0f);
        CHECK(fx.orch.camera().forward.x > 0.0f);
    }

    TEST_CASE("a burst of mouse motion reallocates the accumulation images once") {
        Fixture fx;
        fx.orch.render();
        const auto old = fx.orch.accumulation().images();
        const int created = fx.device.texturesCreated;

        for (int i = 0; i < 50; ++i)
            fx.orch.handleMouseMotion(1.0f, 1.0f);

        CHECK(fx.orch.counters().samples == 0);
        CHECK(fx.device.texturesCreated == created);

        fx.orch.update(0.016f);
        fx.orch.render();

        CHECK(fx.device.texturesCreated == created + 2);
        CHECK_FALSE(fx.device.isLive(old[0]));
        CHECK_FALSE(fx.device.isLive(old[1]));
        const pt::ComputeDispatch& d = fx.device.dispatches.back();
        CHECK(fx.device.isLive(d.accumulationRead));
        CHECK(fx.device.isLive(d.accumulationWrite));
        CHECK(fx.orch.counters().samples == 1);
    }

    TEST_CASE("textures are created with their usage") {
        Fixture fx;
        CHECK(fx.device.liveTextures[fx.orch.renderTarget().id].usage == pt::TextureUsage::RenderTarget);
        for (const pt::TextureHandle& img : fx.orch.accumulation().images())
            CHECK(fx.device.liveTextures[img.id].usage == pt::TextureUsage::Accumulation);
    }

    TEST_CASE("lock key freezes movement and look") {
        Fixture fx;
        fx.orch.handleKey(plat::Key::L, true);
        fx.orch.handleKey(plat::Key::L, false);
        REQUIRE(fx.orch.input().locked());

        fx.orch.render();
        fx.orch.handleKey(plat::Key::W, true);
        fx.orch.handleMouseMotion(50.0f, 50.0f);
        fx.orch.update(1.0f);

        CHECK(fx.orch.camera().position.y == doctest::Approx(0.0f));
        CHECK(fx.orch.camera().yaw == doctest::Approx(0.0f));
        CHECK(fx.orch.camera().pitch == doctest::Approx(0.0f));
        CHECK(fx.orch.counters().samples == 1);

        // Key repeat does not toggle the lock back.
        fx.orch.handleKey(plat::Key::L, true, true);
        CHECK(fx.orch.input().locked());

        fx.orch.handleKey(plat::Key::L, true);
        CHECK_FALSE(fx.orch.input().locked());
        fx.orch.update(0.5f);
        CHECK(fx.orch.camera().position.y == doctest::Approx(1.0f));
    }

    TEST_CASE("destruction releases every resource") {
        FakeGpuDevice device;
        {
            pt::FrameOrchestrator orch(device);
            orch.initialize(makeScene(), 32, 32);
            orch.resize(32, 32);
            orch.render();
            CHECK_FALSE(device.buffers.empty());
        }
        CHECK(device.liveTextures.empty());
        CHECK(device.buffers.empty());
    }
}
