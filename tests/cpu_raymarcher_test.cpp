#include <gtest/gtest.h>

#include <glint/core/camera.h>
#include <glint/core/log.h>
#include <glint/raymarch/cpu_raymarcher.h>
#include <glint/scene/scene_store.h>

#include <mutex>
#include <vector>

using namespace glint;

TEST(ParallelRowsTest, CoversEveryRowOnce) {
    const uint32_t height = 37;
    std::vector<int> visits(height, 0);
    std::mutex mutex;

    parallelRows(height, [&](uint32_t start, uint32_t end) {
        std::lock_guard<std::mutex> lock(mutex);
        for (uint32_t y = start; y < end; ++y)
            ++visits[y];
    });

    for (uint32_t y = 0; y < height; ++y)
        EXPECT_EQ(visits[y], 1) << "row " << y;
}

TEST(ParallelRowsTest, ZeroHeightRunsNothing) {
    bool called = false;
    parallelRows(0, [&](uint32_t, uint32_t) { called = true; });
    EXPECT_FALSE(called);
}

class CPURaymarcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::setEcho(false);

        Sphere s;
        s.center = { 0.0f, 0.0f, 1.0f };
        s.radius = 0.5f;
        s.color = { 1.0f, 0.0f, 0.0f };
        store.addSphere(s);

        raymarcher.resize(64, 48);
    }

    const uint8_t* pixel(uint32_t x, uint32_t y) const {
        return &raymarcher.getPixelBuffer()[(static_cast<size_t>(y) * raymarcher.getWidth() + x) * 4];
    }

    SceneStore store;
    Camera camera;
    CPURaymarcher raymarcher;
};

TEST_F(CPURaymarcherTest, BufferMatchesSize) {
    EXPECT_EQ(raymarcher.getPixelBuffer().size(), 64u * 48u * 4u);
    raymarcher.resize(10, 5);
    EXPECT_EQ(raymarcher.getPixelBuffer().size(), 10u * 5u * 4u);
}

TEST_F(CPURaymarcherTest, CenterIsRedAndTopRowIsSky) {
    raymarcher.render(store, camera);

    const uint8_t* center = pixel(32, 24);
    EXPECT_GT(center[0], center[1]);
    EXPECT_GT(center[0], center[2]);
    EXPECT_EQ(center[3], 255);

    // Rows are stored top-down: row 0 looks up into the sky
    const uint8_t* top = pixel(32, 0);
    EXPECT_GT(top[2], top[0]);
    EXPECT_EQ(top[3], 255);

    EXPECT_GT(raymarcher.getAverageSteps(), 0.0f);
    EXPECT_GE(raymarcher.getLastRenderMs(), 0.0f);
}

TEST_F(CPURaymarcherTest, SettingsChangeTheImage) {
    raymarcher.render(store, camera);
    std::vector<uint8_t> before = raymarcher.getPixelBuffer();

    ShadingSettings settings;
    settings.ambient = 0.8f;
    raymarcher.setShadingSettings(settings);
    raymarcher.render(store, camera);

    EXPECT_NE(before, raymarcher.getPixelBuffer());
    EXPECT_FLOAT_EQ(raymarcher.getShadingSettings().ambient, 0.8f);
}
