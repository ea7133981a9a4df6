#include <gtest/gtest.h>

#include <glint/core/camera.h>
#include <glint/core/log.h>
#include <glint/raymarch/offline_render.h>
#include <glint/scene/scene_store.h>

using namespace glint;

class OfflineRenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::setEcho(false);
        settings.width = 64;
        settings.height = 48;
    }

    void addCenterSphere() {
        Sphere s;
        s.center = { 0.0f, 0.0f, 1.0f };
        s.radius = 0.5f;
        s.color = { 1.0f, 0.0f, 0.0f };
        store.addSphere(s);
    }

    SceneStore store;
    Camera camera;
    OfflineSettings settings;
};

TEST_F(OfflineRenderTest, ProducesFrameAndCenterPick) {
    addCenterSphere();

    OfflineFrame frame = renderOffline(store, camera, settings);
    EXPECT_EQ(frame.width, 64u);
    EXPECT_EQ(frame.height, 48u);
    ASSERT_EQ(frame.pixels.size(), 64u * 48u * 4u);
    EXPECT_GT(frame.averageSteps, 0.0f);

    ASSERT_TRUE(frame.centerObject.has_value());
    EXPECT_EQ(*frame.centerObject, (PrimitiveRef{ PrimitiveType::Sphere, 0 }));

    const uint8_t* center = &frame.pixels[(24u * 64u + 32u) * 4u];
    EXPECT_GT(center[0], center[2]);
}

TEST_F(OfflineRenderTest, EmptySceneHasNothingAtCenter) {
    OfflineFrame frame = renderOffline(store, camera, settings);
    EXPECT_FALSE(frame.pixels.empty());
    EXPECT_FALSE(frame.centerObject.has_value());
}

TEST_F(OfflineRenderTest, ZeroSizeIsRejected) {
    Log::clear();
    settings.width = 0;

    OfflineFrame frame = renderOffline(store, camera, settings);
    EXPECT_TRUE(frame.pixels.empty());
    EXPECT_EQ(Log::countAtLevel(Log::Level::Error), 1u);
}
