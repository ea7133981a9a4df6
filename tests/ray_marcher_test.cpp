#include <gtest/gtest.h>

#include <glint/core/log.h>
#include <glint/raymarch/distance_field.h>
#include <glint/raymarch/ray_marcher.h>
#include <glint/scene/scene_store.h>

using namespace glint;

class RayMarcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::setEcho(false);

        Sphere s;
        s.center = { 0.0f, 0.0f, 1.0f };
        s.radius = 0.5f;
        s.color = { 1.0f, 0.0f, 0.0f };
        store.addSphere(s);
    }

    SceneStore store;
};

TEST_F(RayMarcherTest, HitsSphereAtExpectedDistance) {
    DistanceField field(store);
    RayMarcher marcher(field);

    HitResult hit = marcher.march({ 0.0f, 0.0f, 5.0f }, { 0.0f, 0.0f, -1.0f });
    ASSERT_TRUE(hit.hit);
    EXPECT_NEAR(hit.t, 3.5f, marcher.getSettings().surfDist);
    EXPECT_EQ(hit.surface, SurfaceRef::of({ PrimitiveType::Sphere, 0 }));
    EXPECT_EQ(hit.color, glm::vec3(1.0f, 0.0f, 0.0f));
}

TEST_F(RayMarcherTest, HitDistanceIsDMinusRFromAnyDirection) {
    store.clear();
    Sphere s;
    s.center = { 0.0f, 2.0f, 0.0f };
    s.radius = 0.75f;
    store.addSphere(s);

    DistanceField field(store);
    RayMarcher marcher(field);

    const glm::vec3 dirs[] = {
        { 1.0f, 0.0f, 0.0f }, { 0.0f, 1.0f, 0.0f }, { 0.0f, 0.0f, -1.0f },
        glm::normalize(glm::vec3(1.0f, 1.0f, 1.0f)), glm::normalize(glm::vec3(-2.0f, 0.5f, 1.0f))
    };
    const float d = 4.0f;
    for (const glm::vec3& dir : dirs) {
        glm::vec3 origin = s.center - dir * d;
        if (origin.y < DistanceField::GROUND_HEIGHT + 0.1f)
            continue;
        HitResult hit = marcher.march(origin, dir);
        ASSERT_TRUE(hit.hit);
        EXPECT_NEAR(hit.t, d - s.radius, marcher.getSettings().surfDist);
    }
}

TEST_F(RayMarcherTest, UpwardRayMissesWithinBudget) {
    DistanceField field(store);
    RayMarcher marcher(field);

    HitResult hit = marcher.march({ 0.0f, 0.0f, 5.0f }, { 0.0f, 1.0f, 0.0f });
    EXPECT_FALSE(hit.hit);
    EXPECT_EQ(hit.surface, SurfaceRef::none());
    EXPECT_LE(hit.steps, marcher.getSettings().maxSteps);
    EXPECT_GT(hit.t, marcher.getSettings().maxDist);
}

TEST_F(RayMarcherTest, StepCapEndsInMiss) {
    DistanceField field(store);
    MarchSettings settings;
    settings.maxSteps = 3;
    RayMarcher marcher(field, settings);

    // The ground keeps every step at 1 unit, far short of the sphere
    HitResult hit = marcher.march({ 0.0f, 0.0f, 50.0f }, { 0.0f, 0.0f, -1.0f });
    EXPECT_FALSE(hit.hit);
    EXPECT_EQ(hit.steps, 3);
}

TEST_F(RayMarcherTest, DownwardRayHitsGround) {
    DistanceField field(store);
    RayMarcher marcher(field);

    HitResult hit = marcher.march({ 3.0f, 2.0f, 0.0f }, { 0.0f, -1.0f, 0.0f });
    ASSERT_TRUE(hit.hit);
    EXPECT_NEAR(hit.t, 3.0f, 1e-3f);
    EXPECT_EQ(hit.surface, SurfaceRef::plane());
}

TEST(MarchSettingsTest, PickingUsesCoarserBudget) {
    MarchSettings shading;
    MarchSettings picking = MarchSettings::picking();
    EXPECT_EQ(shading.maxSteps, 256);
    EXPECT_EQ(picking.maxSteps, 128);
    EXPECT_FLOAT_EQ(picking.surfDist, shading.surfDist);
    EXPECT_FLOAT_EQ(picking.maxDist, shading.maxDist);
}
