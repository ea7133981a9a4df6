#include <gtest/gtest.h>

#include <glint/core/log.h>
#include <glint/raymarch/distance_field.h>
#include <glint/raymarch/ray_marcher.h>
#include <glint/raymarch/surface_shader.h>
#include <glint/scene/scene_store.h>

using namespace glint;

class SurfaceShaderTest : public ::testing::Test {
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

TEST_F(SurfaceShaderTest, RedSphereShadesDarkenedRed) {
    DistanceField field(store);
    RayMarcher marcher(field);
    SurfaceShader shader(field, ShadingSettings{});

    Ray ray{ { 0.0f, 0.0f, 5.0f }, { 0.0f, 0.0f, -1.0f } };
    HitResult hit = marcher.march(ray);
    ASSERT_TRUE(hit.hit);
    EXPECT_EQ(hit.surface, SurfaceRef::of({ PrimitiveType::Sphere, 0 }));

    glm::vec3 c = shader.shade(hit, ray, 0.5f);
    EXPECT_GT(c.r, c.g);
    EXPECT_GT(c.r, c.b);
    EXPECT_LT(c.r, 1.0f);

    glm::vec3 sky = glm::pow(shader.sky(0.5f), glm::vec3(1.0f / 2.2f));
    EXPECT_GT(glm::length(c - sky), 0.1f);
}

TEST_F(SurfaceShaderTest, MissReturnsGammaCorrectedSky) {
    DistanceField field(store);
    RayMarcher marcher(field);
    ShadingSettings settings;
    SurfaceShader shader(field, settings);

    Ray ray{ { 0.0f, 0.0f, 5.0f }, { 0.0f, 1.0f, 0.0f } };
    HitResult hit = marcher.march(ray);
    ASSERT_FALSE(hit.hit);

    glm::vec3 c = shader.shade(hit, ray, 1.0f);
    glm::vec3 expected = glm::pow(settings.skyTop, glm::vec3(1.0f / settings.gamma));
    EXPECT_NEAR(c.r, expected.r, 1e-5f);
    EXPECT_NEAR(c.g, expected.g, 1e-5f);
    EXPECT_NEAR(c.b, expected.b, 1e-5f);
}

TEST_F(SurfaceShaderTest, GroundUnderSphereIsOccluded) {
    DistanceField field(store);
    SurfaceShader shader(field, ShadingSettings{});

    EXPECT_TRUE(shader.isOccluded({ -0.4f, -1.0f, 0.4f }, { 0.0f, 1.0f, 0.0f }));
    EXPECT_FALSE(shader.isOccluded({ 3.0f, -1.0f, -3.0f }, { 0.0f, 1.0f, 0.0f }));
}

TEST_F(SurfaceShaderTest, ShadowRayOutOfStepsIsOccluded) {
    DistanceField field(store);

    // One step from just above the ground only covers the offset, nowhere near the light
    ShadingSettings starved;
    starved.shadowSteps = 1;
    SurfaceShader shader(field, starved);
    EXPECT_TRUE(shader.isOccluded({ 3.0f, -1.0f, -3.0f }, { 0.0f, 1.0f, 0.0f }));

    ShadingSettings enough;
    SurfaceShader full(field, enough);
    EXPECT_FALSE(full.isOccluded({ 3.0f, -1.0f, -3.0f }, { 0.0f, 1.0f, 0.0f }));
}

TEST_F(SurfaceShaderTest, ShadowDarkensGroundButNotToBlack) {
    DistanceField field(store);
    RayMarcher marcher(field);

    ShadingSettings lit;
    lit.shadows = false;
    ShadingSettings shadowed;

    SurfaceShader litShader(field, lit);
    SurfaceShader shadowShader(field, shadowed);

    // Straight down beside the sphere onto the shadowed patch
    Ray ray{ { -0.4f, 2.0f, 0.4f }, { 0.0f, -1.0f, 0.0f } };
    HitResult hit = marcher.march(ray);
    ASSERT_TRUE(hit.hit);
    ASSERT_EQ(hit.surface, SurfaceRef::plane());

    glm::vec3 a = litShader.shade(hit, ray, 0.3f);
    glm::vec3 b = shadowShader.shade(hit, ray, 0.3f);
    EXPECT_LT(b.r, a.r);
    EXPECT_GT(b.r, 0.0f);
}

TEST_F(SurfaceShaderTest, AlbedoFollowsSurfaceKind) {
    DistanceField field(store);
    SurfaceShader shader(field, ShadingSettings{});

    HitResult ground;
    ground.hit = true;
    ground.surface = SurfaceRef::plane();
    EXPECT_EQ(shader.albedo(ground, { 0.5f, -1.0f, 0.5f }), DistanceField::groundAlbedo({ 0.5f, -1.0f, 0.5f }));

    HitResult primitive;
    primitive.hit = true;
    primitive.surface = SurfaceRef::of({ PrimitiveType::Sphere, 0 });
    primitive.color = { 0.2f, 0.4f, 0.6f };
    EXPECT_EQ(shader.albedo(primitive, glm::vec3(0.0f)), primitive.color);
}

TEST_F(SurfaceShaderTest, FogPullsDistantHitsTowardSky) {
    DistanceField field(store);
    ShadingSettings noFog;
    noFog.fogDensity = 0.0f;
    ShadingSettings thickFog;
    thickFog.fogDensity = 1.0f;

    HitResult far;
    far.hit = true;
    far.t = 40.0f;
    far.surface = SurfaceRef::plane();
    Ray ray{ { 0.0f, 0.0f, 5.0f }, glm::normalize(glm::vec3(0.0f, -1.0f / 40.0f, -1.0f)) };

    SurfaceShader foggy(field, thickFog);
    glm::vec3 c = foggy.shade(far, ray, 0.2f);
    glm::vec3 sky = glm::pow(foggy.sky(0.2f), glm::vec3(1.0f / thickFog.gamma));
    EXPECT_NEAR(glm::length(c - sky), 0.0f, 1e-3f);

    SurfaceShader clear(field, noFog);
    EXPECT_GT(glm::length(clear.shade(far, ray, 0.2f) - sky), 0.05f);
}
