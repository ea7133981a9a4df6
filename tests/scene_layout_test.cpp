#include <gtest/gtest.h>

#include <glint/core/log.h>
#include <glint/scene/scene_layout.h>
#include <glint/scene/scene_store.h>

#include <cstring>

using namespace glint;

TEST(SceneLayoutTest, BufferIsFixedSize) {
    EXPECT_EQ(sizeof(GPUScene), 1456u);
    EXPECT_EQ(offsetof(GPUScene, boxes), 496u);
    EXPECT_EQ(offsetof(GPUScene, tori), 976u);
}

TEST(SceneLayoutTest, PacksCountsAndActivePrefix) {
    Log::setEcho(false);
    SceneStore store;

    Sphere s;
    s.center = { 0.0f, 0.0f, 1.0f };
    s.radius = 0.5f;
    s.color = { 1.0f, 0.0f, 0.0f };
    s.blendMode = BlendMode::SmoothUnion;
    s.blendStrength = 0.25f;
    store.addSphere(s);

    Torus t;
    t.majorRadius = 0.8f;
    t.minorRadius = 0.1f;
    t.blendMode = BlendMode::Xor;
    store.addTorus(t);

    GPUScene gpu = packScene(store);
    EXPECT_EQ(gpu.header.numSpheres, 1u);
    EXPECT_EQ(gpu.header.numBoxes, 0u);
    EXPECT_EQ(gpu.header.numTori, 1u);

    EXPECT_FLOAT_EQ(gpu.spheres[0].center.z, 1.0f);
    EXPECT_FLOAT_EQ(gpu.spheres[0].radius, 0.5f);
    EXPECT_EQ(gpu.spheres[0].blendMode, 1u);
    EXPECT_FLOAT_EQ(gpu.spheres[0].blendStrength, 0.25f);

    EXPECT_FLOAT_EQ(gpu.tori[0].radii.x, 0.8f);
    EXPECT_FLOAT_EQ(gpu.tori[0].radii.y, 0.1f);
    EXPECT_EQ(gpu.tori[0].blendMode, 4u);
}

TEST(SceneLayoutTest, InactiveSlotsAreZeroed) {
    SceneStore store;
    store.addPrimitive(PrimitiveType::Box);

    GPUScene gpu = packScene(store);
    GPUBox zero{};
    EXPECT_EQ(std::memcmp(&gpu.boxes[1], &zero, sizeof(GPUBox)), 0);
    EXPECT_EQ(gpu.header.reserved, 0u);
}

TEST(SceneLayoutTest, FieldOffsetsMatchStd430) {
    // Little-endian word view of one packed box record
    SceneStore store;
    Box b;
    b.center = { 1.0f, 2.0f, 3.0f };
    b.halfExtents = { 0.1f, 0.2f, 0.3f };
    b.color = { 0.4f, 0.5f, 0.6f };
    b.blendMode = BlendMode::Intersect;
    b.blendStrength = 0.7f;
    store.addBox(b);

    GPUScene gpu = packScene(store);
    const auto* bytes = reinterpret_cast<const unsigned char*>(&gpu) + offsetof(GPUScene, boxes);

    float f[12];
    std::memcpy(f, bytes, sizeof(f));
    uint32_t mode;
    std::memcpy(&mode, bytes + 12, sizeof(mode));

    EXPECT_FLOAT_EQ(f[0], 1.0f);
    EXPECT_EQ(mode, 3u);
    EXPECT_FLOAT_EQ(f[4], 0.1f);
    EXPECT_FLOAT_EQ(f[6], 0.3f);
    EXPECT_FLOAT_EQ(f[7], 0.7f);
    EXPECT_FLOAT_EQ(f[8], 0.4f);
    EXPECT_FLOAT_EQ(f[10], 0.6f);
}
