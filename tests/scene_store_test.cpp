#include <gtest/gtest.h>

#include <glint/core/log.h>
#include <glint/scene/scene_store.h>

using namespace glint;

class SceneStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::setEcho(false);
        Log::clear();
    }

    SceneStore store;
};

TEST_F(SceneStoreTest, AddReturnsConsecutiveSlots) {
    EXPECT_EQ(store.addPrimitive(PrimitiveType::Sphere), 0);
    EXPECT_EQ(store.addPrimitive(PrimitiveType::Sphere), 1);
    EXPECT_EQ(store.addPrimitive(PrimitiveType::Box), 0);
    EXPECT_EQ(store.count(PrimitiveType::Sphere), 2);
    EXPECT_EQ(store.count(PrimitiveType::Box), 1);
    EXPECT_EQ(store.count(PrimitiveType::Torus), 0);
    EXPECT_EQ(store.totalCount(), 3);
}

TEST_F(SceneStoreTest, DefaultAddsDoNotOverlap) {
    store.addPrimitive(PrimitiveType::Sphere);
    store.addPrimitive(PrimitiveType::Sphere);
    auto a = store.getPosition({ PrimitiveType::Sphere, 0 });
    auto b = store.getPosition({ PrimitiveType::Sphere, 1 });
    ASSERT_TRUE(a && b);
    EXPECT_GT(glm::length(*a - *b), 2.0f * Sphere{}.radius);
}

TEST_F(SceneStoreTest, CapacityOverflowIsRejected) {
    for (int i = 0; i < PRIMITIVE_CAPACITY; ++i)
        ASSERT_EQ(store.addPrimitive(PrimitiveType::Torus), i);

    EXPECT_TRUE(store.isFull(PrimitiveType::Torus));
    uint64_t revision = store.revision();
    EXPECT_EQ(store.addPrimitive(PrimitiveType::Torus), -1);
    EXPECT_EQ(store.count(PrimitiveType::Torus), PRIMITIVE_CAPACITY);
    EXPECT_EQ(store.revision(), revision);
    EXPECT_EQ(Log::countAtLevel(Log::Level::Warn), 1u);
}

TEST_F(SceneStoreTest, RemoveCompactsLaterSlots) {
    for (int i = 0; i < 3; ++i) {
        Sphere s;
        s.center = { static_cast<float>(i), 0.0f, 0.0f };
        store.addSphere(s);
    }

    EXPECT_TRUE(store.removePrimitive(PrimitiveType::Sphere, 0));
    ASSERT_EQ(store.count(PrimitiveType::Sphere), 2);
    EXPECT_FLOAT_EQ(store.getSpheres()[0].center.x, 1.0f);
    EXPECT_FLOAT_EQ(store.getSpheres()[1].center.x, 2.0f);
    EXPECT_FALSE(store.isValid({ PrimitiveType::Sphere, 2 }));
}

TEST_F(SceneStoreTest, RemoveOfInactiveSlotFails) {
    store.addPrimitive(PrimitiveType::Box);
    EXPECT_FALSE(store.removePrimitive(PrimitiveType::Box, 1));
    EXPECT_FALSE(store.removePrimitive(PrimitiveType::Box, -1));
    EXPECT_FALSE(store.removePrimitive(PrimitiveType::Sphere, 0));
    EXPECT_EQ(store.count(PrimitiveType::Box), 1);
}

TEST_F(SceneStoreTest, SetParamWritesField) {
    store.addPrimitive(PrimitiveType::Sphere);
    EXPECT_TRUE(store.setParam(PrimitiveType::Sphere, 0, PrimitiveParam::Radius, 1.25f));
    EXPECT_FLOAT_EQ(store.getSpheres()[0].radius, 1.25f);

    EXPECT_TRUE(store.setParam(PrimitiveType::Sphere, 0, PrimitiveParam::BlendMode, 1.0f));
    EXPECT_EQ(store.getSpheres()[0].blendMode, BlendMode::SmoothUnion);

    auto value = store.getParam(PrimitiveType::Sphere, 0, PrimitiveParam::Radius);
    ASSERT_TRUE(value.has_value());
    EXPECT_FLOAT_EQ(*value, 1.25f);
}

TEST_F(SceneStoreTest, NonPositiveBlendStrengthIsRejected) {
    store.addPrimitive(PrimitiveType::Sphere);
    uint64_t revision = store.revision();

    EXPECT_FALSE(store.setParam(PrimitiveType::Sphere, 0, PrimitiveParam::BlendStrength, 0.0f));
    EXPECT_FALSE(store.setParam(PrimitiveType::Sphere, 0, PrimitiveParam::BlendStrength, -0.2f));
    EXPECT_FLOAT_EQ(store.getSpheres()[0].blendStrength, Sphere{}.blendStrength);
    EXPECT_EQ(store.revision(), revision);
    EXPECT_GE(Log::countAtLevel(Log::Level::Error), 2u);
}

TEST_F(SceneStoreTest, InvalidSizesAreRejected) {
    Sphere s;
    s.radius = 0.0f;
    EXPECT_EQ(store.addSphere(s), -1);

    Box b;
    b.halfExtents = { 0.5f, -0.1f, 0.5f };
    EXPECT_EQ(store.addBox(b), -1);

    Torus t;
    t.majorRadius = 0.3f;
    t.minorRadius = 0.3f;
    EXPECT_EQ(store.addTorus(t), -1);

    EXPECT_EQ(store.totalCount(), 0);
}

TEST_F(SceneStoreTest, UnknownBlendModeAndForeignFieldAreRejected) {
    store.addPrimitive(PrimitiveType::Box);
    EXPECT_FALSE(store.setParam(PrimitiveType::Box, 0, PrimitiveParam::BlendMode, 7.0f));
    EXPECT_FALSE(store.setParam(PrimitiveType::Box, 0, PrimitiveParam::BlendMode, 1.5f));
    EXPECT_FALSE(store.setParam(PrimitiveType::Box, 0, PrimitiveParam::Radius, 1.0f));
    EXPECT_FALSE(store.getParam(PrimitiveType::Box, 0, PrimitiveParam::MajorRadius).has_value());
}

TEST_F(SceneStoreTest, ColorOutsideUnitRangeIsRejected) {
    store.addPrimitive(PrimitiveType::Torus);
    EXPECT_FALSE(store.setParam(PrimitiveType::Torus, 0, PrimitiveParam::ColorG, 1.5f));
    EXPECT_TRUE(store.setParam(PrimitiveType::Torus, 0, PrimitiveParam::ColorG, 1.0f));
}

TEST_F(SceneStoreTest, SetPositionMovesCenter) {
    store.addPrimitive(PrimitiveType::Box);
    PrimitiveRef ref{ PrimitiveType::Box, 0 };
    EXPECT_TRUE(store.setPosition(ref, { 1.0f, 2.0f, 3.0f }));

    auto pos = store.getPosition(ref);
    ASSERT_TRUE(pos.has_value());
    EXPECT_FLOAT_EQ(pos->y, 2.0f);

    EXPECT_FALSE(store.setPosition({ PrimitiveType::Box, 4 }, glm::vec3(0.0f)));
    EXPECT_FALSE(store.getPosition({ PrimitiveType::Box, 4 }).has_value());
}

TEST_F(SceneStoreTest, RevisionMovesOnEveryAcceptedMutation) {
    uint64_t r0 = store.revision();
    store.addPrimitive(PrimitiveType::Sphere);
    uint64_t r1 = store.revision();
    store.setParam(PrimitiveType::Sphere, 0, PrimitiveParam::CenterX, 0.5f);
    uint64_t r2 = store.revision();
    store.removePrimitive(PrimitiveType::Sphere, 0);
    uint64_t r3 = store.revision();

    EXPECT_LT(r0, r1);
    EXPECT_LT(r1, r2);
    EXPECT_LT(r2, r3);
}
