#include <gtest/gtest.h>

#include <glint/scene/object_id.h>

#include <cmath>

using namespace glint;

TEST(ObjectIdTest, RoundTripsEverySlotThroughUnormChannel) {
    for (int t = 0; t < PRIMITIVE_TYPE_COUNT; ++t) {
        for (int slot = 0; slot < PRIMITIVE_CAPACITY; ++slot) {
            PrimitiveRef ref{ static_cast<PrimitiveType>(t), slot };
            uint32_t id = ObjectId::encode(ref);
            ASSERT_GE(id, 1u);
            ASSERT_LE(id, ObjectId::MAX);

            // What an 8-bit unorm render target stores and a readback returns
            uint8_t stored = static_cast<uint8_t>(std::lround(ObjectId::toUnorm(id) * 255.0f));
            uint32_t decodedId = ObjectId::fromUnorm(static_cast<float>(stored) / 255.0f);
            EXPECT_EQ(decodedId, id);

            auto decoded = ObjectId::decode(decodedId);
            ASSERT_TRUE(decoded.has_value());
            EXPECT_EQ(*decoded, ref);
        }
    }
}

TEST(ObjectIdTest, FirstSphereIsOne) {
    EXPECT_EQ(ObjectId::encode({ PrimitiveType::Sphere, 0 }), 1u);
    EXPECT_EQ(ObjectId::encode({ PrimitiveType::Box, 0 }), 11u);
    EXPECT_EQ(ObjectId::encode({ PrimitiveType::Torus, 9 }), 30u);
}

TEST(ObjectIdTest, ZeroAndOutOfRangeDecodeToNothing) {
    EXPECT_FALSE(ObjectId::decode(ObjectId::NONE).has_value());
    EXPECT_FALSE(ObjectId::decode(ObjectId::MAX + 1).has_value());
    EXPECT_FALSE(ObjectId::decode(255).has_value());
}

TEST(ObjectIdTest, SlotOutsideCapacityEncodesAsNone) {
    EXPECT_EQ(ObjectId::encode({ PrimitiveType::Sphere, -1 }), ObjectId::NONE);
    EXPECT_EQ(ObjectId::encode({ PrimitiveType::Box, PRIMITIVE_CAPACITY }), ObjectId::NONE);
}

TEST(ObjectIdTest, GroundAndMissAreNotSelectable) {
    EXPECT_EQ(ObjectId::fromSurface(SurfaceRef::plane()), ObjectId::NONE);
    EXPECT_EQ(ObjectId::fromSurface(SurfaceRef::none()), ObjectId::NONE);
    EXPECT_EQ(ObjectId::fromSurface(SurfaceRef::of({ PrimitiveType::Box, 2 })), 13u);
}

TEST(ObjectIdTest, FromUnormRoundsInsteadOfTruncating) {
    // 10 / 255 * 255 lands just under 10 in float
    EXPECT_EQ(ObjectId::fromUnorm(10.0f / 255.0f), 10u);
    EXPECT_EQ(ObjectId::fromUnorm(-0.5f), 0u);
    EXPECT_EQ(ObjectId::fromUnorm(2.0f), 255u);
}

TEST(MaterialTagTest, EncodesBandsAndSlots) {
    EXPECT_FLOAT_EQ(MaterialTag::encode(SurfaceRef::plane()), MaterialTag::PLANE);
    EXPECT_FLOAT_EQ(MaterialTag::encode(SurfaceRef::none()), MaterialTag::NONE);
    EXPECT_NEAR(MaterialTag::encode(SurfaceRef::of({ PrimitiveType::Sphere, 0 })), 1.0f, 1e-6f);
    EXPECT_NEAR(MaterialTag::encode(SurfaceRef::of({ PrimitiveType::Box, 3 })), 2.03f, 1e-6f);
    EXPECT_NEAR(MaterialTag::encode(SurfaceRef::of({ PrimitiveType::Torus, 9 })), 3.09f, 1e-6f);
}

TEST(MaterialTagTest, DecodeInvertsEncode) {
    for (int t = 0; t < PRIMITIVE_TYPE_COUNT; ++t) {
        for (int slot = 0; slot < PRIMITIVE_CAPACITY; ++slot) {
            SurfaceRef surface = SurfaceRef::of({ static_cast<PrimitiveType>(t), slot });
            EXPECT_EQ(MaterialTag::decode(MaterialTag::encode(surface)), surface);
        }
    }
    EXPECT_EQ(MaterialTag::decode(0.0f), SurfaceRef::plane());
    EXPECT_EQ(MaterialTag::decode(-1.0f), SurfaceRef::none());
    EXPECT_EQ(MaterialTag::decode(7.0f), SurfaceRef::none());
}
