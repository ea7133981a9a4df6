#include <gtest/gtest.h>

#include <glint/core/camera.h>
#include <glint/core/log.h>
#include <glint/picking/cpu_id_pass.h>
#include <glint/picking/picker.h>
#include <glint/scene/object_id.h>
#include <glint/scene/scene_store.h>

#include <vector>

using namespace glint;

// Fixed answer for every pixel, to drive the picker without marching
class ConstantIdPass : public IdPass {
public:
    explicit ConstantIdPass(uint32_t id) : m_byte(static_cast<uint8_t>(id)) {}

    void resize(uint32_t width, uint32_t height) override { m_width = width; m_height = height; }
    bool render(const SceneStore&, const Camera&) override { ++renders; return !failing; }
    uint8_t readPixel(uint32_t x, uint32_t y) const override {
        lastX = x;
        lastY = y;
        return m_byte;
    }
    uint32_t getWidth() const override { return m_width; }
    uint32_t getHeight() const override { return m_height; }
    const std::string& lastError() const override { return m_error; }

    int renders = 0;
    bool failing = false;
    mutable uint32_t lastX = 0, lastY = 0;

private:
    uint8_t m_byte;
    uint32_t m_width = 64, m_height = 48;
    std::string m_error = "constant pass";
};

class PickerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::setEcho(false);

        Sphere s;
        s.center = { 0.0f, 0.0f, 1.0f };
        s.radius = 0.5f;
        s.color = { 1.0f, 0.0f, 0.0f };
        store.addSphere(s);

        idPass.resize(64, 48);
        picker.setOnObjectSelected([this](const std::optional<PrimitiveRef>& ref) {
            selections.push_back(ref);
        });
    }

    SceneStore store;
    Camera camera; // target origin, distance 5: eye at (0, 0, 5) looking down -z
    CPUIdPass idPass;
    Picker picker{ store, idPass };
    std::vector<std::optional<PrimitiveRef>> selections;
};

TEST_F(PickerTest, CenterPixelCarriesFirstSphereId) {
    ASSERT_TRUE(idPass.render(store, camera));
    EXPECT_EQ(ObjectId::fromUnorm(idPass.readPixel(32, 24) / 255.0f), 1u);
}

TEST_F(PickerTest, CenterClickSelectsSphere) {
    auto ref = picker.pick(32, 24, camera);
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(*ref, (PrimitiveRef{ PrimitiveType::Sphere, 0 }));
    EXPECT_EQ(picker.getState(), PickerState::Selected);

    ASSERT_EQ(selections.size(), 1u);
    EXPECT_EQ(selections[0], ref);
}

TEST_F(PickerTest, GroundClickSelectsNothing) {
    ASSERT_TRUE(idPass.render(store, camera));
    EXPECT_EQ(idPass.readPixel(32, 47), 0);

    EXPECT_FALSE(picker.pick(32, 47, camera).has_value());
    EXPECT_EQ(picker.getState(), PickerState::Idle);
    EXPECT_TRUE(selections.empty());
}

TEST_F(PickerTest, GroundClickDeselects) {
    ASSERT_TRUE(picker.pick(32, 24, camera).has_value());
    picker.pick(32, 47, camera);

    EXPECT_EQ(picker.getState(), PickerState::Idle);
    ASSERT_EQ(selections.size(), 2u);
    EXPECT_FALSE(selections[1].has_value());
}

TEST_F(PickerTest, OutOfBoundsClickIsClamped) {
    ConstantIdPass constant(ObjectId::encode({ PrimitiveType::Sphere, 0 }));
    picker.setIdPass(constant);

    picker.pick(-20, 500, camera);
    EXPECT_EQ(constant.lastX, 0u);
    EXPECT_EQ(constant.lastY, 47u);

    picker.pick(900, -3, camera);
    EXPECT_EQ(constant.lastX, 63u);
    EXPECT_EQ(constant.lastY, 0u);
}

TEST_F(PickerTest, StaleIdCountsAsMiss) {
    // Slot 4 is a valid encoding but no such sphere exists
    ConstantIdPass constant(ObjectId::encode({ PrimitiveType::Sphere, 4 }));
    picker.setIdPass(constant);

    EXPECT_FALSE(picker.pick(10, 10, camera).has_value());
    EXPECT_EQ(picker.getState(), PickerState::Idle);
}

TEST_F(PickerTest, FailedPassLeavesSelectionAlone) {
    ASSERT_TRUE(picker.pick(32, 24, camera).has_value());

    ConstantIdPass broken(0);
    broken.failing = true;
    picker.setIdPass(broken);

    EXPECT_FALSE(picker.pick(32, 47, camera).has_value());
    EXPECT_EQ(picker.getState(), PickerState::Selected);
    EXPECT_GE(Log::countAtLevel(Log::Level::Error), 1u);
}

TEST_F(PickerTest, NewerPickRequestSupersedesOlder) {
    ConstantIdPass constant(ObjectId::encode({ PrimitiveType::Sphere, 0 }));
    picker.setIdPass(constant);

    picker.requestPick(1, 1);
    picker.requestPick(5, 6);
    EXPECT_TRUE(picker.hasPendingPick());
    EXPECT_EQ(picker.getSupersededCount(), 1u);

    EXPECT_TRUE(picker.processPendingPick(camera));
    EXPECT_EQ(constant.renders, 1);
    EXPECT_EQ(constant.lastX, 5u);
    EXPECT_EQ(constant.lastY, 6u);
    EXPECT_FALSE(picker.hasPendingPick());
    EXPECT_FALSE(picker.processPendingPick(camera));
}

TEST_F(PickerTest, DragMovesAlongCameraRight) {
    ASSERT_TRUE(picker.pick(32, 24, camera).has_value());
    ASSERT_TRUE(picker.beginDrag(camera));

    PrimitiveRef movedRef;
    glm::vec3 movedTo(0.0f);
    picker.setOnObjectMoved([&](const PrimitiveRef& ref, const glm::vec3& pos) {
        movedRef = ref;
        movedTo = pos;
    });

    EXPECT_TRUE(picker.updateDrag(10.0f, 0.0f, camera));
    EXPECT_EQ(picker.getState(), PickerState::Dragging);

    // 10 px * 0.002 * |(0, 0, 5)|
    auto pos = store.getPosition({ PrimitiveType::Sphere, 0 });
    ASSERT_TRUE(pos.has_value());
    EXPECT_NEAR(pos->x, 0.1f, 1e-5f);
    EXPECT_NEAR(pos->y, 0.0f, 1e-6f);
    EXPECT_NEAR(pos->z, 1.0f, 1e-6f);
    EXPECT_EQ(movedTo, *pos);
    EXPECT_EQ(movedRef, (PrimitiveRef{ PrimitiveType::Sphere, 0 }));

    picker.endDrag();
    EXPECT_EQ(picker.getState(), PickerState::Selected);
}

TEST_F(PickerTest, SmallMotionsWaitForThreshold) {
    ASSERT_TRUE(picker.select({ PrimitiveType::Sphere, 0 }, camera));
    ASSERT_TRUE(picker.beginDrag(camera));

    EXPECT_FALSE(picker.updateDrag(1.0f, 1.0f, camera));
    EXPECT_EQ(picker.getState(), PickerState::Selected);
    EXPECT_EQ(store.getSpheres()[0].center, glm::vec3(0.0f, 0.0f, 1.0f));

    // Accumulated (3, 1) crosses the threshold and is applied in full
    EXPECT_TRUE(picker.updateDrag(2.0f, 0.0f, camera));
    EXPECT_EQ(picker.getState(), PickerState::Dragging);
    EXPECT_NEAR(store.getSpheres()[0].center.x, 0.03f, 1e-5f);
    EXPECT_NEAR(store.getSpheres()[0].center.y, -0.01f, 1e-5f);
}

TEST_F(PickerTest, DragWithoutBeginDoesNothing) {
    ASSERT_TRUE(picker.select({ PrimitiveType::Sphere, 0 }, camera));
    EXPECT_FALSE(picker.updateDrag(50.0f, 0.0f, camera));
    EXPECT_EQ(store.getSpheres()[0].center.x, 0.0f);
}

TEST_F(PickerTest, RemovedSelectionIsDropped) {
    ASSERT_TRUE(picker.select({ PrimitiveType::Sphere, 0 }, camera));
    ASSERT_TRUE(store.removePrimitive(PrimitiveType::Sphere, 0));

    picker.validateSelection();
    EXPECT_EQ(picker.getState(), PickerState::Idle);
    EXPECT_FALSE(picker.getSelection().has_value());
    EXPECT_FALSE(selections.back().has_value());
}

TEST(PickerDragOffsetTest, FollowsHorizontalRightAndWorldUp) {
    // Looking along +x the camera's right is +z
    glm::vec3 offset = Picker::dragOffset(10.0f, 0.0f, { 1.0f, 0.0f, 0.0f }, { -5.0f, 0.0f, 0.0f });
    EXPECT_NEAR(offset.z, 0.1f, 1e-6f);
    EXPECT_NEAR(offset.x, 0.0f, 1e-6f);

    // Pointer down moves the object down
    glm::vec3 down = Picker::dragOffset(0.0f, 10.0f, { 0.0f, 0.0f, -1.0f }, { 0.0f, 0.0f, 5.0f });
    EXPECT_NEAR(down.y, -0.1f, 1e-6f);

    // Pitched camera: right stays horizontal
    glm::vec3 forward = glm::normalize(glm::vec3(0.0f, -1.0f, -1.0f));
    glm::vec3 pitched = Picker::dragOffset(10.0f, 0.0f, forward, { 0.0f, 3.0f, 3.0f });
    EXPECT_NEAR(pitched.y, 0.0f, 1e-6f);
    EXPECT_GT(pitched.x, 0.0f);
}
