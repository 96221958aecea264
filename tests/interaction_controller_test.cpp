#include <gtest/gtest.h>
#include "test_helpers.h"
#include "Interaction/InteractionController.h"
#include <cmath>

using testutil::addShape;

namespace {

struct CommitRecord {
    LayerId id;
    LayerTransform before;
    LayerTransform after;
};

class InteractionControllerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        layer = addShape(scene, 100, 100, 100, 50);
        QObject::connect(&controller, &InteractionController::gestureCommitted,
            [this](LayerId id, const LayerTransform& before, const LayerTransform& after) {
                commits.push_back({ id, before, after });
            });
    }

    Scene scene;
    InteractionController controller{ &scene };
    Layer* layer = nullptr;
    std::vector<CommitRecord> commits;
};

} // namespace

TEST_F(InteractionControllerTest, DragUsesOnlyFinalDeltaFromAnchor) {
    ASSERT_TRUE(controller.beginGesture(GestureKind::Drag, layer->getId(), QPointF(100, 100)));
    EXPECT_EQ(controller.getMode(), InteractionController::Mode::Dragging);

    controller.updateGesture(QPointF(103, 98));
    controller.updateGesture(QPointF(250, -40));
    controller.updateGesture(QPointF(111, 90));
    controller.updateGesture(QPointF(120, 95));
    ASSERT_TRUE(controller.endGesture());

    EXPECT_DOUBLE_EQ(layer->getBaseTransform().x, 120.0);
    EXPECT_DOUBLE_EQ(layer->getBaseTransform().y, 95.0);
    EXPECT_EQ(controller.getMode(), InteractionController::Mode::Idle);
}

TEST_F(InteractionControllerTest, DragWithSingleUpdateMatches) {
    controller.beginGesture(GestureKind::Drag, layer->getId(), QPointF(100, 100));
    controller.updateGesture(QPointF(120, 95));
    controller.endGesture();

    EXPECT_DOUBLE_EQ(layer->getBaseTransform().x, 120.0);
    EXPECT_DOUBLE_EQ(layer->getBaseTransform().y, 95.0);
}

TEST_F(InteractionControllerTest, CommitsExactlyOncePerGesture) {
    controller.beginGesture(GestureKind::Drag, layer->getId(), QPointF(100, 100));
    for (int i = 0; i < 10; ++i) {
        controller.updateGesture(QPointF(100 + i, 100));
    }
    EXPECT_TRUE(commits.empty());

    controller.endGesture();
    ASSERT_EQ(commits.size(), 1u);
    EXPECT_EQ(commits[0].id, layer->getId());
    EXPECT_DOUBLE_EQ(commits[0].before.x, 100.0);
    EXPECT_DOUBLE_EQ(commits[0].after.x, 109.0);

    // A second end is a defensive no-op
    EXPECT_FALSE(controller.endGesture());
    EXPECT_EQ(commits.size(), 1u);
}

TEST_F(InteractionControllerTest, ResizeScalesFromAnchorAndFloors) {
    layer->setScale(2.0);
    controller.beginGesture(GestureKind::Resize, layer->getId(), QPointF(0, 0));

    // width 100 -> 150 (x1.5), height 50 -> 100 (x2); min wins
    controller.updateGesture(QPointF(50, 50));
    EXPECT_DOUBLE_EQ(layer->getBaseTransform().scale, 3.0);

    controller.updateGesture(QPointF(-1000, -1000));
    EXPECT_DOUBLE_EQ(layer->getBaseTransform().scale, InteractionController::MinimumScale);

    controller.updateGesture(QPointF(-95, 0));
    EXPECT_GE(layer->getBaseTransform().scale, InteractionController::MinimumScale);

    controller.endGesture();
    EXPECT_GE(layer->getBaseTransform().scale, InteractionController::MinimumScale);
}

TEST_F(InteractionControllerTest, RotateTracksPointerAngleAroundLayer) {
    // Pointer starts directly right of the layer centre, then moves below it
    controller.beginGesture(GestureKind::Rotate, layer->getId(), QPointF(200, 100));
    controller.updateGesture(QPointF(100, 200));
    EXPECT_NEAR(layer->getBaseTransform().rotation, 90.0, 1e-9);

    // Above the centre: -90 degrees from the anchor, wraps to 270
    controller.updateGesture(QPointF(100, 0));
    EXPECT_NEAR(layer->getBaseTransform().rotation, 270.0, 1e-9);
    controller.endGesture();
}

TEST_F(InteractionControllerTest, RotationStaysNormalised) {
    layer->setRotation(350.0);
    controller.beginGesture(GestureKind::Rotate, layer->getId(), QPointF(200, 100));

    const QPointF centre(100, 100);
    for (int step = 0; step < 72; ++step) {
        const double angle = step * 0.37;
        controller.updateGesture(centre + QPointF(std::cos(angle) * 80.0, std::sin(angle) * 80.0));
        const double rotation = layer->getBaseTransform().rotation;
        EXPECT_GE(rotation, 0.0);
        EXPECT_LT(rotation, 360.0);
    }
    controller.endGesture();
}

TEST_F(InteractionControllerTest, SecondGestureWhileActiveIsIgnored) {
    Layer* other = addShape(scene, 400, 400);

    ASSERT_TRUE(controller.beginGesture(GestureKind::Drag, layer->getId(), QPointF(100, 100)));
    EXPECT_FALSE(controller.beginGesture(GestureKind::Rotate, other->getId(), QPointF(400, 400)));
    EXPECT_EQ(controller.getMode(), InteractionController::Mode::Dragging);
    EXPECT_EQ(controller.getActiveLayerId(), layer->getId());

    controller.updateGesture(QPointF(110, 100));
    controller.endGesture();
    EXPECT_DOUBLE_EQ(layer->getBaseTransform().x, 110.0);
    EXPECT_DOUBLE_EQ(other->getBaseTransform().rotation, 0.0);
}

TEST_F(InteractionControllerTest, UpdateWithoutGestureIsNoOp) {
    const LayerTransform before = layer->getBaseTransform();
    EXPECT_FALSE(controller.updateGesture(QPointF(500, 500)));
    EXPECT_FALSE(controller.endGesture());
    EXPECT_EQ(layer->getBaseTransform(), before);
    EXPECT_TRUE(commits.empty());
}

TEST_F(InteractionControllerTest, RefusesLockedUnknownAndNonSelectTool) {
    layer->setLocked(true);
    EXPECT_FALSE(controller.beginGesture(GestureKind::Drag, layer->getId(), QPointF()));
    layer->setLocked(false);

    EXPECT_FALSE(controller.beginGesture(GestureKind::Drag, 12345, QPointF()));

    scene.setToolMode(ToolMode::Text);
    EXPECT_FALSE(controller.beginGesture(GestureKind::Drag, layer->getId(), QPointF()));
    EXPECT_FALSE(controller.isActive());
}

TEST_F(InteractionControllerTest, CancelRestoresSnapshotWithoutCommit) {
    controller.beginGesture(GestureKind::Drag, layer->getId(), QPointF(100, 100));
    controller.updateGesture(QPointF(300, 300));
    controller.cancelGesture();

    EXPECT_DOUBLE_EQ(layer->getBaseTransform().x, 100.0);
    EXPECT_DOUBLE_EQ(layer->getBaseTransform().y, 100.0);
    EXPECT_TRUE(commits.empty());
    EXPECT_FALSE(controller.isActive());
}

TEST_F(InteractionControllerTest, GestureDoesNotCreateKeyframes) {
    controller.beginGesture(GestureKind::Drag, layer->getId(), QPointF(100, 100));
    controller.updateGesture(QPointF(150, 150));
    controller.endGesture();
    EXPECT_TRUE(layer->getKeyframes().empty());
}
