#include <gtest/gtest.h>
#include "Animation/KeyframeInterpolator.h"
#include "Animation/Layer.h"
#include <cmath>
#include <limits>

namespace {

KeyframeProperties opacityOnly(double opacity)
{
    KeyframeProperties properties;
    properties.opacity = opacity;
    return properties;
}

KeyframeProperties position(double x, double y)
{
    KeyframeProperties properties;
    properties.x = x;
    properties.y = y;
    return properties;
}

Layer makeLayer()
{
    Layer layer(1, "Layer", MotionComposer::ShapeContent());
    LayerTransform base;
    base.x = 10.0;
    base.y = 20.0;
    base.scale = 2.0;
    base.rotation = 45.0;
    base.opacity = 0.8;
    layer.setBaseTransform(base);
    return layer;
}

} // namespace

TEST(KeyframeInterpolatorTest, EmptySetReturnsBaseTransform) {
    const Layer layer = makeLayer();
    const LayerTransform resolved = resolveLayerProperties(layer, 3.0);
    EXPECT_EQ(resolved, layer.getBaseTransform());
}

TEST(KeyframeInterpolatorTest, OpacityMidpointScenario) {
    Layer layer = makeLayer();
    layer.setKeyframe(Keyframe(0.0, opacityOnly(0.0)));
    layer.setKeyframe(Keyframe(2.0, opacityOnly(1.0)));

    EXPECT_DOUBLE_EQ(resolveLayerProperties(layer, 1.0).opacity, 0.5);
}

TEST(KeyframeInterpolatorTest, UndefinedPropertiesFallBackToBase) {
    Layer layer = makeLayer();
    layer.setKeyframe(Keyframe(0.0, opacityOnly(0.0)));
    layer.setKeyframe(Keyframe(2.0, opacityOnly(1.0)));

    const LayerTransform resolved = resolveLayerProperties(layer, 1.0);
    EXPECT_DOUBLE_EQ(resolved.x, 10.0);
    EXPECT_DOUBLE_EQ(resolved.y, 20.0);
    EXPECT_DOUBLE_EQ(resolved.scale, 2.0);
    EXPECT_DOUBLE_EQ(resolved.rotation, 45.0);
}

TEST(KeyframeInterpolatorTest, ClampsToBoundaryKeyframes) {
    Layer layer = makeLayer();
    layer.setKeyframe(Keyframe(1.0, position(0.0, 0.0)));
    layer.setKeyframe(Keyframe(3.0, position(100.0, 50.0)));

    for (double t : { -5.0, 0.0, 0.5, 1.0 }) {
        const LayerTransform resolved = resolveLayerProperties(layer, t);
        EXPECT_DOUBLE_EQ(resolved.x, 0.0) << "t=" << t;
        EXPECT_DOUBLE_EQ(resolved.y, 0.0) << "t=" << t;
    }
    for (double t : { 3.0, 4.0, 1000.0 }) {
        const LayerTransform resolved = resolveLayerProperties(layer, t);
        EXPECT_DOUBLE_EQ(resolved.x, 100.0) << "t=" << t;
        EXPECT_DOUBLE_EQ(resolved.y, 50.0) << "t=" << t;
    }
}

TEST(KeyframeInterpolatorTest, BoundaryKeyframeOmissionsUseBase) {
    Layer layer = makeLayer();
    layer.setKeyframe(Keyframe(1.0, opacityOnly(0.2)));
    layer.setKeyframe(Keyframe(2.0, position(5.0, 6.0)));

    const LayerTransform before = resolveLayerProperties(layer, 0.0);
    EXPECT_DOUBLE_EQ(before.opacity, 0.2);
    EXPECT_DOUBLE_EQ(before.x, 10.0);

    const LayerTransform after = resolveLayerProperties(layer, 5.0);
    EXPECT_DOUBLE_EQ(after.x, 5.0);
    EXPECT_DOUBLE_EQ(after.opacity, 0.8);
}

TEST(KeyframeInterpolatorTest, HoldsValueDefinedOnOneSideOnly) {
    Layer layer = makeLayer();
    KeyframeProperties first = position(0.0, 0.0);
    first.scale = 3.0;
    layer.setKeyframe(Keyframe(0.0, first));
    layer.setKeyframe(Keyframe(4.0, position(40.0, 80.0)));

    const LayerTransform resolved = resolveLayerProperties(layer, 1.0);
    EXPECT_DOUBLE_EQ(resolved.x, 10.0);
    EXPECT_DOUBLE_EQ(resolved.y, 20.0);
    EXPECT_DOUBLE_EQ(resolved.scale, 3.0);
}

TEST(KeyframeInterpolatorTest, UsesBracketingPairAmongSeveral) {
    Layer layer = makeLayer();
    layer.setKeyframe(Keyframe(0.0, position(0.0, 0.0)));
    layer.setKeyframe(Keyframe(1.0, position(10.0, 0.0)));
    layer.setKeyframe(Keyframe(3.0, position(30.0, 100.0)));

    const LayerTransform resolved = resolveLayerProperties(layer, 2.0);
    EXPECT_DOUBLE_EQ(resolved.x, 20.0);
    EXPECT_DOUBLE_EQ(resolved.y, 50.0);

    // Exactly on an inner keyframe
    EXPECT_DOUBLE_EQ(resolveLayerProperties(layer, 1.0).x, 10.0);
}

TEST(KeyframeInterpolatorTest, ConvergesToKeyframeValuesFromBothSides) {
    Layer layer = makeLayer();
    layer.setKeyframe(Keyframe(0.0, position(0.0, 0.0)));
    layer.setKeyframe(Keyframe(1.0, position(100.0, -40.0)));
    layer.setKeyframe(Keyframe(2.0, position(-20.0, 60.0)));

    for (double epsilon : { 1e-3, 1e-6, 1e-9 }) {
        const LayerTransform below = resolveLayerProperties(layer, 1.0 - epsilon);
        const LayerTransform above = resolveLayerProperties(layer, 1.0 + epsilon);
        EXPECT_NEAR(below.x, 100.0, 1e5 * epsilon);
        EXPECT_NEAR(above.x, 100.0, 1e5 * epsilon);
        EXPECT_NEAR(below.y, -40.0, 1e5 * epsilon);
        EXPECT_NEAR(above.y, -40.0, 1e5 * epsilon);
    }
}

TEST(KeyframeInterpolatorTest, RepeatedQueriesAreIdentical) {
    Layer layer = makeLayer();
    layer.setKeyframe(Keyframe(0.0, position(0.0, 0.0)));
    layer.setKeyframe(Keyframe(3.0, position(33.0, 99.0)));

    const LayerTransform first = resolveLayerProperties(layer, 1.7);
    const LayerTransform second = resolveLayerProperties(layer, 1.7);
    EXPECT_EQ(first, second);
}

TEST(KeyframeInterpolatorTest, RotationInterpolatesLinearlyAcrossSeam) {
    Layer layer = makeLayer();
    KeyframeProperties from;
    from.rotation = 350.0;
    KeyframeProperties to;
    to.rotation = 10.0;
    layer.setKeyframe(Keyframe(0.0, from));
    layer.setKeyframe(Keyframe(1.0, to));

    // Goes the long way round
    EXPECT_DOUBLE_EQ(resolveLayerProperties(layer, 0.5).rotation, 180.0);
}

TEST(KeyframeInterpolatorTest, EasingOfLaterKeyframeShapesFraction) {
    KeyframeMap keyframes;
    keyframes.emplace(0.0, Keyframe(0.0, opacityOnly(0.0)));
    Keyframe eased(1.0, opacityOnly(1.0));
    eased.setEasing(QEasingCurve::InQuad);
    keyframes.emplace(1.0, eased);

    const LayerTransform resolved = KeyframeInterpolator::resolve(keyframes, LayerTransform(), 0.5);
    EXPECT_NEAR(resolved.opacity, 0.25, 1e-9);
}

TEST(KeyframeInterpolatorTest, SingleKeyframeAppliesEverywhere) {
    Layer layer = makeLayer();
    layer.setKeyframe(Keyframe(2.0, opacityOnly(0.3)));

    EXPECT_DOUBLE_EQ(resolveLayerProperties(layer, 0.0).opacity, 0.3);
    EXPECT_DOUBLE_EQ(resolveLayerProperties(layer, 2.0).opacity, 0.3);
    EXPECT_DOUBLE_EQ(resolveLayerProperties(layer, 9.0).opacity, 0.3);
}

TEST(KeyframeInterpolatorTest, NaNTimeResolvesToFirstKeyframe) {
    KeyframeMap keyframes;
    keyframes.emplace(0.0, Keyframe(0.0, opacityOnly(0.25)));
    keyframes.emplace(1.0, Keyframe(1.0, opacityOnly(0.5)));
    keyframes.emplace(2.0, Keyframe(2.0, opacityOnly(1.0)));

    const LayerTransform resolved = KeyframeInterpolator::resolve(keyframes, LayerTransform(),
        std::numeric_limits<double>::quiet_NaN());
    EXPECT_DOUBLE_EQ(resolved.opacity, 0.25);

    Layer layer = makeLayer();
    layer.setKeyframe(Keyframe(1.0, position(5.0, 6.0)));
    layer.setKeyframe(Keyframe(3.0, position(7.0, 8.0)));
    EXPECT_DOUBLE_EQ(resolveLayerProperties(layer, std::nan("")).x, 5.0);
}
