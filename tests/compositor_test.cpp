#include <gtest/gtest.h>
#include "test_helpers.h"
#include "Rendering/Compositor.h"
#include "Rendering/MemoryAssetProvider.h"
#include <cstdlib>

using testutil::addShape;

namespace {

::testing::AssertionResult colorNear(const QImage& image, int x, int y, const QColor& expected, int tolerance = 3)
{
    const QColor actual = image.pixelColor(x, y);
    if (std::abs(actual.red() - expected.red()) <= tolerance
        && std::abs(actual.green() - expected.green()) <= tolerance
        && std::abs(actual.blue() - expected.blue()) <= tolerance) {
        return ::testing::AssertionSuccess();
    }
    return ::testing::AssertionFailure() << "pixel (" << x << "," << y << ") is "
                                         << actual.name().toStdString() << ", expected "
                                         << expected.name().toStdString();
}

QImage solidImage(const QColor& color, const QSize& size = QSize(16, 16))
{
    QImage image(size, QImage::Format_ARGB32_Premultiplied);
    image.fill(color);
    return image;
}

class CompositorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        scene.setProjectSize(QSizeF(200, 100));
        CompositeOptions options;
        options.backgroundColor = Qt::black;
        compositor.setOptions(options);
        compositor.setAssetProvider(&assets);
    }

    QImage render(double time) const
    {
        return compositor.compositeFrame(scene, time, QSize(200, 100));
    }

    Scene scene;
    MemoryAssetProvider assets;
    Compositor compositor;
};

} // namespace

TEST_F(CompositorTest, FillsBackground) {
    const QImage frame = render(0.0);
    ASSERT_EQ(frame.size(), QSize(200, 100));
    EXPECT_TRUE(colorNear(frame, 5, 5, Qt::black));
    EXPECT_TRUE(colorNear(frame, 195, 95, Qt::black));
}

TEST_F(CompositorTest, LaterLayersPaintOverEarlierOnes) {
    addShape(scene, 100, 50, 60, 60, Qt::red);
    addShape(scene, 100, 50, 60, 60, Qt::blue);

    EXPECT_TRUE(colorNear(render(0.0), 100, 50, Qt::blue));

    scene.moveLayer(scene.layerAt(1)->getId(), 0);
    EXPECT_TRUE(colorNear(render(0.0), 100, 50, Qt::red));
}

TEST_F(CompositorTest, LayerFrameFollowsResolvedTransform) {
    Layer* layer = addShape(scene, 30, 50, 20, 20, Qt::green);
    KeyframeProperties start;
    start.x = 30.0;
    KeyframeProperties end;
    end.x = 170.0;
    layer->setKeyframe(Keyframe(0.0, start));
    layer->setKeyframe(Keyframe(2.0, end));

    const QImage atStart = render(0.0);
    EXPECT_TRUE(colorNear(atStart, 30, 50, Qt::green));
    EXPECT_TRUE(colorNear(atStart, 100, 50, Qt::black));

    const QImage halfway = render(1.0);
    EXPECT_TRUE(colorNear(halfway, 100, 50, Qt::green));
    EXPECT_TRUE(colorNear(halfway, 30, 50, Qt::black));
}

TEST_F(CompositorTest, OpacityScalesPaintAlpha) {
    Layer* layer = addShape(scene, 100, 50, 60, 60, Qt::white);
    layer->setOpacity(0.5);

    const QColor pixel = render(0.0).pixelColor(100, 50);
    EXPECT_NEAR(pixel.red(), 128, 3);
}

TEST_F(CompositorTest, InactiveAndHiddenLayersAreNotDrawn) {
    Layer* late = addShape(scene, 50, 50, 40, 40, Qt::red);
    late->setStartTime(1.0);
    Layer* hidden = addShape(scene, 150, 50, 40, 40, Qt::red);
    hidden->setVisible(false);

    const QImage frame = render(0.5);
    EXPECT_TRUE(colorNear(frame, 50, 50, Qt::black));
    EXPECT_TRUE(colorNear(frame, 150, 50, Qt::black));
    EXPECT_TRUE(colorNear(render(1.0), 50, 50, Qt::red));
}

TEST_F(CompositorTest, SkipsLayersWhoseAssetIsNotReady) {
    addShape(scene, 100, 50, 60, 60, Qt::red);
    MotionComposer::ImageContent content;
    content.assetId = "photo";
    Layer* image = scene.addLayer("Image", content);
    image->setPosition(QPointF(100, 50));
    image->setSize(QSizeF(60, 60));

    assets.insertPending("photo");
    EXPECT_TRUE(colorNear(render(0.0), 100, 50, Qt::red));

    // Next frame picks the asset up once it is ready
    assets.insertImage("photo", solidImage(Qt::green));
    EXPECT_TRUE(colorNear(render(0.0), 100, 50, Qt::green));
}

TEST_F(CompositorTest, VideoFramesFollowMediaTimeWithinWindow) {
    assets.insertVideo("clip", { solidImage(Qt::red), solidImage(Qt::green) }, 1.0);

    MotionComposer::VideoContent content;
    content.assetId = "clip";
    Layer* video = scene.addLayer("Video", content);
    video->setPosition(QPointF(100, 50));
    video->setSize(QSizeF(60, 60));
    video->setStartTime(1.0);

    EXPECT_TRUE(colorNear(render(0.5), 100, 50, Qt::black));
    EXPECT_TRUE(colorNear(render(1.5), 100, 50, Qt::red));
    EXPECT_TRUE(colorNear(render(2.5), 100, 50, Qt::green));
    // Past the two seconds of media nothing is drawn
    EXPECT_TRUE(colorNear(render(3.5), 100, 50, Qt::black));
}

TEST_F(CompositorTest, SelectionDecorationOnlyWithSelectTool) {
    Layer* layer = addShape(scene, 100, 50, 60, 40, Qt::red);
    scene.setSelectedLayerId(layer->getId());

    // Top-left corner handle straddles (70, 30)
    EXPECT_TRUE(colorNear(render(0.0), 68, 28, QColor(0x00, 0xd4, 0xff)));

    // Rotation handle stem above the top edge
    EXPECT_TRUE(colorNear(render(0.0), 100, 20, QColor(0xff, 0x6b, 0x6b)));

    scene.setToolMode(ToolMode::Shape);
    EXPECT_TRUE(colorNear(render(0.0), 68, 28, Qt::black));

    scene.setToolMode(ToolMode::Select);
    CompositeOptions options = compositor.getOptions();
    options.drawSelection = false;
    compositor.setOptions(options);
    EXPECT_TRUE(colorNear(render(0.0), 68, 28, Qt::black));
}

TEST_F(CompositorTest, FitsProjectIntoTargetSize) {
    addShape(scene, 100, 50, 200, 100, Qt::blue);

    const QImage frame = compositor.compositeFrame(scene, 0.0, QSize(400, 400));
    ASSERT_EQ(frame.size(), QSize(400, 400));
    // Project is letterboxed into 400x200, centred vertically
    EXPECT_TRUE(colorNear(frame, 200, 200, Qt::blue));
    EXPECT_EQ(frame.pixelColor(200, 50).alpha(), 0);
}

TEST_F(CompositorTest, AudioAndAdjustmentLayersDrawNothing) {
    scene.addLayer("Audio", MotionComposer::AudioContent());
    scene.addLayer("Adjustment", MotionComposer::AdjustmentContent());

    const QImage frame = render(0.0);
    EXPECT_TRUE(colorNear(frame, 100, 50, Qt::black));
}

namespace {

// Bounding box of pixels brighter than mid grey
QRect inkBounds(const QImage& image)
{
    QRect bounds;
    for (int y = 0; y < image.height(); ++y) {
        for (int x = 0; x < image.width(); ++x) {
            if (image.pixelColor(x, y).red() > 128) {
                bounds |= QRect(x, y, 1, 1);
            }
        }
    }
    return bounds;
}

Layer* addText(Scene& scene, const QString& text, Qt::Alignment alignment)
{
    MotionComposer::TextContent content;
    content.text = text;
    content.fontSize = 20.0;
    content.color = Qt::white;
    content.alignment = alignment;
    Layer* layer = scene.addLayer("Text", content);
    layer->setPosition(QPointF(100, 50));
    return layer;
}

} // namespace

TEST_F(CompositorTest, TextLinesAreCentredVerticallyOnTheOrigin) {
    addText(scene, "HH\nHH", Qt::AlignHCenter);
    const QRect ink = inkBounds(render(0.0));
    ASSERT_FALSE(ink.isNull());

    // Two lines of 1.2 * 20 px each, stacked around y = 50
    const double lineHeight = 24.0;
    EXPECT_LT(ink.top(), 50);
    EXPECT_GT(ink.bottom(), 50);
    EXPECT_GE(ink.top(), 50 - lineHeight * 2);
    EXPECT_LE(ink.bottom(), 50 + lineHeight * 2);
    EXPECT_LE(std::abs((50 - ink.top()) - (ink.bottom() - 50)), lineHeight);

    EXPECT_LT(ink.left(), 100);
    EXPECT_GT(ink.right(), 100);
}

TEST_F(CompositorTest, SingleLineTextStaysWithinOneLineHeight) {
    addText(scene, "HH", Qt::AlignHCenter);
    const QRect ink = inkBounds(render(0.0));
    ASSERT_FALSE(ink.isNull());

    EXPECT_GE(ink.top(), 50 - 12);
    EXPECT_LE(ink.bottom(), 50 + 12);
}

TEST_F(CompositorTest, TextAlignmentAnchorsLinesAtTheOrigin) {
    Layer* layer = addText(scene, "HH\nHH", Qt::AlignLeft);
    QRect ink = inkBounds(render(0.0));
    ASSERT_FALSE(ink.isNull());
    EXPECT_GE(ink.left(), 98);
    EXPECT_GT(ink.right(), 105);

    auto content = std::get<MotionComposer::TextContent>(layer->getContent());
    content.alignment = Qt::AlignRight;
    layer->setContent(content);
    ink = inkBounds(render(0.0));
    ASSERT_FALSE(ink.isNull());
    EXPECT_LE(ink.right(), 102);
    EXPECT_LT(ink.left(), 95);
}
