#include <gtest/gtest.h>
#include "Rendering/MemoryAssetProvider.h"
#include <QTemporaryDir>

namespace {

QImage solid(const QColor& color)
{
    QImage image(4, 4, QImage::Format_ARGB32);
    image.fill(color);
    return image;
}

} // namespace

TEST(MemoryAssetProviderTest, PendingAssetsAreNotReady) {
    MemoryAssetProvider assets;
    assets.insertPending("logo");

    EXPECT_TRUE(assets.contains("logo"));
    EXPECT_FALSE(assets.isReady("logo"));
    EXPECT_TRUE(assets.image("logo").isNull());

    int readyCount = 0;
    QObject::connect(&assets, &MemoryAssetProvider::assetReady, [&readyCount](const QString& id) {
        if (id == "logo") {
            ++readyCount;
        }
    });

    assets.insertImage("logo", solid(Qt::red));
    EXPECT_TRUE(assets.isReady("logo"));
    EXPECT_EQ(readyCount, 1);
    EXPECT_EQ(assets.image("logo").pixelColor(0, 0), QColor(Qt::red));
}

TEST(MemoryAssetProviderTest, VideoFramesAreSampledAtFrameRate) {
    MemoryAssetProvider assets;
    assets.insertVideo("clip", { solid(Qt::red), solid(Qt::green), solid(Qt::blue) }, 2.0);

    EXPECT_DOUBLE_EQ(assets.mediaDuration("clip"), 1.5);
    EXPECT_EQ(assets.videoFrame("clip", 0.0).pixelColor(0, 0), QColor(Qt::red));
    EXPECT_EQ(assets.videoFrame("clip", 0.6).pixelColor(0, 0), QColor(Qt::green));
    EXPECT_EQ(assets.videoFrame("clip", 1.2).pixelColor(0, 0), QColor(Qt::blue));
    // Clamped at both ends
    EXPECT_EQ(assets.videoFrame("clip", -1.0).pixelColor(0, 0), QColor(Qt::red));
    EXPECT_EQ(assets.videoFrame("clip", 9.0).pixelColor(0, 0), QColor(Qt::blue));
}

TEST(MemoryAssetProviderTest, UnknownAndRemovedAssets) {
    MemoryAssetProvider assets;
    EXPECT_FALSE(assets.isReady("missing"));
    EXPECT_DOUBLE_EQ(assets.mediaDuration("missing"), 0.0);

    assets.insertImage("still", solid(Qt::white));
    assets.removeAsset("still");
    EXPECT_FALSE(assets.contains("still"));
}

TEST(MemoryAssetProviderTest, LoadsImagesFromDisk) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("pixel.png");
    ASSERT_TRUE(solid(Qt::blue).save(path));

    MemoryAssetProvider assets;
    EXPECT_TRUE(assets.loadImage("disk", path));
    EXPECT_TRUE(assets.isReady("disk"));

    EXPECT_FALSE(assets.loadImage("broken", dir.filePath("does-not-exist.png")));
    EXPECT_FALSE(assets.contains("broken"));
}
