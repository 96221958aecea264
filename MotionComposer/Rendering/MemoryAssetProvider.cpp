#include "MemoryAssetProvider.h"
#include <QImageReader>
#include <QDebug>
#include <QtGlobal>
#include <cmath>

MemoryAssetProvider::MemoryAssetProvider(QObject* parent)
    : QObject(parent)
{
}

void MemoryAssetProvider::insertPending(const QString& assetId)
{
    m_assets.insert(assetId, Entry());
}

void MemoryAssetProvider::insertImage(const QString& assetId, const QImage& image)
{
    if (image.isNull()) {
        qWarning() << "MemoryAssetProvider: refusing null image for" << assetId;
        return;
    }

    Entry entry;
    entry.frames.append(image);
    entry.ready = true;
    m_assets.insert(assetId, entry);
    emit assetReady(assetId);
}

bool MemoryAssetProvider::loadImage(const QString& assetId, const QString& filePath)
{
    QImageReader reader(filePath);
    reader.setAutoTransform(true);

    QImage image = reader.read();
    if (image.isNull()) {
        qWarning() << "MemoryAssetProvider: failed to read" << filePath << reader.errorString();
        return false;
    }

    insertImage(assetId, image);
    return true;
}

void MemoryAssetProvider::insertVideo(const QString& assetId, const QVector<QImage>& frames, double frameRate)
{
    if (frames.isEmpty() || frameRate <= 0.0) {
        qWarning() << "MemoryAssetProvider: refusing empty video" << assetId << "at" << frameRate << "fps";
        return;
    }

    Entry entry;
    entry.frames = frames;
    entry.frameRate = frameRate;
    entry.ready = true;
    m_assets.insert(assetId, entry);
    emit assetReady(assetId);
}

void MemoryAssetProvider::removeAsset(const QString& assetId)
{
    m_assets.remove(assetId);
}

bool MemoryAssetProvider::contains(const QString& assetId) const
{
    return m_assets.contains(assetId);
}

bool MemoryAssetProvider::isReady(const QString& assetId) const
{
    auto it = m_assets.constFind(assetId);
    return it != m_assets.constEnd() && it->ready;
}

QImage MemoryAssetProvider::image(const QString& assetId) const
{
    auto it = m_assets.constFind(assetId);
    if (it == m_assets.constEnd() || !it->ready) {
        return QImage();
    }
    return it->frames.first();
}

QImage MemoryAssetProvider::videoFrame(const QString& assetId, double mediaTime) const
{
    auto it = m_assets.constFind(assetId);
    if (it == m_assets.constEnd() || !it->ready) {
        return QImage();
    }

    if (it->frameRate <= 0.0) {
        return it->frames.first();
    }

    const int lastIndex = static_cast<int>(it->frames.size()) - 1;
    const int index = qBound(0, static_cast<int>(std::floor(mediaTime * it->frameRate)), lastIndex);
    return it->frames.at(index);
}

double MemoryAssetProvider::mediaDuration(const QString& assetId) const
{
    auto it = m_assets.constFind(assetId);
    if (it == m_assets.constEnd() || !it->ready || it->frameRate <= 0.0) {
        return 0.0;
    }
    return it->frames.size() / it->frameRate;
}
