#ifndef MEMORYASSETPROVIDER_H
#define MEMORYASSETPROVIDER_H

#include "AssetProvider.h"
#include <QObject>
#include <QHash>
#include <QVector>

// In-process asset store. Stills are single images, videos are frame
// sequences sampled at a fixed rate. Assets can be registered before their
// data arrives and are reported as not ready until then.
class MemoryAssetProvider : public QObject, public AssetProvider
{
    Q_OBJECT

public:
    explicit MemoryAssetProvider(QObject* parent = nullptr);

    void insertPending(const QString& assetId);
    void insertImage(const QString& assetId, const QImage& image);
    bool loadImage(const QString& assetId, const QString& filePath);
    void insertVideo(const QString& assetId, const QVector<QImage>& frames, double frameRate);
    void removeAsset(const QString& assetId);
    bool contains(const QString& assetId) const;

    // AssetProvider
    bool isReady(const QString& assetId) const override;
    QImage image(const QString& assetId) const override;
    QImage videoFrame(const QString& assetId, double mediaTime) const override;
    double mediaDuration(const QString& assetId) const override;

signals:
    void assetReady(const QString& assetId);

private:
    struct Entry {
        QVector<QImage> frames;
        double frameRate = 0.0;
        bool ready = false;
    };

    QHash<QString, Entry> m_assets;
};

#endif
