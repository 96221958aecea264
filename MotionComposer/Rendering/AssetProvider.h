#ifndef ASSETPROVIDER_H
#define ASSETPROVIDER_H

#include <QImage>
#include <QString>

// Resolves asset ids to decoded media. Loading happens elsewhere; the
// compositor only asks whether an asset is ready and what it looks like now.
// A provider that is also a QObject may declare an assetReady(QString)
// signal; EditorSession recomposites whenever it fires.
class AssetProvider
{
public:
    virtual ~AssetProvider() = default;

    virtual bool isReady(const QString& assetId) const = 0;
    virtual QImage image(const QString& assetId) const = 0;
    virtual QImage videoFrame(const QString& assetId, double mediaTime) const = 0;

    // Length of a time-based asset in seconds, 0 when unknown or still
    virtual double mediaDuration(const QString& assetId) const = 0;
};

#endif
