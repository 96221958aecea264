#ifndef COMPOSITOR_H
#define COMPOSITOR_H

#include "LayerGeometry.h"
#include "../Common/LayerTypes.h"
#include <QColor>
#include <QImage>
#include <QSize>

class QPainter;
class Layer;
class Scene;
class AssetProvider;

struct CompositeOptions {
    QColor backgroundColor = QColor(0x1a, 0x1a, 0x2e);
    bool showGrid = false;
    int gridSize = 50;
    bool drawSelection = true;
    SelectionHandleMetrics handles;
};

// Paints the active layers of a scene back to front. Each layer is drawn in
// its own frame derived only from its resolved properties; layers whose asset
// is not ready are skipped for this frame.
class Compositor
{
public:
    explicit Compositor(const AssetProvider* assets = nullptr);

    void setAssetProvider(const AssetProvider* assets);
    const AssetProvider* getAssetProvider() const;
    void setOptions(const CompositeOptions& options);
    const CompositeOptions& getOptions() const;

    // Renders the project frame fitted into targetSize (logical pixels)
    QImage compositeFrame(const Scene& scene, double time,
        const QSize& targetSize, qreal devicePixelRatio = 1.0) const;
    QImage compositeFrame(const Scene& scene, double time) const;

    // Paints in project coordinates on an already transformed painter
    void paint(QPainter* painter, const Scene& scene, double time) const;
    void paintLayer(QPainter* painter, const Layer& layer, double time) const;
    void paintSelection(QPainter* painter, const Layer& layer, double time) const;

private:
    void drawBackground(QPainter* painter, const Scene& scene) const;
    void drawGrid(QPainter* painter, const Scene& scene) const;

    void drawImageContent(QPainter* painter, const Layer& layer, const MotionComposer::ImageContent& content) const;
    void drawTextContent(QPainter* painter, const MotionComposer::TextContent& content) const;
    void drawShapeContent(QPainter* painter, const Layer& layer, const MotionComposer::ShapeContent& content) const;
    void drawVideoContent(QPainter* painter, const Layer& layer, const MotionComposer::VideoContent& content, double time) const;

    const AssetProvider* m_assets;
    CompositeOptions m_options;
};

QImage compositeFrame(const Scene& scene, double time, const Compositor& compositor);

#endif
