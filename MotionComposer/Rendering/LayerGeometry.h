#ifndef LAYERGEOMETRY_H
#define LAYERGEOMETRY_H

#include "../Common/LayerTypes.h"
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QTransform>
#include <array>

// Size of the selection decoration, in layer-local units
struct SelectionHandleMetrics {
    double handleSize = 8.0;
    double rotationHandleOffset = 20.0;
    double rotationHandleWidth = 6.0;
};

// Transform math shared by painting and hit testing. Both go through these
// functions so a layer is picked exactly where it is drawn.
class LayerGeometry
{
public:
    // Local frame: translate to (x, y), rotate, then scale uniformly
    static QTransform frameTransform(const LayerTransform& properties);

    // Bounding box centred on the local origin
    static QRectF localBounds(const QSizeF& size);

    // Scene point relative to the layer, with translation and rotation undone
    // but scale left in place
    static QPointF mapToUnscaledLocal(const LayerTransform& properties, const QPointF& scenePoint);
    static bool containsPoint(const LayerTransform& properties, const QSizeF& size, const QPointF& scenePoint);

    // Scene point in the fully inverted local frame (scale undone as well)
    static QPointF mapToLocal(const LayerTransform& properties, const QPointF& scenePoint);

    // Selection decoration in local units
    static std::array<QRectF, 4> cornerHandleRects(const QSizeF& size, const SelectionHandleMetrics& metrics);
    static QRectF rotationHandleRect(const QSizeF& size, const SelectionHandleMetrics& metrics);

    // Uniform fit of the project frame into a target, centred
    static QTransform viewTransform(const QSizeF& projectSize, const QSizeF& targetSize, double zoom = 1.0);

    static double degreesToRadians(double degrees);
};

#endif
