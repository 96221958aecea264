#include "LayerGeometry.h"
#include <QtMath>
#include <algorithm>
#include <cmath>

QTransform LayerGeometry::frameTransform(const LayerTransform& properties)
{
    QTransform transform;
    transform.translate(properties.x, properties.y);
    transform.rotate(properties.rotation);
    transform.scale(properties.scale, properties.scale);
    return transform;
}

QRectF LayerGeometry::localBounds(const QSizeF& size)
{
    return QRectF(-size.width() / 2.0, -size.height() / 2.0, size.width(), size.height());
}

QPointF LayerGeometry::mapToUnscaledLocal(const LayerTransform& properties, const QPointF& scenePoint)
{
    const double dx = scenePoint.x() - properties.x;
    const double dy = scenePoint.y() - properties.y;

    // Rotate back by the negated angle
    const double angle = degreesToRadians(-properties.rotation);
    const double cosA = std::cos(angle);
    const double sinA = std::sin(angle);

    return QPointF(dx * cosA - dy * sinA, dx * sinA + dy * cosA);
}

bool LayerGeometry::containsPoint(const LayerTransform& properties, const QSizeF& size, const QPointF& scenePoint)
{
    const QPointF local = mapToUnscaledLocal(properties, scenePoint);
    const double halfWidth = size.width() * properties.scale / 2.0;
    const double halfHeight = size.height() * properties.scale / 2.0;

    return std::abs(local.x()) <= halfWidth && std::abs(local.y()) <= halfHeight;
}

QPointF LayerGeometry::mapToLocal(const LayerTransform& properties, const QPointF& scenePoint)
{
    const QPointF unscaled = mapToUnscaledLocal(properties, scenePoint);
    return unscaled / properties.scale;
}

std::array<QRectF, 4> LayerGeometry::cornerHandleRects(const QSizeF& size, const SelectionHandleMetrics& metrics)
{
    const QRectF bounds = localBounds(size);
    const double half = metrics.handleSize / 2.0;
    const QSizeF handle(metrics.handleSize, metrics.handleSize);

    return {
        QRectF(bounds.topLeft() - QPointF(half, half), handle),
        QRectF(bounds.topRight() - QPointF(half, half), handle),
        QRectF(bounds.bottomRight() - QPointF(half, half), handle),
        QRectF(bounds.bottomLeft() - QPointF(half, half), handle),
    };
}

QRectF LayerGeometry::rotationHandleRect(const QSizeF& size, const SelectionHandleMetrics& metrics)
{
    // Stem standing on the middle of the top edge
    return QRectF(-metrics.rotationHandleWidth / 2.0,
        -size.height() / 2.0 - metrics.rotationHandleOffset,
        metrics.rotationHandleWidth,
        metrics.rotationHandleOffset);
}

QTransform LayerGeometry::viewTransform(const QSizeF& projectSize, const QSizeF& targetSize, double zoom)
{
    QTransform transform;
    if (projectSize.isEmpty() || targetSize.isEmpty()) {
        return transform;
    }

    const double fit = std::min(targetSize.width() / projectSize.width(),
        targetSize.height() / projectSize.height()) * zoom;

    transform.translate((targetSize.width() - projectSize.width() * fit) / 2.0,
        (targetSize.height() - projectSize.height() * fit) / 2.0);
    transform.scale(fit, fit);
    return transform;
}

double LayerGeometry::degreesToRadians(double degrees)
{
    return qDegreesToRadians(degrees);
}
