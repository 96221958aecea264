#include "HitTester.h"
#include "../Animation/Scene.h"
#include "../Animation/Layer.h"

HitTester::HitTester(const Scene* scene)
    : m_scene(scene)
{
}

void HitTester::setScene(const Scene* scene)
{
    m_scene = scene;
}

void HitTester::setHandleMetrics(const SelectionHandleMetrics& metrics)
{
    m_handleMetrics = metrics;
}

const SelectionHandleMetrics& HitTester::getHandleMetrics() const
{
    return m_handleMetrics;
}

Layer* HitTester::layerAt(const QPointF& point, double time) const
{
    if (!m_scene) return nullptr;

    const std::vector<Layer*> layers = m_scene->activeLayersAt(time, Scene::LayerOrder::TopToBottom);
    for (Layer* layer : layers) {
        if (layer->isLocked()) {
            continue;
        }

        const LayerTransform properties = layer->propertiesAt(time);
        if (LayerGeometry::containsPoint(properties, layer->getSize(), point)) {
            return layer;
        }
    }

    return nullptr;
}

std::optional<GestureKind> HitTester::handleAt(const Layer& layer, const QPointF& point, double time) const
{
    if (layer.isLocked() || !layer.isVisible() || !layer.isActiveAt(time)) {
        return std::nullopt;
    }

    const LayerTransform properties = layer.propertiesAt(time);
    const QPointF local = LayerGeometry::mapToLocal(properties, point);

    for (const QRectF& handle : LayerGeometry::cornerHandleRects(layer.getSize(), m_handleMetrics)) {
        if (handle.contains(local)) {
            return GestureKind::Resize;
        }
    }

    if (LayerGeometry::rotationHandleRect(layer.getSize(), m_handleMetrics).contains(local)) {
        return GestureKind::Rotate;
    }

    return std::nullopt;
}

Layer* hitTest(const Scene& scene, const QPointF& point, double time)
{
    return HitTester(&scene).layerAt(point, time);
}
