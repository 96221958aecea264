#ifndef HITTESTER_H
#define HITTESTER_H

#include "../Common/LayerTypes.h"
#include "../Rendering/LayerGeometry.h"
#include <QPointF>
#include <optional>

class Layer;
class Scene;

// Maps a scene position to the top-most interactable layer, using the same
// resolved properties and geometry the compositor paints with.
class HitTester
{
public:
    explicit HitTester(const Scene* scene = nullptr);

    void setScene(const Scene* scene);
    void setHandleMetrics(const SelectionHandleMetrics& metrics);
    const SelectionHandleMetrics& getHandleMetrics() const;

    // Top-most visible, active and unlocked layer containing the point
    Layer* layerAt(const QPointF& point, double time) const;

    // Gesture started by grabbing the selection decoration of a layer, if any
    std::optional<GestureKind> handleAt(const Layer& layer, const QPointF& point, double time) const;

private:
    const Scene* m_scene;
    SelectionHandleMetrics m_handleMetrics;
};

Layer* hitTest(const Scene& scene, const QPointF& point, double time);

#endif
