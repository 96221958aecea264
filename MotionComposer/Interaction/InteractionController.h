#ifndef INTERACTIONCONTROLLER_H
#define INTERACTIONCONTROLLER_H

#include "../Common/LayerTypes.h"
#include <QObject>
#include <QPointF>
#include <QSizeF>

class Scene;
class Layer;

// Drag / resize / rotate state machine. Every update is computed from the
// snapshot taken when the gesture began, never from the previous update.
// Updates change the layer's base transform for display only; the result is
// announced once through gestureCommitted() when the gesture ends.
class InteractionController : public QObject
{
    Q_OBJECT

public:
    enum class Mode {
        Idle,
        Dragging,
        Resizing,
        Rotating
    };

    static constexpr double MinimumScale = 0.1;

    explicit InteractionController(Scene* scene, QObject* parent = nullptr);

    bool beginGesture(GestureKind kind, LayerId layerId, const QPointF& pointer);
    bool updateGesture(const QPointF& pointer);
    bool endGesture();

    // Puts the layer back to its snapshot and returns to idle without committing
    void cancelGesture();

    Mode getMode() const;
    bool isActive() const;
    LayerId getActiveLayerId() const;

signals:
    void gestureStarted(LayerId id, MotionComposer::GestureKind kind);
    void gestureCommitted(LayerId id, const LayerTransform& before, const LayerTransform& after);

private:
    Layer* activeLayer() const;
    void resetSession();
    static double pointerAngle(const QPointF& pivot, const QPointF& pointer);

    Scene* m_scene;
    Mode m_mode;
    LayerId m_layerId;

    // Snapshot taken at gesture start
    QPointF m_anchorPointer;
    LayerTransform m_anchorTransform;
    QSizeF m_anchorSize;
    QPointF m_pivot;
    double m_anchorAngle;
};

#endif
