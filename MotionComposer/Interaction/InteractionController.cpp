#include "InteractionController.h"
#include "../Animation/Scene.h"
#include "../Animation/Layer.h"
#include <QDebug>
#include <QtMath>
#include <algorithm>
#include <cmath>

InteractionController::InteractionController(Scene* scene, QObject* parent)
    : QObject(parent)
    , m_scene(scene)
    , m_mode(Mode::Idle)
    , m_layerId(MotionComposer::InvalidLayerId)
    , m_anchorAngle(0.0)
{
}

bool InteractionController::beginGesture(GestureKind kind, LayerId layerId, const QPointF& pointer)
{
    if (m_mode != Mode::Idle) {
        qWarning() << "InteractionController: ignoring new gesture while another is active on layer" << m_layerId;
        return false;
    }

    if (!m_scene || m_scene->getToolMode() != ToolMode::Select) {
        return false;
    }

    Layer* layer = m_scene->getLayer(layerId);
    if (!layer) {
        qWarning() << "InteractionController: cannot start a gesture on unknown layer" << layerId;
        return false;
    }
    if (layer->isLocked()) {
        qDebug() << "InteractionController: layer" << layerId << "is locked";
        return false;
    }

    m_layerId = layerId;
    m_anchorPointer = pointer;
    m_anchorTransform = layer->getBaseTransform();
    m_anchorSize = layer->getSize();

    switch (kind) {
    case GestureKind::Drag:
        m_mode = Mode::Dragging;
        break;
    case GestureKind::Resize:
        m_mode = Mode::Resizing;
        break;
    case GestureKind::Rotate:
        m_mode = Mode::Rotating;
        // Rotate around where the layer is drawn right now
        {
            const LayerTransform resolved = layer->propertiesAt(m_scene->getCurrentTime());
            m_pivot = QPointF(resolved.x, resolved.y);
        }
        m_anchorAngle = pointerAngle(m_pivot, pointer);
        break;
    }

    qDebug() << "InteractionController: started gesture" << static_cast<int>(kind) << "on layer" << layerId;
    emit gestureStarted(layerId, kind);
    return true;
}

bool InteractionController::updateGesture(const QPointF& pointer)
{
    if (m_mode == Mode::Idle) {
        qWarning() << "InteractionController: update without an active gesture ignored";
        return false;
    }

    Layer* layer = activeLayer();
    if (!layer) {
        qWarning() << "InteractionController: layer" << m_layerId << "vanished during gesture";
        resetSession();
        return false;
    }

    const QPointF delta = pointer - m_anchorPointer;

    switch (m_mode) {
    case Mode::Dragging:
        layer->setPosition(QPointF(m_anchorTransform.x, m_anchorTransform.y) + delta);
        break;

    case Mode::Resizing: {
        const double width = m_anchorSize.width();
        const double height = m_anchorSize.height();
        const double scaleX = (width + delta.x()) / width;
        const double scaleY = (height + delta.y()) / height;
        const double scale = std::min(scaleX, scaleY) * m_anchorTransform.scale;
        layer->setScale(std::max(MinimumScale, scale));
        break;
    }

    case Mode::Rotating: {
        const double angle = pointerAngle(m_pivot, pointer);
        layer->setRotation(m_anchorTransform.rotation + (angle - m_anchorAngle));
        break;
    }

    case Mode::Idle:
        break;
    }

    m_scene->notifyLayerChanged(m_layerId);
    return true;
}

bool InteractionController::endGesture()
{
    if (m_mode == Mode::Idle) {
        qWarning() << "InteractionController: end without an active gesture ignored";
        return false;
    }

    Layer* layer = activeLayer();
    const LayerId id = m_layerId;
    const LayerTransform before = m_anchorTransform;
    resetSession();

    if (!layer) {
        qWarning() << "InteractionController: layer" << id << "vanished before commit";
        return false;
    }

    const LayerTransform after = layer->getBaseTransform();
    qDebug() << "InteractionController: committing gesture on layer" << id;
    emit gestureCommitted(id, before, after);
    return true;
}

void InteractionController::cancelGesture()
{
    if (m_mode == Mode::Idle) {
        return;
    }

    if (Layer* layer = activeLayer()) {
        layer->setBaseTransform(m_anchorTransform);
        m_scene->notifyLayerChanged(m_layerId);
    }
    resetSession();
}

InteractionController::Mode InteractionController::getMode() const
{
    return m_mode;
}

bool InteractionController::isActive() const
{
    return m_mode != Mode::Idle;
}

LayerId InteractionController::getActiveLayerId() const
{
    return m_layerId;
}

Layer* InteractionController::activeLayer() const
{
    return m_scene ? m_scene->getLayer(m_layerId) : nullptr;
}

void InteractionController::resetSession()
{
    m_mode = Mode::Idle;
    m_layerId = MotionComposer::InvalidLayerId;
    m_anchorAngle = 0.0;
}

double InteractionController::pointerAngle(const QPointF& pivot, const QPointF& pointer)
{
    return qRadiansToDegrees(std::atan2(pointer.y() - pivot.y(), pointer.x() - pivot.x()));
}
