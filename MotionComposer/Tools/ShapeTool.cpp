// Tools/ShapeTool.cpp
#include "ShapeTool.h"
#include "../EditorSession.h"
#include "../Animation/Layer.h"
#include <QRectF>

ShapeTool::ShapeTool(EditorSession* session, QObject* parent)
    : Tool(session, parent)
    , m_shapeKind(MotionComposer::ShapeKind::Rectangle)
    , m_drawing(false)
{
}

void ShapeTool::mousePressEvent(QMouseEvent* event, const QPointF& scenePos)
{
    if (event->button() == Qt::LeftButton) {
        m_drawing = true;
        m_startPoint = scenePos;
    }
}

void ShapeTool::mouseMoveEvent(QMouseEvent* event, const QPointF& scenePos)
{
    // The shape is created on release; nothing is previewed while dragging
    Q_UNUSED(event);
    Q_UNUSED(scenePos);
}

void ShapeTool::mouseReleaseEvent(QMouseEvent* event, const QPointF& scenePos)
{
    if (!m_session || !m_drawing || event->button() != Qt::LeftButton) return;
    m_drawing = false;

    // Tiny drags count as a click
    QRectF rect = QRectF(m_startPoint, scenePos).normalized();
    if (rect.width() < 5.0 || rect.height() < 5.0) {
        rect = QRectF(m_startPoint, QSizeF());
    }

    if (Layer* layer = m_session->addShapeLayer(m_shapeKind, rect)) {
        emit layerCreated(layer->getId());
        emit toolFinished();
    }
}
