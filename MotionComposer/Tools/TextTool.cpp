// Tools/TextTool.cpp
#include "TextTool.h"
#include "../EditorSession.h"
#include "../Animation/Layer.h"

TextTool::TextTool(EditorSession* session, QObject* parent)
    : Tool(session, parent)
{
}

void TextTool::mousePressEvent(QMouseEvent* event, const QPointF& scenePos)
{
    if (!m_session || event->button() != Qt::LeftButton) return;

    if (Layer* layer = m_session->addTextLayer(scenePos)) {
        emit layerCreated(layer->getId());
        emit toolFinished();
    }
}

void TextTool::mouseMoveEvent(QMouseEvent* event, const QPointF& scenePos)
{
    // Text tool doesn't need mouse move handling
    Q_UNUSED(event);
    Q_UNUSED(scenePos);
}

void TextTool::mouseReleaseEvent(QMouseEvent* event, const QPointF& scenePos)
{
    Q_UNUSED(event);
    Q_UNUSED(scenePos);
}
