// Tools/SelectionTool.cpp
#include "SelectionTool.h"
#include "../EditorSession.h"
#include "../Animation/Scene.h"
#include "../Animation/Layer.h"
#include <QDebug>

SelectionTool::SelectionTool(EditorSession* session, QObject* parent)
    : Tool(session, parent)
    , m_pointerDown(false)
{
}

void SelectionTool::mousePressEvent(QMouseEvent* event, const QPointF& scenePos)
{
    if (!m_session || event->button() != Qt::LeftButton) return;

    Scene* scene = m_session->getScene();
    m_pointerDown = true;

    // Handles of the current selection win over the layers beneath them
    if (const auto handle = m_session->selectionHandleAt(scenePos)) {
        m_session->beginGesture(*handle, scene->getSelectedLayerId(), scenePos);
        return;
    }

    Layer* layer = m_session->hitTest(scenePos);
    if (!layer) {
        m_session->clearSelection();
        return;
    }

    m_session->selectLayer(layer->getId());
    m_session->beginGesture(GestureKind::Drag, layer->getId(), scenePos);
}

void SelectionTool::mouseMoveEvent(QMouseEvent* event, const QPointF& scenePos)
{
    Q_UNUSED(event);
    if (!m_session || !m_pointerDown) return;

    if (m_session->getInteractionController()->isActive()) {
        m_session->updateGesture(scenePos);
    }
}

void SelectionTool::mouseReleaseEvent(QMouseEvent* event, const QPointF& scenePos)
{
    if (!m_session || event->button() != Qt::LeftButton) return;

    if (m_pointerDown && m_session->getInteractionController()->isActive()) {
        m_session->updateGesture(scenePos);
        m_session->endGesture();
    }
    m_pointerDown = false;
}

void SelectionTool::keyPressEvent(QKeyEvent* event)
{
    if (!m_session) return;

    const bool control = event->modifiers() & Qt::ControlModifier;
    const bool shift = event->modifiers() & Qt::ShiftModifier;
    const LayerId selected = m_session->getScene()->getSelectedLayerId();

    switch (event->key()) {
    case Qt::Key_Delete:
    case Qt::Key_Backspace:
        m_session->removeSelectedLayer();
        break;

    case Qt::Key_Left:
        nudgeSelectedLayer(QPointF(-1, 0), shift);
        break;

    case Qt::Key_Right:
        nudgeSelectedLayer(QPointF(1, 0), shift);
        break;

    case Qt::Key_Up:
        nudgeSelectedLayer(QPointF(0, -1), shift);
        break;

    case Qt::Key_Down:
        nudgeSelectedLayer(QPointF(0, 1), shift);
        break;

    case Qt::Key_D:
        if (control && selected != MotionComposer::InvalidLayerId) {
            m_session->duplicateLayer(selected);
        }
        break;

    case Qt::Key_C:
        if (control && selected != MotionComposer::InvalidLayerId) {
            m_session->copyLayer(selected);
        }
        break;

    case Qt::Key_V:
        if (control) {
            m_session->pasteLayer();
        }
        break;

    case Qt::Key_Escape:
        if (m_session->getInteractionController()->isActive()) {
            m_session->cancelGesture();
            m_pointerDown = false;
        }
        else {
            m_session->clearSelection();
        }
        break;

    default:
        Tool::keyPressEvent(event);
        return;
    }

    event->accept();
}

QCursor SelectionTool::getCursor() const
{
    if (m_session && m_session->getInteractionController()->isActive()) {
        return Qt::ClosedHandCursor;
    }
    return Qt::ArrowCursor;
}

void SelectionTool::deactivate()
{
    if (m_session && m_session->getInteractionController()->isActive()) {
        m_session->cancelGesture();
    }
    m_pointerDown = false;
}

void SelectionTool::nudgeSelectedLayer(const QPointF& direction, bool largeStep)
{
    const LayerId selected = m_session->getScene()->getSelectedLayerId();
    if (selected == MotionComposer::InvalidLayerId) return;

    m_session->nudgeLayer(selected, direction * (largeStep ? 10.0 : 1.0));
}
