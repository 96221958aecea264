// Tools/Tool.cpp
#include "Tool.h"
#include "../EditorSession.h"

Tool::Tool(EditorSession* session, QObject* parent)
    : QObject(parent)
    , m_session(session)
{
}

void Tool::keyPressEvent(QKeyEvent* event)
{
    if (!m_session || !event) return;

    // Undo and redo work from every tool
    if (event->matches(QKeySequence::Undo)) {
        m_session->undo();
        event->accept();
    }
    else if (event->matches(QKeySequence::Redo)) {
        m_session->redo();
        event->accept();
    }
    else {
        event->ignore();
    }
}
