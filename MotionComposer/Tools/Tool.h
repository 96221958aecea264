// Tools/Tool.h
#ifndef TOOL_H
#define TOOL_H

#include "../Common/LayerTypes.h"
#include <QObject>
#include <QMouseEvent>
#include <QKeyEvent>
#include <QCursor>
#include <QPointF>

class EditorSession;

// Pointer and keyboard input for one tool mode. Positions arrive already
// mapped into scene coordinates.
class Tool : public QObject
{
    Q_OBJECT

public:
    explicit Tool(EditorSession* session, QObject* parent = nullptr);
    virtual ~Tool() = default;

    virtual ToolMode getMode() const = 0;

    virtual void mousePressEvent(QMouseEvent* event, const QPointF& scenePos) = 0;
    virtual void mouseMoveEvent(QMouseEvent* event, const QPointF& scenePos) = 0;
    virtual void mouseReleaseEvent(QMouseEvent* event, const QPointF& scenePos) = 0;
    virtual void keyPressEvent(QKeyEvent* event);
    virtual QCursor getCursor() const { return Qt::ArrowCursor; }

    // Drops any pointer state when the tool is switched away
    virtual void deactivate() {}

signals:
    void layerCreated(LayerId id);
    void toolFinished();

protected:
    EditorSession* m_session;
};

#endif
