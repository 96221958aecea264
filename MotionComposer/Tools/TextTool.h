// Tools/TextTool.h
#ifndef TEXTTOOL_H
#define TEXTTOOL_H

#include "Tool.h"

class TextTool : public Tool
{
    Q_OBJECT

public:
    explicit TextTool(EditorSession* session, QObject* parent = nullptr);

    ToolMode getMode() const override { return ToolMode::Text; }

    void mousePressEvent(QMouseEvent* event, const QPointF& scenePos) override;
    void mouseMoveEvent(QMouseEvent* event, const QPointF& scenePos) override;
    void mouseReleaseEvent(QMouseEvent* event, const QPointF& scenePos) override;
    QCursor getCursor() const override { return Qt::IBeamCursor; }
};

#endif
