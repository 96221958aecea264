// Tools/SelectionTool.h
#ifndef SELECTIONTOOL_H
#define SELECTIONTOOL_H

#include "Tool.h"

class SelectionTool : public Tool
{
    Q_OBJECT

public:
    explicit SelectionTool(EditorSession* session, QObject* parent = nullptr);

    ToolMode getMode() const override { return ToolMode::Select; }

    void mousePressEvent(QMouseEvent* event, const QPointF& scenePos) override;
    void mouseMoveEvent(QMouseEvent* event, const QPointF& scenePos) override;
    void mouseReleaseEvent(QMouseEvent* event, const QPointF& scenePos) override;
    void keyPressEvent(QKeyEvent* event) override;
    QCursor getCursor() const override;

    void deactivate() override;

private:
    void nudgeSelectedLayer(const QPointF& direction, bool largeStep);

    bool m_pointerDown;
};

#endif
