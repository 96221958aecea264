// Tools/ShapeTool.h
#ifndef SHAPETOOL_H
#define SHAPETOOL_H

#include "Tool.h"

// Drag out a shape layer; a plain click drops a default-sized one.
class ShapeTool : public Tool
{
    Q_OBJECT

public:
    explicit ShapeTool(EditorSession* session, QObject* parent = nullptr);

    ToolMode getMode() const override { return ToolMode::Shape; }

    void mousePressEvent(QMouseEvent* event, const QPointF& scenePos) override;
    void mouseMoveEvent(QMouseEvent* event, const QPointF& scenePos) override;
    void mouseReleaseEvent(QMouseEvent* event, const QPointF& scenePos) override;
    QCursor getCursor() const override { return Qt::CrossCursor; }
    void deactivate() override { m_drawing = false; }

    void setShapeKind(MotionComposer::ShapeKind kind) { m_shapeKind = kind; }
    MotionComposer::ShapeKind getShapeKind() const { return m_shapeKind; }

private:
    MotionComposer::ShapeKind m_shapeKind;
    QPointF m_startPoint;
    bool m_drawing;
};

#endif
