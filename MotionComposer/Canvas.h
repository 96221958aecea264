#ifndef CANVAS_H
#define CANVAS_H

#include "Common/LayerTypes.h"
#include "Rendering/PresentationSurface.h"
#include <QWidget>
#include <QImage>
#include <QPointF>
#include <map>
#include <memory>

class EditorSession;
class Tool;

// Preview widget. Shows the latest composited frame at the current zoom and
// feeds pointer and keyboard input, mapped into scene coordinates, to the
// active tool.
class Canvas : public QWidget, public PresentationSurface
{
    Q_OBJECT

public:
    static constexpr double MinimumZoom = 0.1;
    static constexpr double MaximumZoom = 5.0;

    explicit Canvas(EditorSession* session, QWidget* parent = nullptr);
    ~Canvas();

    // PresentationSurface
    void present(const QImage& frame) override;
    QSize targetSize() const override;
    qreal devicePixelRatio() const override;

    void setZoomFactor(double factor);
    double getZoomFactor() const;

    Tool* getCurrentTool() const;
    QPointF mapToScene(const QPointF& widgetPos) const;

public slots:
    void zoomIn();
    void zoomOut();
    void zoomToFit();

signals:
    void zoomChanged(double factor);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private slots:
    void onToolModeChanged(MotionComposer::ToolMode mode);

private:
    QRectF frameRect() const;

    EditorSession* m_session;
    std::map<ToolMode, std::unique_ptr<Tool>> m_tools;
    Tool* m_currentTool;
    QImage m_frame;
    double m_zoomFactor;
};

#endif
