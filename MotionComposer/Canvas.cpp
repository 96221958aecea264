#include "Canvas.h"
#include "EditorSession.h"
#include "Animation/Scene.h"
#include "Rendering/LayerGeometry.h"
#include "Tools/SelectionTool.h"
#include "Tools/TextTool.h"
#include "Tools/ShapeTool.h"
#include <QPainter>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QKeyEvent>
#include <QDebug>
#include <QtGlobal>

Canvas::Canvas(EditorSession* session, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
    , m_currentTool(nullptr)
    , m_zoomFactor(0.5)
{
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(true);
    setMinimumSize(320, 180);

    m_tools[ToolMode::Select] = std::make_unique<SelectionTool>(session);
    m_tools[ToolMode::Text] = std::make_unique<TextTool>(session);
    m_tools[ToolMode::Shape] = std::make_unique<ShapeTool>(session);

    // Creation tools hand control back to selection once they place a layer
    for (auto& toolPair : m_tools) {
        connect(toolPair.second.get(), &Tool::toolFinished, this, [this]() {
            m_session->setToolMode(ToolMode::Select);
        });
    }

    connect(m_session->getScene(), &Scene::toolModeChanged, this, &Canvas::onToolModeChanged);
    onToolModeChanged(m_session->getToolMode());

    m_session->setPresentationSurface(this);
}

Canvas::~Canvas()
{
    if (m_session) {
        m_session->setPresentationSurface(nullptr);
    }
}

void Canvas::present(const QImage& frame)
{
    m_frame = frame;
    update();
}

QSize Canvas::targetSize() const
{
    const QSizeF projectSize = m_session->getScene()->getProjectSize();
    return (projectSize * m_zoomFactor).toSize();
}

qreal Canvas::devicePixelRatio() const
{
    return devicePixelRatioF();
}

void Canvas::setZoomFactor(double factor)
{
    factor = qBound(MinimumZoom, factor, MaximumZoom);
    if (qFuzzyCompare(factor, m_zoomFactor)) {
        return;
    }

    m_zoomFactor = factor;
    m_session->requestComposite();
    emit zoomChanged(m_zoomFactor);
}

double Canvas::getZoomFactor() const { return m_zoomFactor; }

Tool* Canvas::getCurrentTool() const { return m_currentTool; }

void Canvas::zoomIn()
{
    setZoomFactor(m_zoomFactor * 1.25);
}

void Canvas::zoomOut()
{
    setZoomFactor(m_zoomFactor / 1.25);
}

void Canvas::zoomToFit()
{
    const QSizeF projectSize = m_session->getScene()->getProjectSize();
    if (projectSize.isEmpty()) return;

    const double fit = qMin(width() / projectSize.width(), height() / projectSize.height());
    setZoomFactor(fit * 0.95);
}

QRectF Canvas::frameRect() const
{
    const QSizeF frameSize = QSizeF(targetSize());
    return QRectF(QPointF((width() - frameSize.width()) / 2.0, (height() - frameSize.height()) / 2.0),
        frameSize);
}

QPointF Canvas::mapToScene(const QPointF& widgetPos) const
{
    const QRectF frame = frameRect();
    const QTransform view = LayerGeometry::viewTransform(m_session->getScene()->getProjectSize(), frame.size());
    return view.inverted().map(widgetPos - frame.topLeft());
}

void Canvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), QColor(40, 40, 40));

    if (!m_frame.isNull()) {
        painter.drawImage(frameRect(), m_frame);
    }
}

void Canvas::mousePressEvent(QMouseEvent* event)
{
    setFocus();
    if (m_currentTool) {
        m_currentTool->mousePressEvent(event, mapToScene(event->position()));
        setCursor(m_currentTool->getCursor());
    }
}

void Canvas::mouseMoveEvent(QMouseEvent* event)
{
    if (m_currentTool) {
        m_currentTool->mouseMoveEvent(event, mapToScene(event->position()));
    }
}

void Canvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (m_currentTool) {
        m_currentTool->mouseReleaseEvent(event, mapToScene(event->position()));
        setCursor(m_currentTool->getCursor());
    }
}

void Canvas::wheelEvent(QWheelEvent* event)
{
    const int steps = event->angleDelta().y() > 0 ? 1 : -1;
    if (event->angleDelta().y() == 0) {
        event->ignore();
        return;
    }

    if (event->modifiers() & Qt::ControlModifier) {
        const double scaleFactor = 1.15;
        setZoomFactor(steps > 0 ? m_zoomFactor * scaleFactor : m_zoomFactor / scaleFactor);
    }
    else {
        // Scrub one frame per notch
        m_session->stepFrames(-steps);
    }
    event->accept();
}

void Canvas::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Space && !event->isAutoRepeat()) {
        m_session->togglePlayback();
        event->accept();
        return;
    }

    if (m_currentTool) {
        m_currentTool->keyPressEvent(event);
        if (event->isAccepted()) {
            return;
        }
    }
    QWidget::keyPressEvent(event);
}

void Canvas::onToolModeChanged(MotionComposer::ToolMode mode)
{
    auto it = m_tools.find(mode);
    if (it == m_tools.end()) {
        qWarning() << "Canvas: no tool registered for mode" << static_cast<int>(mode);
        return;
    }

    if (m_currentTool && m_currentTool != it->second.get()) {
        m_currentTool->deactivate();
    }
    m_currentTool = it->second.get();
    setCursor(m_currentTool->getCursor());
}
