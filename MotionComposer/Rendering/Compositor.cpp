#include "Compositor.h"
#include "AssetProvider.h"
#include "../Animation/Scene.h"
#include "../Animation/Layer.h"
#include <QPainter>
#include <QPolygonF>
#include <QFont>
#include <QFontMetricsF>
#include <QStringList>
#include <QLineF>
#include <QVector>
#include <QPen>
#include <algorithm>

using namespace MotionComposer;

Compositor::Compositor(const AssetProvider* assets)
    : m_assets(assets)
{
}

void Compositor::setAssetProvider(const AssetProvider* assets)
{
    m_assets = assets;
}

const AssetProvider* Compositor::getAssetProvider() const
{
    return m_assets;
}

void Compositor::setOptions(const CompositeOptions& options)
{
    m_options = options;
}

const CompositeOptions& Compositor::getOptions() const
{
    return m_options;
}

QImage Compositor::compositeFrame(const Scene& scene, double time,
    const QSize& targetSize, qreal devicePixelRatio) const
{
    QSize logicalSize = targetSize;
    if (logicalSize.isEmpty()) {
        logicalSize = scene.getProjectSize().toSize();
    }
    if (devicePixelRatio <= 0.0) {
        devicePixelRatio = 1.0;
    }

    QImage frame(logicalSize * devicePixelRatio, QImage::Format_ARGB32_Premultiplied);
    frame.setDevicePixelRatio(devicePixelRatio);
    frame.fill(Qt::transparent);

    QPainter painter(&frame);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.setTransform(LayerGeometry::viewTransform(scene.getProjectSize(), QSizeF(logicalSize)));

    paint(&painter, scene, time);
    painter.end();

    return frame;
}

QImage Compositor::compositeFrame(const Scene& scene, double time) const
{
    return compositeFrame(scene, time, scene.getProjectSize().toSize());
}

void Compositor::paint(QPainter* painter, const Scene& scene, double time) const
{
    if (!painter) return;

    drawBackground(painter, scene);
    if (m_options.showGrid) {
        drawGrid(painter, scene);
    }

    const std::vector<Layer*> layers = scene.activeLayersAt(time, Scene::LayerOrder::BottomToTop);
    for (const Layer* layer : layers) {
        paintLayer(painter, *layer, time);
    }

    if (m_options.drawSelection && scene.getToolMode() == ToolMode::Select) {
        const Layer* selected = scene.getSelectedLayer();
        if (selected && selected->isVisible() && selected->isActiveAt(time)) {
            paintSelection(painter, *selected, time);
        }
    }
}

void Compositor::paintLayer(QPainter* painter, const Layer& layer, double time) const
{
    const LayerTransform properties = layer.propertiesAt(time);

    painter->save();
    painter->setTransform(LayerGeometry::frameTransform(properties), true);
    painter->setOpacity(painter->opacity() * properties.opacity);

    std::visit(Visitor{
        [&](const ImageContent& content) { drawImageContent(painter, layer, content); },
        [&](const TextContent& content) { drawTextContent(painter, content); },
        [&](const ShapeContent& content) { drawShapeContent(painter, layer, content); },
        [&](const VideoContent& content) { drawVideoContent(painter, layer, content, time); },
        [](const AudioContent&) {},
        [](const AdjustmentContent&) {},
    }, layer.getContent());

    painter->restore();
}

void Compositor::paintSelection(QPainter* painter, const Layer& layer, double time) const
{
    const LayerTransform properties = layer.propertiesAt(time);
    const QSizeF size = layer.getSize();

    painter->save();
    painter->setTransform(LayerGeometry::frameTransform(properties), true);

    QPen outlinePen(QColor(0x00, 0xd4, 0xff), 2);
    outlinePen.setStyle(Qt::DashLine);
    outlinePen.setCosmetic(true);
    painter->setPen(outlinePen);
    painter->setBrush(Qt::NoBrush);
    painter->drawRect(LayerGeometry::localBounds(size));

    painter->setPen(Qt::NoPen);
    painter->setBrush(QColor(0x00, 0xd4, 0xff));
    for (const QRectF& handle : LayerGeometry::cornerHandleRects(size, m_options.handles)) {
        painter->drawRect(handle);
    }

    painter->setBrush(QColor(0xff, 0x6b, 0x6b));
    painter->drawRect(LayerGeometry::rotationHandleRect(size, m_options.handles));

    painter->restore();
}

void Compositor::drawBackground(QPainter* painter, const Scene& scene) const
{
    painter->fillRect(QRectF(QPointF(0, 0), scene.getProjectSize()), m_options.backgroundColor);
}

void Compositor::drawGrid(QPainter* painter, const Scene& scene) const
{
    if (m_options.gridSize <= 0) return;

    const QSizeF size = scene.getProjectSize();

    painter->save();
    QPen gridPen(QColor(255, 255, 255, 25), 1);
    gridPen.setCosmetic(true);
    painter->setPen(gridPen);

    QVector<QLineF> lines;
    for (double x = 0; x <= size.width(); x += m_options.gridSize) {
        lines.append(QLineF(x, 0, x, size.height()));
    }
    for (double y = 0; y <= size.height(); y += m_options.gridSize) {
        lines.append(QLineF(0, y, size.width(), y));
    }
    painter->drawLines(lines);
    painter->restore();
}

void Compositor::drawImageContent(QPainter* painter, const Layer& layer, const ImageContent& content) const
{
    if (!m_assets || !m_assets->isReady(content.assetId)) {
        return;
    }

    const QImage image = m_assets->image(content.assetId);
    if (image.isNull()) {
        return;
    }
    painter->drawImage(LayerGeometry::localBounds(layer.getSize()), image);
}

void Compositor::drawTextContent(QPainter* painter, const TextContent& content) const
{
    QFont font(content.fontFamily);
    font.setPixelSize(std::max(1, qRound(content.fontSize)));
    painter->setFont(font);
    painter->setPen(content.color);

    const QFontMetricsF metrics(font);
    const QStringList lines = content.text.split(QLatin1Char('\n'));
    const double lineHeight = content.fontSize * 1.2;
    const double totalHeight = lines.size() * lineHeight;

    for (int i = 0; i < lines.size(); ++i) {
        const QString& line = lines.at(i);
        const double width = metrics.horizontalAdvance(line);

        double x = -width / 2.0;
        if (content.alignment & Qt::AlignLeft) {
            x = 0.0;
        }
        else if (content.alignment & Qt::AlignRight) {
            x = -width;
        }

        // Line centre, then drop to the baseline of a vertically centred glyph run
        const double centerY = i * lineHeight - totalHeight / 2.0 + lineHeight / 2.0;
        const double baseline = centerY + (metrics.ascent() - metrics.descent()) / 2.0;
        painter->drawText(QPointF(x, baseline), line);
    }
}

void Compositor::drawShapeContent(QPainter* painter, const Layer& layer, const ShapeContent& content) const
{
    const QRectF bounds = LayerGeometry::localBounds(layer.getSize());

    painter->setBrush(content.fill);
    if (content.strokeWidth > 0.0) {
        painter->setPen(QPen(content.stroke, content.strokeWidth));
    }
    else {
        painter->setPen(Qt::NoPen);
    }

    switch (content.kind) {
    case ShapeKind::Rectangle:
        painter->drawRect(bounds);
        break;
    case ShapeKind::Circle: {
        const double radius = std::min(bounds.width(), bounds.height()) / 2.0;
        painter->drawEllipse(QPointF(0, 0), radius, radius);
        break;
    }
    case ShapeKind::Triangle: {
        QPolygonF triangle;
        triangle << QPointF(0, bounds.top())
                 << QPointF(bounds.right(), bounds.bottom())
                 << QPointF(bounds.left(), bounds.bottom());
        painter->drawPolygon(triangle);
        break;
    }
    }
}

void Compositor::drawVideoContent(QPainter* painter, const Layer& layer, const VideoContent& content, double time) const
{
    if (!m_assets || !m_assets->isReady(content.assetId)) {
        return;
    }

    double mediaDuration = m_assets->mediaDuration(content.assetId);
    if (mediaDuration <= 0.0) {
        mediaDuration = content.intrinsicDuration;
    }

    const double mediaTime = time - layer.getStartTime();
    if (mediaTime < 0.0 || (mediaDuration > 0.0 && mediaTime > mediaDuration)) {
        return;
    }

    const QImage frame = m_assets->videoFrame(content.assetId, mediaTime);
    if (frame.isNull()) {
        return;
    }
    painter->drawImage(LayerGeometry::localBounds(layer.getSize()), frame);
}

QImage compositeFrame(const Scene& scene, double time, const Compositor& compositor)
{
    return compositor.compositeFrame(scene, time);
}
