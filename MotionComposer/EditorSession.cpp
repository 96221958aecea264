#include "EditorSession.h"
#include "Animation/Scene.h"
#include "Animation/PlaybackScheduler.h"
#include "Interaction/InteractionController.h"
#include "Commands/UndoCommands.h"
#include "Common/PersistenceSink.h"
#include "Rendering/AssetProvider.h"
#include "Rendering/PresentationSurface.h"
#include <QUndoStack>
#include <QSvgGenerator>
#include <QPainter>
#include <QFileInfo>
#include <QMetaObject>
#include <QDebug>
#include <QtGlobal>

using namespace MotionComposer;

EditorSession::EditorSession(const EditorSettings& settings, QObject* parent)
    : QObject(parent)
    , m_scene(new Scene(this))
    , m_scheduler(nullptr)
    , m_interaction(nullptr)
    , m_undoStack(new QUndoStack(this))
    , m_hitTester(m_scene)
    , m_sink(nullptr)
    , m_surface(nullptr)
    , m_compositePending(false)
{
    m_scheduler = new PlaybackScheduler(m_scene, this);
    m_interaction = new InteractionController(m_scene, this);

    connect(m_interaction, &InteractionController::gestureCommitted,
        this, &EditorSession::onGestureCommitted);

    connect(m_scene, &Scene::changed, this, &EditorSession::requestComposite);
    connect(m_scene, &Scene::selectionChanged, this, &EditorSession::requestComposite);
    connect(m_scene, &Scene::toolModeChanged, this, &EditorSession::requestComposite);

    applySettings(settings);
}

EditorSession::~EditorSession()
{
    // Commands reference the scene; drop them before it goes
    m_undoStack->clear();
}

void EditorSession::setAssetProvider(const AssetProvider* assets)
{
    disconnect(m_assetReadyConnection);
    m_compositor.setAssetProvider(assets);

    // Layers skipped while their asset was pending are drawn on the next composite
    const QObject* notifier = dynamic_cast<const QObject*>(assets);
    if (notifier && notifier->metaObject()->indexOfSignal("assetReady(QString)") >= 0) {
        m_assetReadyConnection = connect(notifier, SIGNAL(assetReady(QString)),
            this, SLOT(requestComposite()));
    }
    requestComposite();
}

void EditorSession::setPersistenceSink(PersistenceSink* sink)
{
    m_sink = sink;
}

void EditorSession::setPresentationSurface(PresentationSurface* surface)
{
    m_surface = surface;
    requestComposite();
}

void EditorSession::applySettings(const EditorSettings& settings)
{
    m_settings = settings;

    m_scheduler->setFrameRate(settings.frameRate);
    m_scene->setDuration(settings.projectDuration);
    if (settings.projectSize.isValid() && !settings.projectSize.isEmpty()) {
        m_scene->setProjectSize(QSizeF(settings.projectSize));
    }

    SelectionHandleMetrics handles;
    handles.handleSize = settings.handleSize;
    handles.rotationHandleOffset = settings.rotationHandleOffset;

    CompositeOptions options = m_compositor.getOptions();
    options.backgroundColor = settings.backgroundColor;
    options.showGrid = settings.showGrid;
    options.gridSize = settings.gridSize;
    options.handles = handles;
    m_compositor.setOptions(options);
    m_hitTester.setHandleMetrics(handles);

    requestComposite();
}

// Layer creation

Layer* EditorSession::addLayer(const QString& name, const LayerContent& content,
    const QPointF& position, const QSizeF& size)
{
    auto layer = std::make_unique<Layer>(m_scene->allocateLayerId(),
        name.isEmpty() ? nextLayerName(layerTypeOf(content)) : name, content);
    layer->setPosition(position);
    layer->setSize(size);
    layer->setDuration(m_scene->getDuration());
    return pushNewLayer(std::move(layer), m_scene->getLayerCount());
}

Layer* EditorSession::addTextLayer(const QPointF& position, const QString& text)
{
    TextContent content;
    content.text = text;
    return addLayer(QString(), content, position, QSizeF(300.0, 100.0));
}

Layer* EditorSession::addShapeLayer(ShapeKind kind, const QRectF& rect)
{
    ShapeContent content;
    content.kind = kind;

    QRectF bounds = rect.normalized();
    if (bounds.width() < 1.0 || bounds.height() < 1.0) {
        bounds = QRectF(rect.topLeft() - QPointF(50.0, 50.0), QSizeF(100.0, 100.0));
    }
    return addLayer(QString(), content, bounds.center(), bounds.size());
}

Layer* EditorSession::addImageLayer(const QString& assetId, const QPointF& position, const QSizeF& size)
{
    ImageContent content;
    content.assetId = assetId;
    return addLayer(QString(), content, position, size);
}

Layer* EditorSession::addVideoLayer(const QString& assetId, double intrinsicDuration,
    const QPointF& position, const QSizeF& size)
{
    VideoContent content;
    content.assetId = assetId;
    content.intrinsicDuration = intrinsicDuration;

    auto layer = std::make_unique<Layer>(m_scene->allocateLayerId(), nextLayerName(LayerType::Video), content);
    layer->setPosition(position);
    layer->setSize(size);
    // A clip starts out as long as its media
    layer->setDuration(intrinsicDuration > 0.0 ? intrinsicDuration : m_scene->getDuration());
    return pushNewLayer(std::move(layer), m_scene->getLayerCount());
}

Layer* EditorSession::addAudioLayer(const QString& assetId)
{
    AudioContent content;
    content.assetId = assetId;
    const QSizeF projectSize = m_scene->getProjectSize();
    return addLayer(QString(), content, QPointF(projectSize.width() / 2.0, projectSize.height() / 2.0),
        QSizeF(100.0, 100.0));
}

// Layer editing

bool EditorSession::removeLayer(LayerId id)
{
    if (!editableLayer(id, "remove")) {
        return false;
    }

    if (m_interaction->getActiveLayerId() == id) {
        m_interaction->cancelGesture();
    }

    m_undoStack->push(new RemoveLayerCommand(m_scene, m_sink, id));
    return true;
}

bool EditorSession::removeSelectedLayer()
{
    const LayerId id = m_scene->getSelectedLayerId();
    if (id == InvalidLayerId) {
        return false;
    }
    return removeLayer(id);
}

Layer* EditorSession::duplicateLayer(LayerId id)
{
    Layer* source = editableLayer(id, "duplicate");
    if (!source) {
        return nullptr;
    }

    std::unique_ptr<Layer> copy = source->clone(m_scene->allocateLayerId());
    copy->setName(source->getName() + " Copy");
    return pushNewLayer(std::move(copy), m_scene->indexOf(id) + 1);
}

bool EditorSession::copyLayer(LayerId id)
{
    Layer* layer = editableLayer(id, "copy");
    if (!layer) {
        return false;
    }

    m_clipboard = *layer;
    qDebug() << "EditorSession: copied layer" << id << "to clipboard";
    return true;
}

Layer* EditorSession::pasteLayer()
{
    if (!m_clipboard) {
        qDebug() << "EditorSession: clipboard is empty";
        return nullptr;
    }

    std::unique_ptr<Layer> pasted = m_clipboard->clone(m_scene->allocateLayerId());
    pasted->setPosition(pasted->getPosition() + QPointF(m_settings.pasteOffset, m_settings.pasteOffset));
    return pushNewLayer(std::move(pasted), m_scene->getLayerCount());
}

bool EditorSession::moveLayer(LayerId id, int toIndex)
{
    const int fromIndex = m_scene->indexOf(id);
    if (fromIndex < 0) {
        qWarning() << "EditorSession: cannot reorder unknown layer" << id;
        return false;
    }

    toIndex = qBound(0, toIndex, m_scene->getLayerCount() - 1);
    if (toIndex == fromIndex) {
        return false;
    }

    m_undoStack->push(new MoveLayerCommand(m_scene, m_sink, id, fromIndex, toIndex));
    return true;
}

bool EditorSession::setLayerVisible(LayerId id, bool visible)
{
    Layer* layer = editableLayer(id, "change visibility of");
    if (!layer || layer->isVisible() == visible) {
        return false;
    }

    const Layer before = *layer;
    layer->setVisible(visible);
    pushSnapshot(before, *layer, visible ? "Show layer" : "Hide layer");
    return true;
}

bool EditorSession::setLayerLocked(LayerId id, bool locked)
{
    Layer* layer = editableLayer(id, "change lock of");
    if (!layer || layer->isLocked() == locked) {
        return false;
    }

    if (locked && m_interaction->getActiveLayerId() == id) {
        m_interaction->cancelGesture();
    }

    const Layer before = *layer;
    layer->setLocked(locked);
    pushSnapshot(before, *layer, locked ? "Lock layer" : "Unlock layer");
    return true;
}

bool EditorSession::toggleLayerVisible(LayerId id)
{
    Layer* layer = editableLayer(id, "toggle visibility of");
    return layer && setLayerVisible(id, !layer->isVisible());
}

bool EditorSession::toggleLayerLocked(LayerId id)
{
    Layer* layer = editableLayer(id, "toggle lock of");
    return layer && setLayerLocked(id, !layer->isLocked());
}

bool EditorSession::setLayerTransform(LayerId id, const LayerTransform& transform)
{
    Layer* layer = editableLayer(id, "transform");
    if (!layer) {
        return false;
    }

    const LayerTransform before = layer->getBaseTransform();
    layer->setBaseTransform(transform);
    const LayerTransform after = layer->getBaseTransform();
    if (after == before) {
        return false;
    }

    m_scene->notifyLayerChanged(id);
    m_undoStack->push(new TransformLayerCommand(m_scene, m_sink, id, before, after));
    return true;
}

bool EditorSession::setLayerName(LayerId id, const QString& name)
{
    Layer* layer = editableLayer(id, "rename");
    if (!layer || name.isEmpty() || layer->getName() == name) {
        return false;
    }

    const Layer before = *layer;
    layer->setName(name);
    pushSnapshot(before, *layer, "Rename layer");
    return true;
}

bool EditorSession::setLayerContent(LayerId id, const LayerContent& content)
{
    Layer* layer = editableLayer(id, "edit content of");
    if (!layer) {
        return false;
    }

    const Layer before = *layer;
    layer->setContent(content);
    pushSnapshot(before, *layer, "Edit layer content");
    return true;
}

bool EditorSession::setLayerTiming(LayerId id, double startTime, double duration)
{
    Layer* layer = editableLayer(id, "retime");
    if (!layer) {
        return false;
    }

    const Layer before = *layer;
    layer->setStartTime(startTime);
    if (!layer->setDuration(duration)) {
        *layer = before;
        return false;
    }
    pushSnapshot(before, *layer, "Change layer timing");
    return true;
}

bool EditorSession::setLayerSize(LayerId id, const QSizeF& size)
{
    Layer* layer = editableLayer(id, "resize");
    if (!layer) {
        return false;
    }

    const Layer before = *layer;
    if (!layer->setSize(size)) {
        return false;
    }
    pushSnapshot(before, *layer, "Resize layer");
    return true;
}

bool EditorSession::nudgeLayer(LayerId id, const QPointF& delta)
{
    Layer* layer = editableLayer(id, "nudge");
    if (!layer || layer->isLocked()) {
        return false;
    }

    const LayerTransform before = layer->getBaseTransform();
    layer->setPosition(layer->getPosition() + delta);
    m_scene->notifyLayerChanged(id);

    auto* command = new TransformLayerCommand(m_scene, m_sink, id, before, layer->getBaseTransform());
    command->setMergeable(true);
    m_undoStack->push(command);
    return true;
}

// Keyframes

bool EditorSession::addKeyframe(LayerId id)
{
    Layer* layer = editableLayer(id, "add a keyframe to");
    if (!layer) {
        return false;
    }

    const Layer before = *layer;
    const double time = m_scene->getCurrentTime();
    if (!layer->setKeyframe(Keyframe(time, KeyframeProperties::fromTransform(layer->getBaseTransform())))) {
        return false;
    }
    qDebug() << "EditorSession: keyframe at" << time << "on layer" << id;
    pushSnapshot(before, *layer, "Add keyframe");
    return true;
}

bool EditorSession::setKeyframe(LayerId id, double time, const KeyframeProperties& properties,
    QEasingCurve::Type easing)
{
    Layer* layer = editableLayer(id, "set a keyframe on");
    if (!layer) {
        return false;
    }
    if (properties.isEmpty()) {
        qWarning() << "EditorSession: ignoring keyframe without properties at" << time;
        return false;
    }

    const Layer before = *layer;
    Keyframe keyframe(time, properties);
    keyframe.setEasing(easing);
    if (!layer->setKeyframe(keyframe)) {
        return false;
    }
    pushSnapshot(before, *layer, "Set keyframe");
    return true;
}

bool EditorSession::removeKeyframe(LayerId id, double time)
{
    Layer* layer = editableLayer(id, "remove a keyframe from");
    if (!layer) {
        return false;
    }

    const Layer before = *layer;
    if (!layer->removeKeyframe(time)) {
        return false;
    }
    pushSnapshot(before, *layer, "Remove keyframe");
    return true;
}

bool EditorSession::clearKeyframes(LayerId id)
{
    Layer* layer = editableLayer(id, "clear keyframes of");
    if (!layer || layer->getKeyframes().empty()) {
        return false;
    }

    const Layer before = *layer;
    layer->clearKeyframes();
    pushSnapshot(before, *layer, "Clear keyframes");
    return true;
}

// Selection and tool

bool EditorSession::selectLayer(LayerId id)
{
    if (!m_scene->getLayer(id)) {
        qWarning() << "EditorSession: cannot select unknown layer" << id;
        return false;
    }
    m_scene->setSelectedLayerId(id);
    return true;
}

void EditorSession::clearSelection()
{
    m_scene->clearSelection();
}

void EditorSession::setToolMode(ToolMode mode)
{
    if (m_interaction->isActive()) {
        m_interaction->cancelGesture();
    }
    m_scene->setToolMode(mode);
}

ToolMode EditorSession::getToolMode() const
{
    return m_scene->getToolMode();
}

bool EditorSession::undo()
{
    if (!m_undoStack->canUndo()) {
        return false;
    }
    if (m_interaction->isActive()) {
        m_interaction->cancelGesture();
    }
    qDebug() << "EditorSession: undo" << m_undoStack->undoText();
    m_undoStack->undo();
    return true;
}

bool EditorSession::redo()
{
    if (!m_undoStack->canRedo()) {
        return false;
    }
    if (m_interaction->isActive()) {
        m_interaction->cancelGesture();
    }
    qDebug() << "EditorSession: redo" << m_undoStack->redoText();
    m_undoStack->redo();
    return true;
}

// Playback

void EditorSession::play()
{
    m_scheduler->play();
}

void EditorSession::pause()
{
    m_scheduler->pause();
}

void EditorSession::stop()
{
    m_scheduler->stop();
}

void EditorSession::togglePlayback()
{
    m_scheduler->togglePlayback();
}

void EditorSession::seek(double time)
{
    m_scheduler->seek(time);
}

void EditorSession::stepFrames(int frames)
{
    m_scheduler->stepFrames(frames);
}

bool EditorSession::isPlaying() const
{
    return m_scheduler->isPlaying();
}

double EditorSession::getCurrentTime() const
{
    return m_scene->getCurrentTime();
}

// Pointer interaction

Layer* EditorSession::hitTest(const QPointF& scenePos) const
{
    return m_hitTester.layerAt(scenePos, m_scene->getCurrentTime());
}

std::optional<GestureKind> EditorSession::selectionHandleAt(const QPointF& scenePos) const
{
    const Layer* selected = m_scene->getSelectedLayer();
    if (!selected || m_scene->getToolMode() != ToolMode::Select) {
        return std::nullopt;
    }
    return m_hitTester.handleAt(*selected, scenePos, m_scene->getCurrentTime());
}

bool EditorSession::beginGesture(GestureKind kind, LayerId id, const QPointF& scenePos)
{
    return m_interaction->beginGesture(kind, id, scenePos);
}

bool EditorSession::updateGesture(const QPointF& scenePos)
{
    return m_interaction->updateGesture(scenePos);
}

bool EditorSession::endGesture()
{
    return m_interaction->endGesture();
}

void EditorSession::cancelGesture()
{
    m_interaction->cancelGesture();
}

void EditorSession::onGestureCommitted(LayerId id, const LayerTransform& before, const LayerTransform& after)
{
    if (before == after) {
        // Nothing to undo, but the commit still goes out
        if (m_sink) {
            if (Layer* layer = m_scene->getLayer(id)) {
                m_sink->layerCommitted(*layer);
            }
        }
        return;
    }

    m_undoStack->push(new TransformLayerCommand(m_scene, m_sink, id, before, after));
}

// Output

QImage EditorSession::compositeFrame(const QSize& targetSize, qreal devicePixelRatio) const
{
    return m_compositor.compositeFrame(*m_scene, m_scene->getCurrentTime(), targetSize, devicePixelRatio);
}

bool EditorSession::exportFrame(const QString& filePath) const
{
    if (filePath.isEmpty()) {
        return false;
    }

    // Exports never carry the selection decoration
    Compositor exporter(m_compositor.getAssetProvider());
    CompositeOptions options = m_compositor.getOptions();
    options.drawSelection = false;
    exporter.setOptions(options);

    const double time = m_scene->getCurrentTime();
    const QSizeF projectSize = m_scene->getProjectSize();
    const QString format = QFileInfo(filePath).suffix().toUpper();

    if (format == "SVG") {
        QSvgGenerator generator;
        generator.setFileName(filePath);
        generator.setSize(projectSize.toSize());
        generator.setViewBox(QRectF(QPointF(0, 0), projectSize));
        generator.setTitle("MotionComposer Export");
        generator.setDescription(QString("Frame at %1 s").arg(time));

        QPainter painter;
        if (!painter.begin(&generator)) {
            qWarning() << "EditorSession: could not open" << filePath << "for SVG export";
            return false;
        }
        painter.setRenderHint(QPainter::Antialiasing, true);
        exporter.paint(&painter, *m_scene, time);
        painter.end();
    }
    else {
        const QImage image = exporter.compositeFrame(*m_scene, time);
        if (!image.save(filePath)) {
            qWarning() << "EditorSession: failed to write frame to" << filePath;
            return false;
        }
    }

    qDebug() << "EditorSession: exported frame at" << time << "to" << filePath;
    return true;
}

void EditorSession::requestComposite()
{
    if (m_compositePending) {
        return;
    }
    m_compositePending = true;
    QMetaObject::invokeMethod(this, &EditorSession::performComposite, Qt::QueuedConnection);
}

void EditorSession::performComposite()
{
    m_compositePending = false;
    if (!m_surface) {
        return;
    }

    const QImage frame = compositeFrame(m_surface->targetSize(), m_surface->devicePixelRatio());
    m_surface->present(frame);
    emit framePresented(m_scene->getCurrentTime());
}

// Helpers

Layer* EditorSession::pushNewLayer(std::unique_ptr<Layer> layer, int index)
{
    const LayerId id = layer->getId();
    m_undoStack->push(new AddLayerCommand(m_scene, m_sink, std::move(layer), index));
    return m_scene->getLayer(id);
}

Layer* EditorSession::editableLayer(LayerId id, const char* operation) const
{
    Layer* layer = m_scene->getLayer(id);
    if (!layer) {
        qWarning() << "EditorSession: cannot" << operation << "unknown layer" << id;
    }
    return layer;
}

void EditorSession::pushSnapshot(const Layer& before, const Layer& after, const QString& text)
{
    m_scene->notifyLayerChanged(after.getId());
    m_undoStack->push(new LayerSnapshotCommand(m_scene, m_sink, before, after, text));
}

QString EditorSession::nextLayerName(LayerType type) const
{
    int count = 1;
    for (int i = 0; i < m_scene->getLayerCount(); ++i) {
        if (m_scene->layerAt(i)->getType() == type) {
            ++count;
        }
    }
    return QString("%1 %2").arg(layerTypeName(type)).arg(count);
}
