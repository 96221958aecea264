#ifndef EDITORSESSION_H
#define EDITORSESSION_H

#include "Common/LayerTypes.h"
#include "Common/EditorSettings.h"
#include "Animation/Layer.h"
#include "Rendering/Compositor.h"
#include "Interaction/HitTester.h"
#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QImage>
#include <QEasingCurve>
#include <optional>

class Scene;
class PlaybackScheduler;
class InteractionController;
class QUndoStack;
class AssetProvider;
class PersistenceSink;
class PresentationSurface;

// Owns one editing session: the scene, its playback clock, the gesture state
// machine and the undo history. Every committed mutation goes through the
// undo stack and from there to the persistence sink.
class EditorSession : public QObject
{
    Q_OBJECT

public:
    explicit EditorSession(const EditorSettings& settings = EditorSettings(), QObject* parent = nullptr);
    ~EditorSession();

    Scene* getScene() const { return m_scene; }
    PlaybackScheduler* getPlaybackScheduler() const { return m_scheduler; }
    InteractionController* getInteractionController() const { return m_interaction; }
    QUndoStack* getUndoStack() const { return m_undoStack; }
    const HitTester& getHitTester() const { return m_hitTester; }
    const Compositor& getCompositor() const { return m_compositor; }

    // Collaborators, not owned
    void setAssetProvider(const AssetProvider* assets);
    void setPersistenceSink(PersistenceSink* sink);
    void setPresentationSurface(PresentationSurface* surface);

    void applySettings(const EditorSettings& settings);
    const EditorSettings& getSettings() const { return m_settings; }

    // Layer creation
    Layer* addLayer(const QString& name, const LayerContent& content,
        const QPointF& position, const QSizeF& size);
    Layer* addTextLayer(const QPointF& position, const QString& text = QStringLiteral("New Text"));
    Layer* addShapeLayer(MotionComposer::ShapeKind kind, const QRectF& rect);
    Layer* addImageLayer(const QString& assetId, const QPointF& position, const QSizeF& size);
    Layer* addVideoLayer(const QString& assetId, double intrinsicDuration,
        const QPointF& position, const QSizeF& size);
    Layer* addAudioLayer(const QString& assetId);

    // Layer editing
    bool removeLayer(LayerId id);
    bool removeSelectedLayer();
    Layer* duplicateLayer(LayerId id);
    bool copyLayer(LayerId id);
    Layer* pasteLayer();
    bool hasClipboard() const { return m_clipboard.has_value(); }
    bool moveLayer(LayerId id, int toIndex);
    bool setLayerVisible(LayerId id, bool visible);
    bool setLayerLocked(LayerId id, bool locked);
    bool toggleLayerVisible(LayerId id);
    bool toggleLayerLocked(LayerId id);
    bool setLayerTransform(LayerId id, const LayerTransform& transform);
    bool setLayerName(LayerId id, const QString& name);
    bool setLayerContent(LayerId id, const LayerContent& content);
    bool setLayerTiming(LayerId id, double startTime, double duration);
    bool setLayerSize(LayerId id, const QSizeF& size);
    bool nudgeLayer(LayerId id, const QPointF& delta);

    // Keyframes
    bool addKeyframe(LayerId id);
    bool setKeyframe(LayerId id, double time, const KeyframeProperties& properties,
        QEasingCurve::Type easing = QEasingCurve::Linear);
    bool removeKeyframe(LayerId id, double time);
    bool clearKeyframes(LayerId id);

    // Selection and tool
    bool selectLayer(LayerId id);
    void clearSelection();
    void setToolMode(ToolMode mode);
    ToolMode getToolMode() const;

    bool undo();
    bool redo();

    // Playback
    void play();
    void pause();
    void stop();
    void togglePlayback();
    void seek(double time);
    void stepFrames(int frames);
    bool isPlaying() const;
    double getCurrentTime() const;

    // Pointer interaction in scene coordinates
    Layer* hitTest(const QPointF& scenePos) const;
    std::optional<GestureKind> selectionHandleAt(const QPointF& scenePos) const;
    bool beginGesture(GestureKind kind, LayerId id, const QPointF& scenePos);
    bool updateGesture(const QPointF& scenePos);
    bool endGesture();
    void cancelGesture();

    // Output
    QImage compositeFrame(const QSize& targetSize, qreal devicePixelRatio = 1.0) const;
    bool exportFrame(const QString& filePath) const;

public slots:
    // Queued and coalesced; the frame is rendered once the event loop is idle
    void requestComposite();

signals:
    void framePresented(double time);

private slots:
    void performComposite();
    void onGestureCommitted(LayerId id, const LayerTransform& before, const LayerTransform& after);

private:
    Layer* pushNewLayer(std::unique_ptr<Layer> layer, int index);
    Layer* editableLayer(LayerId id, const char* operation) const;
    void pushSnapshot(const Layer& before, const Layer& after, const QString& text);
    QString nextLayerName(LayerType type) const;

    Scene* m_scene;
    PlaybackScheduler* m_scheduler;
    InteractionController* m_interaction;
    QUndoStack* m_undoStack;
    HitTester m_hitTester;
    Compositor m_compositor;
    EditorSettings m_settings;

    PersistenceSink* m_sink;
    PresentationSurface* m_surface;

    std::optional<Layer> m_clipboard;
    QMetaObject::Connection m_assetReadyConnection;
    bool m_compositePending;
};

#endif
