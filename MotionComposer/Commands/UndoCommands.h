// Commands/UndoCommands.h
#ifndef UNDOCOMMANDS_H
#define UNDOCOMMANDS_H

#include "../Common/LayerTypes.h"
#include "../Animation/Layer.h"
#include <QUndoCommand>
#include <memory>

class Scene;
class PersistenceSink;

// Base command for scene edits. Every redo and undo ends by handing the
// affected state to the persistence sink.
class SceneCommand : public QUndoCommand
{
public:
    SceneCommand(Scene* scene, PersistenceSink* sink, QUndoCommand* parent = nullptr);

protected:
    void commitLayer(LayerId id);
    void commitRemoval(LayerId id);
    void commitOrder();

    Scene* m_scene;
    PersistenceSink* m_sink;
};

// Base transform change from a gesture, nudge or property edit. The layer
// already holds the new transform when the command is pushed.
class TransformLayerCommand : public SceneCommand
{
public:
    TransformLayerCommand(Scene* scene, PersistenceSink* sink, LayerId layerId,
        const LayerTransform& oldTransform, const LayerTransform& newTransform,
        QUndoCommand* parent = nullptr);

    void undo() override;
    void redo() override;
    bool mergeWith(const QUndoCommand* other) override;
    int id() const override { return 1; }

    // Consecutive nudges of the same layer collapse into one step
    void setMergeable(bool mergeable) { m_mergeable = mergeable; }

private:
    void apply(const LayerTransform& transform);

    LayerId m_layerId;
    LayerTransform m_oldTransform;
    LayerTransform m_newTransform;
    bool m_firstTime;
    bool m_mergeable;
};

// Add layer command. Owns the layer while it is outside the scene.
class AddLayerCommand : public SceneCommand
{
public:
    AddLayerCommand(Scene* scene, PersistenceSink* sink, std::unique_ptr<Layer> layer,
        int index, QUndoCommand* parent = nullptr);

    void undo() override;
    void redo() override;

    LayerId getLayerId() const { return m_layerId; }

private:
    std::unique_ptr<Layer> m_layer;
    LayerId m_layerId;
    int m_index;
};

// Remove layer command. Restores the layer at its previous z-index.
class RemoveLayerCommand : public SceneCommand
{
public:
    RemoveLayerCommand(Scene* scene, PersistenceSink* sink, LayerId layerId,
        QUndoCommand* parent = nullptr);

    void undo() override;
    void redo() override;

private:
    std::unique_ptr<Layer> m_layer;
    LayerId m_layerId;
    int m_index;
};

// Z-order change
class MoveLayerCommand : public SceneCommand
{
public:
    MoveLayerCommand(Scene* scene, PersistenceSink* sink, LayerId layerId,
        int fromIndex, int toIndex, QUndoCommand* parent = nullptr);

    void undo() override;
    void redo() override;

private:
    LayerId m_layerId;
    int m_fromIndex;
    int m_toIndex;
};

// Whole-layer snapshot swap for keyframe, flag, timing and content edits.
// The layer already matches the new snapshot when the command is pushed.
class LayerSnapshotCommand : public SceneCommand
{
public:
    LayerSnapshotCommand(Scene* scene, PersistenceSink* sink, const Layer& before,
        const Layer& after, const QString& text, QUndoCommand* parent = nullptr);

    void undo() override;
    void redo() override;

private:
    void apply(const Layer& snapshot);

    Layer m_before;
    Layer m_after;
    bool m_firstTime;
};

#endif
