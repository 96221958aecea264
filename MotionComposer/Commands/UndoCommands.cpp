// Commands/UndoCommands.cpp
#include "UndoCommands.h"
#include "../Animation/Scene.h"
#include "../Common/PersistenceSink.h"
#include <QDebug>

SceneCommand::SceneCommand(Scene* scene, PersistenceSink* sink, QUndoCommand* parent)
    : QUndoCommand(parent)
    , m_scene(scene)
    , m_sink(sink)
{
}

void SceneCommand::commitLayer(LayerId id)
{
    if (!m_sink || !m_scene) {
        return;
    }

    if (Layer* layer = m_scene->getLayer(id)) {
        m_sink->layerCommitted(*layer);
    }
}

void SceneCommand::commitRemoval(LayerId id)
{
    if (m_sink) {
        m_sink->layerRemoved(id);
    }
}

void SceneCommand::commitOrder()
{
    if (m_sink && m_scene) {
        m_sink->layerOrderCommitted(m_scene->getLayerOrder());
    }
}

// TransformLayerCommand implementation
TransformLayerCommand::TransformLayerCommand(Scene* scene, PersistenceSink* sink, LayerId layerId,
    const LayerTransform& oldTransform, const LayerTransform& newTransform, QUndoCommand* parent)
    : SceneCommand(scene, sink, parent)
    , m_layerId(layerId)
    , m_oldTransform(oldTransform)
    , m_newTransform(newTransform)
    , m_firstTime(true)
    , m_mergeable(false)
{
    setText("Transform layer");
}

void TransformLayerCommand::undo()
{
    apply(m_oldTransform);
}

void TransformLayerCommand::redo()
{
    if (m_firstTime) {
        // The layer already shows the new transform; only the commit is owed
        m_firstTime = false;
        commitLayer(m_layerId);
        return;
    }
    apply(m_newTransform);
}

bool TransformLayerCommand::mergeWith(const QUndoCommand* other)
{
    const TransformLayerCommand* command = static_cast<const TransformLayerCommand*>(other);
    if (!m_mergeable || !command->m_mergeable || command->m_layerId != m_layerId) {
        return false;
    }

    m_newTransform = command->m_newTransform;
    return true;
}

void TransformLayerCommand::apply(const LayerTransform& transform)
{
    Layer* layer = m_scene ? m_scene->getLayer(m_layerId) : nullptr;
    if (!layer) {
        qWarning() << "TransformLayerCommand: layer" << m_layerId << "no longer exists";
        return;
    }

    layer->setBaseTransform(transform);
    m_scene->notifyLayerChanged(m_layerId);
    commitLayer(m_layerId);
}

// AddLayerCommand implementation
AddLayerCommand::AddLayerCommand(Scene* scene, PersistenceSink* sink, std::unique_ptr<Layer> layer,
    int index, QUndoCommand* parent)
    : SceneCommand(scene, sink, parent)
    , m_layer(std::move(layer))
    , m_layerId(m_layer ? m_layer->getId() : MotionComposer::InvalidLayerId)
    , m_index(index)
{
    setText(m_layer ? QString("Add %1").arg(m_layer->getName()) : QString("Add layer"));
}

void AddLayerCommand::redo()
{
    if (!m_scene || !m_layer) {
        return;
    }

    if (m_scene->insertLayer(std::move(m_layer), m_index)) {
        m_scene->setSelectedLayerId(m_layerId);
        commitLayer(m_layerId);
        commitOrder();
    }
}

void AddLayerCommand::undo()
{
    if (!m_scene) {
        return;
    }

    m_layer = m_scene->takeLayer(m_layerId);
    if (m_layer) {
        commitRemoval(m_layerId);
        commitOrder();
    }
}

// RemoveLayerCommand implementation
RemoveLayerCommand::RemoveLayerCommand(Scene* scene, PersistenceSink* sink, LayerId layerId,
    QUndoCommand* parent)
    : SceneCommand(scene, sink, parent)
    , m_layerId(layerId)
    , m_index(scene ? scene->indexOf(layerId) : -1)
{
    Layer* layer = scene ? scene->getLayer(layerId) : nullptr;
    setText(layer ? QString("Remove %1").arg(layer->getName()) : QString("Remove layer"));
}

void RemoveLayerCommand::redo()
{
    if (!m_scene) {
        return;
    }

    m_index = m_scene->indexOf(m_layerId);
    m_layer = m_scene->takeLayer(m_layerId);
    if (m_layer) {
        commitRemoval(m_layerId);
        commitOrder();
    }
}

void RemoveLayerCommand::undo()
{
    if (!m_scene || !m_layer) {
        return;
    }

    if (m_scene->insertLayer(std::move(m_layer), m_index)) {
        m_scene->setSelectedLayerId(m_layerId);
        commitLayer(m_layerId);
        commitOrder();
    }
}

// MoveLayerCommand implementation
MoveLayerCommand::MoveLayerCommand(Scene* scene, PersistenceSink* sink, LayerId layerId,
    int fromIndex, int toIndex, QUndoCommand* parent)
    : SceneCommand(scene, sink, parent)
    , m_layerId(layerId)
    , m_fromIndex(fromIndex)
    , m_toIndex(toIndex)
{
    setText("Reorder layer");
}

void MoveLayerCommand::undo()
{
    if (m_scene && m_scene->moveLayer(m_layerId, m_fromIndex)) {
        commitOrder();
    }
}

void MoveLayerCommand::redo()
{
    if (m_scene && m_scene->indexOf(m_layerId) != m_toIndex) {
        m_scene->moveLayer(m_layerId, m_toIndex);
    }
    commitOrder();
}

// LayerSnapshotCommand implementation
LayerSnapshotCommand::LayerSnapshotCommand(Scene* scene, PersistenceSink* sink, const Layer& before,
    const Layer& after, const QString& text, QUndoCommand* parent)
    : SceneCommand(scene, sink, parent)
    , m_before(before)
    , m_after(after)
    , m_firstTime(true)
{
    setText(text);
}

void LayerSnapshotCommand::undo()
{
    apply(m_before);
}

void LayerSnapshotCommand::redo()
{
    if (m_firstTime) {
        m_firstTime = false;
        commitLayer(m_after.getId());
        return;
    }
    apply(m_after);
}

void LayerSnapshotCommand::apply(const Layer& snapshot)
{
    Layer* layer = m_scene ? m_scene->getLayer(snapshot.getId()) : nullptr;
    if (!layer) {
        qWarning() << "LayerSnapshotCommand: layer" << snapshot.getId() << "no longer exists";
        return;
    }

    *layer = snapshot;
    m_scene->notifyLayerChanged(layer->getId());
    commitLayer(layer->getId());
}
