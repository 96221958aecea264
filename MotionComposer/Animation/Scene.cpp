#include "Scene.h"
#include <QDebug>
#include <QtGlobal>
#include <algorithm>

Scene::Scene(QObject* parent)
    : QObject(parent)
    , m_nextLayerId(1)
    , m_currentTime(0.0)
    , m_duration(10.0)
    , m_projectSize(1920.0, 1080.0)
    , m_selectedLayerId(MotionComposer::InvalidLayerId)
    , m_toolMode(ToolMode::Select)
{
}

Scene::~Scene()
{
}

LayerId Scene::allocateLayerId()
{
    return m_nextLayerId++;
}

Layer* Scene::addLayer(const QString& name, const LayerContent& content)
{
    auto layer = std::make_unique<Layer>(allocateLayerId(), name, content);
    return insertLayer(std::move(layer), getLayerCount());
}

Layer* Scene::insertLayer(std::unique_ptr<Layer> layer, int index)
{
    if (!layer) {
        return nullptr;
    }

    if (getLayer(layer->getId())) {
        qWarning() << "Scene: layer" << layer->getId() << "is already in the scene";
        return nullptr;
    }

    // Restored layers keep their id; make sure it is never handed out again
    m_nextLayerId = std::max(m_nextLayerId, layer->getId() + 1);

    index = qBound(0, index, getLayerCount());
    Layer* inserted = layer.get();
    m_layers.insert(m_layers.begin() + index, std::move(layer));

    qDebug() << "Scene: added layer" << inserted->getId() << inserted->getName() << "at index" << index;
    emit layerAdded(inserted->getId(), index);
    emit changed();
    return inserted;
}

std::unique_ptr<Layer> Scene::takeLayer(LayerId id)
{
    const int index = indexOf(id);
    if (index < 0) {
        qWarning() << "Scene: cannot remove unknown layer" << id;
        return nullptr;
    }

    std::unique_ptr<Layer> layer = std::move(m_layers[index]);
    m_layers.erase(m_layers.begin() + index);

    if (m_selectedLayerId == id) {
        clearSelection();
    }

    qDebug() << "Scene: removed layer" << id;
    emit layerRemoved(id);
    emit changed();
    return layer;
}

bool Scene::removeLayer(LayerId id)
{
    return takeLayer(id) != nullptr;
}

bool Scene::moveLayer(LayerId id, int toIndex)
{
    const int fromIndex = indexOf(id);
    if (fromIndex < 0) {
        qWarning() << "Scene: cannot move unknown layer" << id;
        return false;
    }

    toIndex = qBound(0, toIndex, getLayerCount() - 1);
    if (toIndex == fromIndex) {
        return false;
    }

    std::unique_ptr<Layer> layer = std::move(m_layers[fromIndex]);
    m_layers.erase(m_layers.begin() + fromIndex);
    m_layers.insert(m_layers.begin() + toIndex, std::move(layer));

    emit layerOrderChanged();
    emit changed();
    return true;
}

void Scene::clear()
{
    m_layers.clear();
    clearSelection();
    emit layerOrderChanged();
    emit changed();
}

Layer* Scene::getLayer(LayerId id) const
{
    for (const auto& layer : m_layers) {
        if (layer->getId() == id) {
            return layer.get();
        }
    }
    return nullptr;
}

Layer* Scene::layerAt(int index) const
{
    if (index >= 0 && index < getLayerCount()) {
        return m_layers[index].get();
    }
    return nullptr;
}

int Scene::indexOf(LayerId id) const
{
    for (int i = 0; i < getLayerCount(); ++i) {
        if (m_layers[i]->getId() == id) {
            return i;
        }
    }
    return -1;
}

int Scene::getLayerCount() const
{
    return static_cast<int>(m_layers.size());
}

std::vector<LayerId> Scene::getLayerOrder() const
{
    std::vector<LayerId> order;
    order.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        order.push_back(layer->getId());
    }
    return order;
}

std::vector<Layer*> Scene::activeLayersAt(double time, LayerOrder order) const
{
    std::vector<Layer*> active;
    for (const auto& layer : m_layers) {
        if (layer->isVisible() && layer->isActiveAt(time)) {
            active.push_back(layer.get());
        }
    }

    if (order == LayerOrder::TopToBottom) {
        std::reverse(active.begin(), active.end());
    }
    return active;
}

double Scene::getCurrentTime() const
{
    return m_currentTime;
}

void Scene::setCurrentTime(double time)
{
    const double clamped = qBound(0.0, time, m_duration);
    if (clamped == m_currentTime) {
        return;
    }

    m_currentTime = clamped;
    emit currentTimeChanged(m_currentTime);
    emit changed();
}

double Scene::getDuration() const
{
    return m_duration;
}

bool Scene::setDuration(double duration)
{
    if (!(duration > 0.0)) {
        qWarning() << "Scene: rejecting non-positive project duration" << duration;
        return false;
    }

    m_duration = duration;
    emit durationChanged(m_duration);

    if (m_currentTime > m_duration) {
        setCurrentTime(m_duration);
    }
    return true;
}

QSizeF Scene::getProjectSize() const
{
    return m_projectSize;
}

void Scene::setProjectSize(const QSizeF& size)
{
    if (size.isEmpty()) {
        qWarning() << "Scene: rejecting empty project size" << size;
        return;
    }
    m_projectSize = size;
    emit changed();
}

LayerId Scene::getSelectedLayerId() const
{
    return m_selectedLayerId;
}

Layer* Scene::getSelectedLayer() const
{
    return getLayer(m_selectedLayerId);
}

void Scene::setSelectedLayerId(LayerId id)
{
    if (id != MotionComposer::InvalidLayerId && !getLayer(id)) {
        qWarning() << "Scene: cannot select unknown layer" << id;
        return;
    }

    if (id != m_selectedLayerId) {
        m_selectedLayerId = id;
        emit selectionChanged(id);
        emit changed();
    }
}

void Scene::clearSelection()
{
    setSelectedLayerId(MotionComposer::InvalidLayerId);
}

ToolMode Scene::getToolMode() const
{
    return m_toolMode;
}

void Scene::setToolMode(ToolMode mode)
{
    if (mode != m_toolMode) {
        m_toolMode = mode;
        emit toolModeChanged(mode);
        emit changed();
    }
}

void Scene::notifyLayerChanged(LayerId id)
{
    emit layerChanged(id);
    emit changed();
}

std::vector<Layer*> activeLayers(const Scene& scene, double time, Scene::LayerOrder order)
{
    return scene.activeLayersAt(time, order);
}
