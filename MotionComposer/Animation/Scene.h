#ifndef SCENE_H
#define SCENE_H

#include "../Common/LayerTypes.h"
#include "Layer.h"
#include <QObject>
#include <QSizeF>
#include <QColor>
#include <memory>
#include <vector>

// Ordered layer stack (index 0 is the bottom), the timeline cursor and the
// editing state that composite and hit-test passes read.
class Scene : public QObject
{
    Q_OBJECT

public:
    enum class LayerOrder {
        BottomToTop, // composite order
        TopToBottom  // hit-test order
    };

    explicit Scene(QObject* parent = nullptr);
    ~Scene();

    // Layers
    Layer* addLayer(const QString& name, const LayerContent& content);
    Layer* insertLayer(std::unique_ptr<Layer> layer, int index);
    std::unique_ptr<Layer> takeLayer(LayerId id);
    bool removeLayer(LayerId id);
    bool moveLayer(LayerId id, int toIndex);
    void clear();
    LayerId allocateLayerId();

    Layer* getLayer(LayerId id) const;
    Layer* layerAt(int index) const;
    int indexOf(LayerId id) const;
    int getLayerCount() const;
    std::vector<LayerId> getLayerOrder() const;

    // Visible layers whose active window contains the given time
    std::vector<Layer*> activeLayersAt(double time, LayerOrder order = LayerOrder::BottomToTop) const;

    // Timeline
    double getCurrentTime() const;
    void setCurrentTime(double time);
    double getDuration() const;
    bool setDuration(double duration);

    // Project frame
    QSizeF getProjectSize() const;
    void setProjectSize(const QSizeF& size);

    // Selection and tool
    LayerId getSelectedLayerId() const;
    Layer* getSelectedLayer() const;
    void setSelectedLayerId(LayerId id);
    void clearSelection();

    ToolMode getToolMode() const;
    void setToolMode(ToolMode mode);

    void notifyLayerChanged(LayerId id);

signals:
    void layerAdded(LayerId id, int index);
    void layerRemoved(LayerId id);
    void layerOrderChanged();
    void layerChanged(LayerId id);
    void currentTimeChanged(double time);
    void durationChanged(double duration);
    void selectionChanged(LayerId id);
    void toolModeChanged(MotionComposer::ToolMode mode);
    void changed();

private:
    std::vector<std::unique_ptr<Layer>> m_layers;
    LayerId m_nextLayerId;
    double m_currentTime;
    double m_duration;
    QSizeF m_projectSize;
    LayerId m_selectedLayerId;
    ToolMode m_toolMode;
};

std::vector<Layer*> activeLayers(const Scene& scene, double time,
    Scene::LayerOrder order = Scene::LayerOrder::BottomToTop);

#endif
