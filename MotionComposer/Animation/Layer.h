#ifndef LAYER_H
#define LAYER_H

#include "../Common/LayerTypes.h"
#include "KeyframeInterpolator.h"
#include <QPointF>
#include <QSizeF>
#include <QString>
#include <memory>
#include <vector>

class Layer
{
public:
    static constexpr double DefaultDuration = 10.0;

    Layer(LayerId id, const QString& name, const LayerContent& content);

    // Identity
    LayerId getId() const;
    std::unique_ptr<Layer> clone(LayerId newId) const;

    void setName(const QString& name);
    QString getName() const;

    // Type-specific content
    LayerType getType() const;
    const LayerContent& getContent() const;
    void setContent(const LayerContent& content);

    // Base transform
    const LayerTransform& getBaseTransform() const;
    void setBaseTransform(const LayerTransform& transform);
    void setPosition(const QPointF& position);
    QPointF getPosition() const;
    bool setScale(double scale);
    void setRotation(double degrees);
    void setOpacity(double opacity);

    // Local, unscaled bounding box size
    QSizeF getSize() const;
    bool setSize(const QSizeF& size);

    // Active window on the global timeline
    void setStartTime(double startTime);
    double getStartTime() const;
    bool setDuration(double duration);
    double getDuration() const;
    bool isActiveAt(double time) const;

    void setVisible(bool visible);
    bool isVisible() const;

    void setLocked(bool locked);
    bool isLocked() const;

    // Keyframes, one per exact time
    bool setKeyframe(const Keyframe& keyframe);
    bool removeKeyframe(double time);
    void clearKeyframes();
    const Keyframe* getKeyframe(double time) const;
    bool hasKeyframe(double time) const;
    std::vector<double> getKeyframeTimes() const;
    const KeyframeMap& getKeyframes() const;

    // Resolved transform at the given time
    LayerTransform propertiesAt(double time) const;

private:
    LayerId m_id;
    QString m_name;
    LayerContent m_content;
    LayerTransform m_baseTransform;
    QSizeF m_size;
    double m_startTime;
    double m_duration;
    bool m_visible;
    bool m_locked;

    KeyframeMap m_keyframes;
};
#endif
