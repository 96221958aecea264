#include "Layer.h"
#include <QDebug>
#include <QtGlobal>
#include <cmath>

Layer::Layer(LayerId id, const QString& name, const LayerContent& content)
    : m_id(id)
    , m_name(name)
    , m_content(content)
    , m_size(100.0, 100.0)
    , m_startTime(0.0)
    , m_duration(DefaultDuration)
    , m_visible(true)
    , m_locked(false)
{
}

LayerId Layer::getId() const
{
    return m_id;
}

std::unique_ptr<Layer> Layer::clone(LayerId newId) const
{
    auto copy = std::make_unique<Layer>(*this);
    copy->m_id = newId;
    return copy;
}

void Layer::setName(const QString& name)
{
    m_name = name;
}

QString Layer::getName() const
{
    return m_name;
}

LayerType Layer::getType() const
{
    return MotionComposer::layerTypeOf(m_content);
}

const LayerContent& Layer::getContent() const
{
    return m_content;
}

void Layer::setContent(const LayerContent& content)
{
    m_content = content;
}

const LayerTransform& Layer::getBaseTransform() const
{
    return m_baseTransform;
}

void Layer::setBaseTransform(const LayerTransform& transform)
{
    setPosition(QPointF(transform.x, transform.y));
    setScale(transform.scale);
    setRotation(transform.rotation);
    setOpacity(transform.opacity);
}

void Layer::setPosition(const QPointF& position)
{
    m_baseTransform.x = position.x();
    m_baseTransform.y = position.y();
}

QPointF Layer::getPosition() const
{
    return QPointF(m_baseTransform.x, m_baseTransform.y);
}

bool Layer::setScale(double scale)
{
    if (!(scale > 0.0)) {
        qWarning() << "Layer" << m_id << ": rejecting non-positive scale" << scale;
        return false;
    }
    m_baseTransform.scale = scale;
    return true;
}

void Layer::setRotation(double degrees)
{
    m_baseTransform.rotation = MotionComposer::normalizeRotation(degrees);
}

void Layer::setOpacity(double opacity)
{
    m_baseTransform.opacity = qBound(0.0, opacity, 1.0);
}

QSizeF Layer::getSize() const
{
    return m_size;
}

bool Layer::setSize(const QSizeF& size)
{
    if (!(size.width() > 0.0) || !(size.height() > 0.0)) {
        qWarning() << "Layer" << m_id << ": rejecting degenerate size" << size;
        return false;
    }
    m_size = size;
    return true;
}

void Layer::setStartTime(double startTime)
{
    m_startTime = startTime;
}

double Layer::getStartTime() const
{
    return m_startTime;
}

bool Layer::setDuration(double duration)
{
    if (duration < 0.0) {
        qWarning() << "Layer" << m_id << ": rejecting negative duration" << duration;
        return false;
    }
    m_duration = duration;
    return true;
}

double Layer::getDuration() const
{
    return m_duration;
}

bool Layer::isActiveAt(double time) const
{
    return time >= m_startTime && time < m_startTime + m_duration;
}

void Layer::setVisible(bool visible)
{
    m_visible = visible;
}

bool Layer::isVisible() const
{
    return m_visible;
}

void Layer::setLocked(bool locked)
{
    m_locked = locked;
}

bool Layer::isLocked() const
{
    return m_locked;
}

bool Layer::setKeyframe(const Keyframe& keyframe)
{
    if (!std::isfinite(keyframe.getTime())) {
        qWarning() << "Layer" << m_id << ": rejecting keyframe at non-finite time" << keyframe.getTime();
        return false;
    }

    KeyframeProperties properties = keyframe.getProperties();
    if (properties.scale && !(*properties.scale > 0.0)) {
        qWarning() << "Layer" << m_id << ": rejecting keyframe with non-positive scale" << *properties.scale;
        return false;
    }
    if (properties.opacity) {
        properties.opacity = qBound(0.0, *properties.opacity, 1.0);
    }

    Keyframe stored = keyframe;
    stored.setProperties(properties);
    m_keyframes.insert_or_assign(stored.getTime(), stored);
    return true;
}

bool Layer::removeKeyframe(double time)
{
    return m_keyframes.erase(time) > 0;
}

void Layer::clearKeyframes()
{
    m_keyframes.clear();
}

const Keyframe* Layer::getKeyframe(double time) const
{
    auto it = m_keyframes.find(time);
    return (it != m_keyframes.end()) ? &it->second : nullptr;
}

bool Layer::hasKeyframe(double time) const
{
    return m_keyframes.find(time) != m_keyframes.end();
}

std::vector<double> Layer::getKeyframeTimes() const
{
    std::vector<double> times;
    times.reserve(m_keyframes.size());
    for (const auto& pair : m_keyframes) {
        times.push_back(pair.first);
    }
    return times;
}

const KeyframeMap& Layer::getKeyframes() const
{
    return m_keyframes;
}

LayerTransform Layer::propertiesAt(double time) const
{
    return KeyframeInterpolator::resolve(m_keyframes, m_baseTransform, time);
}
