#include "Keyframe.h"

Keyframe::Keyframe(double time, const KeyframeProperties& properties)
    : m_time(time)
    , m_properties(properties)
    , m_easing(QEasingCurve::Linear)
{
}

double Keyframe::getTime() const
{
    return m_time;
}

const KeyframeProperties& Keyframe::getProperties() const
{
    return m_properties;
}

void Keyframe::setProperties(const KeyframeProperties& properties)
{
    m_properties = properties;
}

void Keyframe::setEasing(QEasingCurve::Type easing)
{
    m_easing = easing;
}

QEasingCurve::Type Keyframe::getEasing() const
{
    return m_easing;
}

double Keyframe::interpolateValue(double from, double to, double t)
{
    return from + (to - from) * t;
}

std::optional<double> Keyframe::interpolateProperty(const std::optional<double>& from,
    const std::optional<double>& to,
    double t)
{
    if (from && to) {
        return interpolateValue(*from, *to, t);
    }
    // Only one side defines the property: hold it
    if (from) {
        return from;
    }
    return to;
}
