#ifndef KEYFRAME_H
#define KEYFRAME_H

#include "../Common/LayerTypes.h"
#include <QEasingCurve>
#include <optional>

class Keyframe
{
public:
    explicit Keyframe(double time = 0.0, const KeyframeProperties& properties = KeyframeProperties());

    // Keyframe time on the global timeline, in seconds
    double getTime() const;

    // Properties
    const KeyframeProperties& getProperties() const;
    void setProperties(const KeyframeProperties& properties);

    // Shapes the blend fraction when this keyframe is the later of a pair
    void setEasing(QEasingCurve::Type easing);
    QEasingCurve::Type getEasing() const;

    static double interpolateValue(double from, double to, double t);
    static std::optional<double> interpolateProperty(const std::optional<double>& from,
        const std::optional<double>& to,
        double t);

private:
    double m_time;
    KeyframeProperties m_properties;
    QEasingCurve::Type m_easing;
};

#endif
