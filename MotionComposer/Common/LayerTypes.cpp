#include "LayerTypes.h"
#include <cmath>

namespace MotionComposer {

bool LayerTransform::operator==(const LayerTransform& other) const
{
    return x == other.x && y == other.y && scale == other.scale
        && rotation == other.rotation && opacity == other.opacity;
}

bool KeyframeProperties::isEmpty() const
{
    return !x && !y && !scale && !rotation && !opacity;
}

KeyframeProperties KeyframeProperties::fromTransform(const LayerTransform& transform)
{
    KeyframeProperties properties;
    properties.x = transform.x;
    properties.y = transform.y;
    properties.scale = transform.scale;
    properties.rotation = transform.rotation;
    properties.opacity = transform.opacity;
    return properties;
}

LayerType layerTypeOf(const LayerContent& content)
{
    return std::visit(Visitor{
        [](const ImageContent&) { return LayerType::Image; },
        [](const TextContent&) { return LayerType::Text; },
        [](const ShapeContent&) { return LayerType::Shape; },
        [](const VideoContent&) { return LayerType::Video; },
        [](const AudioContent&) { return LayerType::Audio; },
        [](const AdjustmentContent&) { return LayerType::Adjustment; },
    }, content);
}

QString layerTypeName(LayerType type)
{
    switch (type) {
    case LayerType::Image: return QStringLiteral("Image");
    case LayerType::Text: return QStringLiteral("Text");
    case LayerType::Shape: return QStringLiteral("Shape");
    case LayerType::Video: return QStringLiteral("Video");
    case LayerType::Audio: return QStringLiteral("Audio");
    case LayerType::Adjustment: return QStringLiteral("Adjustment");
    }
    return QString();
}

double normalizeRotation(double degrees)
{
    double wrapped = std::fmod(std::fmod(degrees, 360.0) + 360.0, 360.0);
    // fmod of a tiny negative value can round up to exactly 360
    if (wrapped >= 360.0) {
        wrapped = 0.0;
    }
    return wrapped;
}

} // namespace MotionComposer
