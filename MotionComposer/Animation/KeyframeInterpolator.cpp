#include "KeyframeInterpolator.h"
#include "Layer.h"
#include <iterator>

namespace {

struct PropertyBinding {
    std::optional<double> KeyframeProperties::* keyframeMember;
    double LayerTransform::* transformMember;
};

const PropertyBinding kBindings[] = {
    { &KeyframeProperties::x, &LayerTransform::x },
    { &KeyframeProperties::y, &LayerTransform::y },
    { &KeyframeProperties::scale, &LayerTransform::scale },
    { &KeyframeProperties::rotation, &LayerTransform::rotation },
    { &KeyframeProperties::opacity, &LayerTransform::opacity },
};

} // namespace

LayerTransform KeyframeInterpolator::resolve(const KeyframeMap& keyframes,
    const LayerTransform& base,
    double time)
{
    if (keyframes.empty()) {
        return base;
    }

    const Keyframe& first = keyframes.begin()->second;
    const Keyframe& last = std::prev(keyframes.end())->second;

    // Written so that a NaN time also lands on the first keyframe
    if (!(time > first.getTime())) {
        return applyProperties(base, first.getProperties());
    }
    if (time >= last.getTime()) {
        return applyProperties(base, last.getProperties());
    }

    // first < time < last, so both neighbours exist
    auto nextIt = keyframes.upper_bound(time);
    auto prevIt = std::prev(nextIt);
    const Keyframe& from = prevIt->second;
    const Keyframe& to = nextIt->second;

    const double fraction = (time - from.getTime()) / (to.getTime() - from.getTime());
    const double eased = QEasingCurve(to.getEasing()).valueForProgress(fraction);

    LayerTransform resolved = base;
    for (const PropertyBinding& binding : kBindings) {
        const std::optional<double> value = Keyframe::interpolateProperty(
            from.getProperties().*binding.keyframeMember,
            to.getProperties().*binding.keyframeMember,
            eased);
        if (value) {
            resolved.*binding.transformMember = *value;
        }
    }
    return resolved;
}

LayerTransform KeyframeInterpolator::applyProperties(const LayerTransform& base,
    const KeyframeProperties& properties)
{
    LayerTransform resolved = base;
    for (const PropertyBinding& binding : kBindings) {
        const std::optional<double>& value = properties.*binding.keyframeMember;
        if (value) {
            resolved.*binding.transformMember = *value;
        }
    }
    return resolved;
}

LayerTransform resolveLayerProperties(const Layer& layer, double time)
{
    return KeyframeInterpolator::resolve(layer.getKeyframes(), layer.getBaseTransform(), time);
}
