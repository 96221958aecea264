#ifndef KEYFRAMEINTERPOLATOR_H
#define KEYFRAMEINTERPOLATOR_H

#include "Keyframe.h"
#include <map>

class Layer;

using KeyframeMap = std::map<double, Keyframe>;

// Stateless resolution of a keyframe set against a base transform.
//
// Times at or before the first keyframe clamp to it, times at or after the
// last clamp to the last one. In between, each property is blended between
// the bracketing keyframes when both define it, held when only one does and
// taken from the base transform when neither does.
class KeyframeInterpolator
{
public:
    static LayerTransform resolve(const KeyframeMap& keyframes,
        const LayerTransform& base,
        double time);

private:
    static LayerTransform applyProperties(const LayerTransform& base,
        const KeyframeProperties& properties);
};

LayerTransform resolveLayerProperties(const Layer& layer, double time);

#endif
