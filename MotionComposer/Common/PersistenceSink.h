#ifndef MOTIONCOMPOSER_PERSISTENCESINK_H
#define MOTIONCOMPOSER_PERSISTENCESINK_H

#include "LayerTypes.h"
#include <vector>

class Layer;

// Receives committed layer mutations. The editor core never reads back what
// the sink stores.
class PersistenceSink
{
public:
    virtual ~PersistenceSink() = default;

    virtual void layerCommitted(const Layer& layer) = 0;
    virtual void layerRemoved(LayerId id) = 0;
    virtual void layerOrderCommitted(const std::vector<LayerId>& order) = 0;
};

#endif // MOTIONCOMPOSER_PERSISTENCESINK_H
