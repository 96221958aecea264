#ifndef PRESENTATIONSURFACE_H
#define PRESENTATIONSURFACE_H

#include <QImage>
#include <QSize>

// Destination for composited frames; owns the backing store.
class PresentationSurface
{
public:
    virtual ~PresentationSurface() = default;

    virtual void present(const QImage& frame) = 0;
    virtual QSize targetSize() const = 0;
    virtual qreal devicePixelRatio() const = 0;
};

#endif
