#ifndef MOTIONCOMPOSER_LAYERTYPES_H
#define MOTIONCOMPOSER_LAYERTYPES_H

#include <QColor>
#include <QString>
#include <QtGlobal>
#include <optional>
#include <variant>

namespace MotionComposer {

using LayerId = quint64;
inline constexpr LayerId InvalidLayerId = 0;

enum class LayerType {
    Image,
    Text,
    Shape,
    Video,
    Audio,
    Adjustment
};

enum class ShapeKind {
    Rectangle,
    Circle,
    Triangle
};

enum class ToolMode {
    Select,
    Text,
    Shape
};

enum class GestureKind {
    Drag,
    Resize,
    Rotate
};

// Base transform of a layer. Rotation is in degrees, opacity in [0, 1].
struct LayerTransform {
    double x = 0.0;
    double y = 0.0;
    double scale = 1.0;
    double rotation = 0.0;
    double opacity = 1.0;

    bool operator==(const LayerTransform& other) const;
    bool operator!=(const LayerTransform& other) const { return !(*this == other); }
};

// Partial transform stored by a keyframe; unset members fall back to the base transform.
struct KeyframeProperties {
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> scale;
    std::optional<double> rotation;
    std::optional<double> opacity;

    bool isEmpty() const;
    static KeyframeProperties fromTransform(const LayerTransform& transform);
};

struct ImageContent {
    QString assetId;
};

struct TextContent {
    QString text = QStringLiteral("New Text");
    double fontSize = 48.0;
    QString fontFamily = QStringLiteral("Arial");
    QColor color = Qt::white;
    Qt::Alignment alignment = Qt::AlignHCenter;
};

struct ShapeContent {
    ShapeKind kind = ShapeKind::Rectangle;
    QColor fill = QColor(0x66, 0x7e, 0xea);
    QColor stroke = Qt::transparent;
    double strokeWidth = 0.0;
};

struct VideoContent {
    QString assetId;
    double intrinsicDuration = 0.0;
};

struct AudioContent {
    QString assetId;
    double volume = 1.0;
};

struct AdjustmentContent {
};

using LayerContent = std::variant<ImageContent, TextContent, ShapeContent,
    VideoContent, AudioContent, AdjustmentContent>;

LayerType layerTypeOf(const LayerContent& content);
QString layerTypeName(LayerType type);

// Wraps any angle into [0, 360).
double normalizeRotation(double degrees);

template <typename... T>
struct Visitor : T... {
    using T::operator()...;
};

template <typename... T>
Visitor(T...) -> Visitor<T...>;

} // namespace MotionComposer

using LayerId = MotionComposer::LayerId;
using LayerType = MotionComposer::LayerType;
using LayerTransform = MotionComposer::LayerTransform;
using LayerContent = MotionComposer::LayerContent;
using KeyframeProperties = MotionComposer::KeyframeProperties;
using ToolMode = MotionComposer::ToolMode;
using GestureKind = MotionComposer::GestureKind;

#endif // MOTIONCOMPOSER_LAYERTYPES_H
