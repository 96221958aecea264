#include "EditorSettings.h"
#include <QSettings>
#include <QDebug>

namespace {

int readPositiveInt(QSettings& settings, const QString& key, int fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }

    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value <= 0) {
        qWarning() << "EditorSettings: ignoring invalid value for" << key << settings.value(key);
        return fallback;
    }
    return value;
}

double readPositiveDouble(QSettings& settings, const QString& key, double fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }

    bool ok = false;
    const double value = settings.value(key).toDouble(&ok);
    if (!ok || value <= 0.0) {
        qWarning() << "EditorSettings: ignoring invalid value for" << key << settings.value(key);
        return fallback;
    }
    return value;
}

} // namespace

EditorSettings EditorSettings::load(QSettings& settings)
{
    EditorSettings result;

    result.frameRate = readPositiveInt(settings, "playback/fps", result.frameRate);
    result.projectDuration = readPositiveDouble(settings, "project/duration", result.projectDuration);
    result.projectSize = QSize(readPositiveInt(settings, "project/width", result.projectSize.width()),
        readPositiveInt(settings, "project/height", result.projectSize.height()));

    if (settings.contains("canvas/backgroundColor")) {
        const QColor color(settings.value("canvas/backgroundColor").toString());
        if (color.isValid()) {
            result.backgroundColor = color;
        }
        else {
            qWarning() << "EditorSettings: invalid background color" << settings.value("canvas/backgroundColor");
        }
    }

    result.showGrid = settings.value("canvas/showGrid", result.showGrid).toBool();
    result.gridSize = readPositiveInt(settings, "canvas/gridSize", result.gridSize);
    result.handleSize = readPositiveDouble(settings, "selection/handleSize", result.handleSize);
    result.rotationHandleOffset = readPositiveDouble(settings, "selection/rotationHandleOffset", result.rotationHandleOffset);
    result.pasteOffset = settings.value("clipboard/pasteOffset", result.pasteOffset).toDouble();

    return result;
}

EditorSettings EditorSettings::load()
{
    QSettings settings;
    return load(settings);
}

void EditorSettings::save(QSettings& settings) const
{
    settings.setValue("playback/fps", frameRate);
    settings.setValue("project/duration", projectDuration);
    settings.setValue("project/width", projectSize.width());
    settings.setValue("project/height", projectSize.height());
    settings.setValue("canvas/backgroundColor", backgroundColor.name());
    settings.setValue("canvas/showGrid", showGrid);
    settings.setValue("canvas/gridSize", gridSize);
    settings.setValue("selection/handleSize", handleSize);
    settings.setValue("selection/rotationHandleOffset", rotationHandleOffset);
    settings.setValue("clipboard/pasteOffset", pasteOffset);
}

void EditorSettings::save() const
{
    QSettings settings;
    save(settings);
}
