#ifndef MOTIONCOMPOSER_EDITORSETTINGS_H
#define MOTIONCOMPOSER_EDITORSETTINGS_H

#include <QColor>
#include <QSize>

class QSettings;

struct EditorSettings
{
    int frameRate = 30;
    double projectDuration = 10.0;
    QSize projectSize = QSize(1920, 1080);
    QColor backgroundColor = QColor(0x1a, 0x1a, 0x2e);
    bool showGrid = false;
    int gridSize = 50;
    double handleSize = 8.0;
    double rotationHandleOffset = 20.0;
    double pasteOffset = 20.0;

    // Reads every key from the given store; invalid values keep their default.
    static EditorSettings load(QSettings& settings);
    static EditorSettings load();
    void save(QSettings& settings) const;
    void save() const;
};

#endif // MOTIONCOMPOSER_EDITORSETTINGS_H
