#include <QApplication>
#include <QStyleFactory>
#include <QCommandLineParser>
#include <QLinearGradient>
#include <QPainter>
#include <QImage>
#include <QUndoStack>
#include <QDebug>

#include "MainWindow.h"
#include "EditorSession.h"
#include "Animation/Scene.h"
#include "Animation/Layer.h"
#include "Common/EditorSettings.h"
#include "Common/PersistenceSink.h"
#include "Rendering/MemoryAssetProvider.h"

// Stands in for a storage backend: commits are only traced
class LoggingPersistenceSink : public PersistenceSink
{
public:
    void layerCommitted(const Layer& layer) override
    {
        const LayerTransform& transform = layer.getBaseTransform();
        qDebug() << "Persistence: layer" << layer.getId() << layer.getName()
                 << "at" << transform.x << transform.y << "scale" << transform.scale
                 << "rotation" << transform.rotation << "keyframes" << layer.getKeyframes().size();
    }

    void layerRemoved(LayerId id) override
    {
        qDebug() << "Persistence: removed layer" << id;
    }

    void layerOrderCommitted(const std::vector<LayerId>& order) override
    {
        qDebug() << "Persistence: order" << QVector<LayerId>(order.begin(), order.end());
    }
};

class MotionComposerApplication : public QApplication
{

public:
    MotionComposerApplication(int& argc, char** argv)
        : QApplication(argc, argv)
    {
        setApplicationName("MotionComposer");
        setApplicationVersion("1.0.0");
        setApplicationDisplayName("MotionComposer");
        setOrganizationName("MotionComposer Team");
        setOrganizationDomain("motioncomposer.app");

        setStyle(QStyleFactory::create("Fusion"));
    }
};

namespace {

QImage createBackdropImage()
{
    QImage image(640, 360, QImage::Format_ARGB32_Premultiplied);
    QPainter painter(&image);
    QLinearGradient gradient(0, 0, image.width(), image.height());
    gradient.setColorAt(0.0, QColor(0x1f, 0x40, 0x68));
    gradient.setColorAt(1.0, QColor(0x16, 0x21, 0x3e));
    painter.fillRect(image.rect(), gradient);
    painter.end();
    return image;
}

// A small scene so the preview has something to play
void populateDemoScene(EditorSession& session, MemoryAssetProvider& assets)
{
    const QSizeF size = session.getScene()->getProjectSize();
    const QPointF centre(size.width() / 2.0, size.height() / 2.0);

    assets.insertImage("backdrop", createBackdropImage());
    session.addImageLayer("backdrop", centre, size);

    Layer* shape = session.addShapeLayer(MotionComposer::ShapeKind::Rectangle,
        QRectF(centre - QPointF(150, 150), QSizeF(300, 300)));
    if (shape) {
        session.setKeyframe(shape->getId(), 0.0, KeyframeProperties{ size.width() * 0.25, {}, 1.0, 0.0, {} });
        session.setKeyframe(shape->getId(), 5.0, KeyframeProperties{ size.width() * 0.75, {}, 1.5, 180.0, {} },
            QEasingCurve::InOutQuad);
    }

    Layer* title = session.addTextLayer(QPointF(centre.x(), size.height() * 0.2), "MotionComposer");
    if (title) {
        session.setKeyframe(title->getId(), 0.0, KeyframeProperties{ {}, {}, {}, {}, 0.0 });
        session.setKeyframe(title->getId(), 1.5, KeyframeProperties{ {}, {}, {}, {}, 1.0 });
    }

    session.getUndoStack()->clear();
    session.clearSelection();
}

} // namespace

int main(int argc, char* argv[])
{
    MotionComposerApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription("Layered motion graphics preview");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption fpsOption("fps", "Playback frame rate.", "fps");
    QCommandLineOption durationOption("duration", "Project duration in seconds.", "seconds");
    QCommandLineOption exportOption("export", "Write the frame at --time to <file> and exit.", "file");
    QCommandLineOption timeOption("time", "Timeline position for --export.", "seconds", "0");
    parser.addOption(fpsOption);
    parser.addOption(durationOption);
    parser.addOption(exportOption);
    parser.addOption(timeOption);
    parser.process(app);

    EditorSettings settings = EditorSettings::load();
    if (parser.isSet(fpsOption)) {
        bool ok = false;
        const int fps = parser.value(fpsOption).toInt(&ok);
        if (ok && fps > 0) {
            settings.frameRate = fps;
        }
        else {
            qWarning() << "Ignoring invalid --fps" << parser.value(fpsOption);
        }
    }
    if (parser.isSet(durationOption)) {
        bool ok = false;
        const double duration = parser.value(durationOption).toDouble(&ok);
        if (ok && duration > 0.0) {
            settings.projectDuration = duration;
        }
        else {
            qWarning() << "Ignoring invalid --duration" << parser.value(durationOption);
        }
    }

    MemoryAssetProvider assets;
    LoggingPersistenceSink persistence;

    EditorSession session(settings);
    session.setAssetProvider(&assets);
    populateDemoScene(session, assets);
    session.setPersistenceSink(&persistence);

    if (parser.isSet(exportOption)) {
        session.seek(parser.value(timeOption).toDouble());
        return session.exportFrame(parser.value(exportOption)) ? 0 : 1;
    }

    MainWindow window(&session);
    window.resize(1280, 800);
    window.show();

    return app.exec();
}
