#include "MainWindow.h"
#include "Canvas.h"
#include "EditorSession.h"
#include "Animation/Scene.h"
#include "Animation/PlaybackScheduler.h"
#include <QAction>
#include <QActionGroup>
#include <QToolBar>
#include <QStatusBar>
#include <QLabel>
#include <QUndoStack>
#include <QSettings>
#include <QFileDialog>
#include <QCloseEvent>
#include <QShowEvent>
#include <QDebug>

MainWindow::MainWindow(EditorSession* session, QWidget* parent)
    : QMainWindow(parent)
    , m_session(session)
    , m_canvas(nullptr)
    , m_statusLabel(nullptr)
    , m_firstShow(true)
{
    setWindowTitle("MotionComposer");

    m_canvas = new Canvas(session, this);
    setCentralWidget(m_canvas);

    createActions();
    createToolBar();

    m_statusLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_statusLabel);

    connect(m_session->getPlaybackScheduler(), &PlaybackScheduler::playbackStateChanged,
        this, &MainWindow::onPlaybackStateChanged);
    connect(m_session->getScene(), &Scene::currentTimeChanged, this, &MainWindow::updateStatus);
    connect(m_session->getScene(), &Scene::selectionChanged, this, &MainWindow::updateStatus);
    connect(m_canvas, &Canvas::zoomChanged, this, &MainWindow::updateStatus);
    connect(m_session->getScene(), &Scene::toolModeChanged, this, [this](MotionComposer::ToolMode mode) {
        for (QAction* action : m_toolActionGroup->actions()) {
            if (action->data().toInt() == static_cast<int>(mode)) {
                action->setChecked(true);
            }
        }
    });

    readSettings();
    updateStatus();

    qDebug() << "MainWindow setup complete";
}

MainWindow::~MainWindow()
{
}

void MainWindow::createActions()
{
    m_toolActionGroup = new QActionGroup(this);

    m_selectToolAction = new QAction("&Select Tool", this);
    m_selectToolAction->setShortcut(QKeySequence("V"));
    m_selectToolAction->setCheckable(true);
    m_selectToolAction->setChecked(true);
    m_selectToolAction->setData(static_cast<int>(ToolMode::Select));
    m_toolActionGroup->addAction(m_selectToolAction);

    m_textToolAction = new QAction("&Text Tool", this);
    m_textToolAction->setShortcut(QKeySequence("T"));
    m_textToolAction->setCheckable(true);
    m_textToolAction->setData(static_cast<int>(ToolMode::Text));
    m_toolActionGroup->addAction(m_textToolAction);

    m_shapeToolAction = new QAction("S&hape Tool", this);
    m_shapeToolAction->setShortcut(QKeySequence("R"));
    m_shapeToolAction->setCheckable(true);
    m_shapeToolAction->setData(static_cast<int>(ToolMode::Shape));
    m_toolActionGroup->addAction(m_shapeToolAction);

    connect(m_toolActionGroup, &QActionGroup::triggered, this, &MainWindow::onToolActionTriggered);

    m_playAction = new QAction("&Play", this);
    m_playAction->setStatusTip("Start or stop playback");
    connect(m_playAction, &QAction::triggered, m_session, &EditorSession::togglePlayback);

    m_stopAction = new QAction("S&top", this);
    connect(m_stopAction, &QAction::triggered, m_session, &EditorSession::stop);

    m_keyframeAction = new QAction("Add &Keyframe", this);
    m_keyframeAction->setShortcut(QKeySequence("K"));
    m_keyframeAction->setStatusTip("Capture the selected layer's transform at the current time");
    connect(m_keyframeAction, &QAction::triggered, this, &MainWindow::addKeyframe);

    m_undoAction = m_session->getUndoStack()->createUndoAction(this, "&Undo");
    m_undoAction->setShortcut(QKeySequence::Undo);

    m_redoAction = m_session->getUndoStack()->createRedoAction(this, "&Redo");
    m_redoAction->setShortcut(QKeySequence::Redo);

    m_exportFrameAction = new QAction("Export &Frame...", this);
    m_exportFrameAction->setShortcut(QKeySequence("Ctrl+E"));
    connect(m_exportFrameAction, &QAction::triggered, this, &MainWindow::exportFrame);
}

void MainWindow::createToolBar()
{
    QToolBar* toolBar = addToolBar("Tools");
    toolBar->setObjectName("ToolsToolBar");
    toolBar->addActions(m_toolActionGroup->actions());
    toolBar->addSeparator();
    toolBar->addAction(m_playAction);
    toolBar->addAction(m_stopAction);
    toolBar->addAction(m_keyframeAction);
    toolBar->addSeparator();
    toolBar->addAction(m_undoAction);
    toolBar->addAction(m_redoAction);
    toolBar->addSeparator();
    toolBar->addAction(m_exportFrameAction);
}

void MainWindow::onToolActionTriggered(QAction* action)
{
    m_session->setToolMode(static_cast<ToolMode>(action->data().toInt()));
    m_canvas->setFocus();
}

void MainWindow::onPlaybackStateChanged(bool playing)
{
    m_playAction->setText(playing ? "&Pause" : "&Play");
    updateStatus();
}

void MainWindow::updateStatus()
{
    const Scene* scene = m_session->getScene();
    const Layer* selected = scene->getSelectedLayer();
    m_statusLabel->setText(QString("%1 s / %2 s  |  %3  |  Zoom %4%")
        .arg(scene->getCurrentTime(), 0, 'f', 2)
        .arg(scene->getDuration(), 0, 'f', 2)
        .arg(selected ? selected->getName() : QString("No selection"))
        .arg(qRound(m_canvas->getZoomFactor() * 100.0)));
}

void MainWindow::addKeyframe()
{
    const LayerId selected = m_session->getScene()->getSelectedLayerId();
    if (selected == MotionComposer::InvalidLayerId) {
        statusBar()->showMessage("Select a layer first", 2000);
        return;
    }
    m_session->addKeyframe(selected);
}

void MainWindow::exportFrame()
{
    const QString fileName = QFileDialog::getSaveFileName(this, "Export Frame", "frame.png",
        "PNG Image (*.png);;JPEG Image (*.jpg *.jpeg);;SVG Image (*.svg)");
    if (fileName.isEmpty()) {
        return;
    }

    if (m_session->exportFrame(fileName)) {
        statusBar()->showMessage(QString("Exported %1").arg(fileName), 3000);
    }
    else {
        statusBar()->showMessage("Export failed", 3000);
    }
}

void MainWindow::showEvent(QShowEvent* event)
{
    QMainWindow::showEvent(event);
    if (m_firstShow) {
        m_firstShow = false;
        m_canvas->zoomToFit();
    }
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    m_session->stop();
    writeSettings();
    event->accept();
}

void MainWindow::readSettings()
{
    QSettings settings;
    restoreGeometry(settings.value("geometry").toByteArray());
    restoreState(settings.value("windowState").toByteArray());
}

void MainWindow::writeSettings()
{
    QSettings settings;
    settings.setValue("geometry", saveGeometry());
    settings.setValue("windowState", saveState());
}
