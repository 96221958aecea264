#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

class EditorSession;
class Canvas;
class QAction;
class QActionGroup;
class QLabel;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(EditorSession* session, QWidget* parent = nullptr);
    ~MainWindow();

    Canvas* getCanvas() const { return m_canvas; }

protected:
    void closeEvent(QCloseEvent* event) override;
    void showEvent(QShowEvent* event) override;

private slots:
    void onToolActionTriggered(QAction* action);
    void onPlaybackStateChanged(bool playing);
    void updateStatus();
    void addKeyframe();
    void exportFrame();

private:
    void createActions();
    void createToolBar();
    void readSettings();
    void writeSettings();

    EditorSession* m_session;
    Canvas* m_canvas;
    QLabel* m_statusLabel;
    bool m_firstShow;

    QActionGroup* m_toolActionGroup;
    QAction* m_selectToolAction;
    QAction* m_textToolAction;
    QAction* m_shapeToolAction;
    QAction* m_playAction;
    QAction* m_stopAction;
    QAction* m_keyframeAction;
    QAction* m_undoAction;
    QAction* m_redoAction;
    QAction* m_exportFrameAction;
};

#endif
