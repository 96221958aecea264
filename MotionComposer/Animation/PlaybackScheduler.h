#ifndef PLAYBACKSCHEDULER_H
#define PLAYBACKSCHEDULER_H

#include <QObject>
#include <QTimer>
#include <QDeadlineTimer>

class Scene;

class PlaybackScheduler : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Stopped,
        Playing,
        Paused
    };

    explicit PlaybackScheduler(Scene* scene, QObject* parent = nullptr);
    ~PlaybackScheduler();

    // Playback control
    void play();
    void pause();
    void stop();
    void togglePlayback();
    void seek(double time);
    void seekRelative(double seconds);
    void stepFrames(int frames);

    // Advances the cursor by one frame, wrapping to 0 at the project end
    void advanceFrame();

    bool setFrameRate(int fps);
    int getFrameRate() const;
    int getFrameIntervalMs() const;
    State getState() const;
    bool isPlaying() const;

signals:
    void playbackStateChanged(bool playing);
    void frameAdvanced(double time);
    void frameRateChanged(int fps);

private slots:
    void onPlaybackTimer();

private:
    void scheduleNextFrame();

    Scene* m_scene;
    QTimer* m_playbackTimer;
    QDeadlineTimer m_nextFrameDeadline;
    int m_frameRate;
    State m_state;
};
#endif
