#include "PlaybackScheduler.h"
#include "Scene.h"
#include <QDebug>

PlaybackScheduler::PlaybackScheduler(Scene* scene, QObject* parent)
    : QObject(parent)
    , m_scene(scene)
    , m_frameRate(30)
    , m_state(State::Stopped)
{
    // One single-shot timer, re-armed after every advance
    m_playbackTimer = new QTimer(this);
    m_playbackTimer->setSingleShot(true);
    m_playbackTimer->setTimerType(Qt::PreciseTimer);
    connect(m_playbackTimer, &QTimer::timeout, this, &PlaybackScheduler::onPlaybackTimer);
}

PlaybackScheduler::~PlaybackScheduler()
{
    m_state = State::Stopped;
    m_playbackTimer->stop();
}

void PlaybackScheduler::play()
{
    if (m_state == State::Playing || !m_scene) {
        return;
    }

    m_state = State::Playing;
    scheduleNextFrame();
    qDebug() << "PlaybackScheduler: playing at" << m_frameRate << "fps from" << m_scene->getCurrentTime();
    emit playbackStateChanged(true);
}

void PlaybackScheduler::pause()
{
    if (m_state != State::Playing) {
        return;
    }

    m_state = State::Paused;
    m_playbackTimer->stop();
    emit playbackStateChanged(false);
}

void PlaybackScheduler::stop()
{
    const bool wasPlaying = (m_state == State::Playing);

    // The state flag is cleared first so a timeout already queued is a no-op
    m_state = State::Stopped;
    m_playbackTimer->stop();

    if (m_scene) {
        m_scene->setCurrentTime(0.0);
    }

    if (wasPlaying) {
        qDebug() << "PlaybackScheduler: stopped";
        emit playbackStateChanged(false);
    }
}

void PlaybackScheduler::togglePlayback()
{
    if (m_state == State::Playing) {
        stop();
    }
    else {
        play();
    }
}

void PlaybackScheduler::seek(double time)
{
    if (m_scene) {
        m_scene->setCurrentTime(time);
    }
}

void PlaybackScheduler::seekRelative(double seconds)
{
    if (m_scene) {
        m_scene->setCurrentTime(m_scene->getCurrentTime() + seconds);
    }
}

void PlaybackScheduler::stepFrames(int frames)
{
    seekRelative(static_cast<double>(frames) / m_frameRate);
}

void PlaybackScheduler::advanceFrame()
{
    if (!m_scene) {
        return;
    }

    double time = m_scene->getCurrentTime() + 1.0 / m_frameRate;
    if (time >= m_scene->getDuration()) {
        // Loop back to the start
        time = 0.0;
    }

    m_scene->setCurrentTime(time);
    emit frameAdvanced(m_scene->getCurrentTime());
}

bool PlaybackScheduler::setFrameRate(int fps)
{
    if (fps <= 0) {
        qWarning() << "PlaybackScheduler: ignoring invalid frame rate" << fps;
        return false;
    }

    if (fps != m_frameRate) {
        m_frameRate = fps;
        emit frameRateChanged(fps);
    }
    return true;
}

int PlaybackScheduler::getFrameRate() const
{
    return m_frameRate;
}

int PlaybackScheduler::getFrameIntervalMs() const
{
    return 1000 / m_frameRate;
}

PlaybackScheduler::State PlaybackScheduler::getState() const
{
    return m_state;
}

bool PlaybackScheduler::isPlaying() const
{
    return m_state == State::Playing;
}

void PlaybackScheduler::onPlaybackTimer()
{
    if (m_state != State::Playing) {
        return;
    }

    if (!m_nextFrameDeadline.hasExpired()) {
        // Woke up early; wait out the remainder of this frame
        m_playbackTimer->start(static_cast<int>(m_nextFrameDeadline.remainingTime()));
        return;
    }

    advanceFrame();

    if (m_state == State::Playing) {
        scheduleNextFrame();
    }
}

void PlaybackScheduler::scheduleNextFrame()
{
    const int interval = getFrameIntervalMs();
    m_nextFrameDeadline.setRemainingTime(interval, Qt::PreciseTimer);
    m_playbackTimer->start(interval);
}
