#include "playbackengine.h"
#include "backend/scrobble/scrobbleservice.h"

#include <QDateTime>
#include <QDebug>
#include <limits>

PlaybackEngine::PlaybackEngine(TaskScheduler *scheduler, QObject *parent)
    : QObject(parent)
    , m_scheduler(scheduler)
{
}

PlaybackEngine::~PlaybackEngine()
{
    cancelTimers();
}

void PlaybackEngine::setScrobbleService(ScrobbleService *service)
{
    if (m_scrobbleService == service) {
        return;
    }

    if (m_failureConnection) {
        disconnect(m_failureConnection);
    }

    m_scrobbleService = service;

    if (m_scrobbleService) {
        m_failureConnection = connect(m_scrobbleService, &ScrobbleService::requestFailed,
                                      this, &PlaybackEngine::onServiceFailure);
    }
}

PlaybackEngine::State PlaybackEngine::state() const
{
    if (m_tracks.isEmpty()) {
        return IdleState;
    }
    return m_playing ? PlayingState : StoppedState;
}

std::optional<Vinyl::Track> PlaybackEngine::currentTrack() const
{
    return m_tracks.at(m_currentIndex);
}

Vinyl::PlaybackError PlaybackEngine::loadAlbum(const Vinyl::TrackList &tracks)
{
    if (tracks.isEmpty()) {
        qWarning() << "[PlaybackEngine::loadAlbum] Refusing to load an album without tracks";
        return Vinyl::PlaybackError::EmptyAlbum;
    }

    // Replacing the album abandons whatever was playing
    if (m_playing) {
        stopPlayback();
    }

    m_tracks = tracks;
    m_currentIndex = 0;
    m_elapsedSeconds = 0;

    qDebug() << "[PlaybackEngine::loadAlbum] Loaded" << m_tracks.length() << "tracks of"
             << m_tracks.artist() << "-" << m_tracks.album();

    emit albumLoaded(m_tracks);
    emit stateChanged(state());
    notifyCurrentTrack();
    return Vinyl::PlaybackError::None;
}

Vinyl::PlaybackError PlaybackEngine::togglePlayback()
{
    if (m_tracks.isEmpty()) {
        qDebug() << "[PlaybackEngine::togglePlayback] No album loaded";
        return Vinyl::PlaybackError::NoAlbumLoaded;
    }

    if (m_playing) {
        stopPlayback();
    } else {
        startPlayback();
    }
    return Vinyl::PlaybackError::None;
}

void PlaybackEngine::startPlayback()
{
    const std::optional<Vinyl::Track> track = m_tracks.at(m_currentIndex);
    if (!track) {
        qWarning() << "[PlaybackEngine::startPlayback] Invalid index" << m_currentIndex;
        return;
    }

    cancelTimers();
    const quint64 generation = ++m_playGeneration;

    m_elapsedSeconds = 0;

    qDebug() << "[PlaybackEngine::startPlayback]" << track->displayName()
             << "for" << track->durationSeconds() << "seconds";

    const qint64 durationMs = static_cast<qint64>(track->durationSeconds()) * 1000;
    m_completionTask = m_scheduler->scheduleOnce(
        static_cast<int>(qMin<qint64>(durationMs, std::numeric_limits<int>::max())),
        [this, generation]() {
            if (generation != m_playGeneration) {
                return;
            }
            m_completionTask = TaskScheduler::InvalidTask;
            handleTrackEnd();
        });

    m_progressTask = m_scheduler->scheduleRepeating(ProgressIntervalMs, [this, generation]() {
        if (generation != m_playGeneration) {
            return;
        }
        onProgressTick();
    });

    // Timers are armed before anyone hears about the track, so a receiver
    // that stops playback from a signal cancels them. Each step after a
    // signal checks that playback was not stopped or restarted meanwhile.
    setPlaying(true);
    if (generation != m_playGeneration) {
        return;
    }

    if (m_scrobbleService) {
        m_scrobbleService->updateNowPlaying(track->artist(), track->title(),
                                            track->album(), track->durationSeconds());
        if (generation != m_playGeneration) {
            return;
        }
    }

    emit trackChanged(*track, true);
    if (generation == m_playGeneration) {
        emit progressChanged(0, track->durationSeconds());
    }
}

void PlaybackEngine::stopPlayback()
{
    cancelTimers();
    // Invalidates callbacks that were already dispatched for the stopped track
    ++m_playGeneration;

    const bool wasPlaying = m_playing;
    m_elapsedSeconds = 0;
    setPlaying(false);

    if (wasPlaying) {
        qDebug() << "[PlaybackEngine::stopPlayback] Stopped at index" << m_currentIndex;
        notifyCurrentTrack();
        if (const std::optional<Vinyl::Track> track = m_tracks.at(m_currentIndex)) {
            emit progressChanged(0, track->durationSeconds());
        }
    }
}

void PlaybackEngine::handleTrackEnd()
{
    if (!m_playing) {
        return;
    }

    const std::optional<Vinyl::Track> finished = m_tracks.at(m_currentIndex);
    if (!finished) {
        return;
    }

    cancelTimers();

    if (m_scrobbleService) {
        m_scrobbleService->scrobble(finished->artist(), finished->title(), finished->album(),
                                    finished->durationSeconds(), QDateTime::currentDateTimeUtc());
    }

    const bool wasLast = m_currentIndex == m_tracks.length() - 1;
    m_currentIndex = (m_currentIndex + 1) % m_tracks.length();

    if (wasLast) {
        qDebug() << "[PlaybackEngine::handleTrackEnd] End of album";
        stopPlayback();
        emit albumEnded();
    } else {
        startPlayback();
    }
}

Vinyl::PlaybackError PlaybackEngine::skipToNext()
{
    if (!m_playing) {
        return Vinyl::PlaybackError::None;
    }

    // Counts as a completed play of the skipped track
    handleTrackEnd();
    return Vinyl::PlaybackError::None;
}

Vinyl::PlaybackError PlaybackEngine::skipToPrevious()
{
    if (m_tracks.isEmpty()) {
        return Vinyl::PlaybackError::NoAlbumLoaded;
    }

    if (m_playing) {
        stopPlayback();
    }

    m_currentIndex = (m_currentIndex - 1 + m_tracks.length()) % m_tracks.length();
    notifyCurrentTrack();
    return Vinyl::PlaybackError::None;
}

Vinyl::PlaybackError PlaybackEngine::selectTrack(int index)
{
    if (!m_tracks.isValidIndex(index)) {
        qWarning() << "[PlaybackEngine::selectTrack] Index" << index
                   << "outside of album with" << m_tracks.length() << "tracks";
        return Vinyl::PlaybackError::IndexOutOfRange;
    }

    if (m_playing) {
        stopPlayback();
    }

    m_currentIndex = index;
    notifyCurrentTrack();
    return Vinyl::PlaybackError::None;
}

void PlaybackEngine::shutdown()
{
    qDebug() << "[PlaybackEngine::shutdown] Cancelling scheduled tasks";
    cancelTimers();
    ++m_playGeneration;
    m_elapsedSeconds = 0;
    setPlaying(false);
}

void PlaybackEngine::onProgressTick()
{
    if (!m_playing) {
        return;
    }

    const std::optional<Vinyl::Track> track = m_tracks.at(m_currentIndex);
    if (!track) {
        return;
    }

    m_elapsedSeconds = qMin(m_elapsedSeconds + 1, track->durationSeconds());
    emit progressChanged(m_elapsedSeconds, track->durationSeconds());
}

void PlaybackEngine::cancelTimers()
{
    if (m_completionTask != TaskScheduler::InvalidTask) {
        m_scheduler->cancel(m_completionTask);
        m_completionTask = TaskScheduler::InvalidTask;
    }
    if (m_progressTask != TaskScheduler::InvalidTask) {
        m_scheduler->cancel(m_progressTask);
        m_progressTask = TaskScheduler::InvalidTask;
    }
}

void PlaybackEngine::setPlaying(bool playing)
{
    if (m_playing == playing) {
        return;
    }
    m_playing = playing;
    emit stateChanged(state());
}

void PlaybackEngine::notifyCurrentTrack()
{
    if (const std::optional<Vinyl::Track> track = m_tracks.at(m_currentIndex)) {
        emit trackChanged(*track, m_playing);
    }
}

void PlaybackEngine::onServiceFailure(const QString &message)
{
    qWarning() << "[PlaybackEngine::onServiceFailure]" << message;
    emit error(Vinyl::errorString(Vinyl::PlaybackError::ExternalServiceFailure)
               + QStringLiteral(": ") + message);
}
