#ifndef PLAYBACKENGINE_H
#define PLAYBACKENGINE_H

#include <QObject>
#include <QPointer>
#include <optional>

#include "playbackerror.h"
#include "taskscheduler.h"
#include "backend/library/track.h"
#include "backend/library/tracklist.h"

class ScrobbleService;

// Counts down through the tracks of a loaded album and tells the scrobble
// service when a track starts and when it has been played to the end.
//
// Only natural completion of a track, or an explicit skip to the next one,
// produces a scrobble. Stopping, going back or picking another track abandons
// the current one.
class PlaybackEngine : public QObject
{
    Q_OBJECT
    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    enum State {
        IdleState,      // nothing loaded
        StoppedState,
        PlayingState
    };
    Q_ENUM(State)

    static constexpr int ProgressIntervalMs = 1000;

    explicit PlaybackEngine(TaskScheduler *scheduler, QObject *parent = nullptr);
    ~PlaybackEngine() override;

    void setScrobbleService(ScrobbleService *service);
    ScrobbleService *scrobbleService() const { return m_scrobbleService; }

    State state() const;
    bool isPlaying() const { return m_playing; }
    int currentIndex() const { return m_currentIndex; }
    int elapsedSeconds() const { return m_elapsedSeconds; }
    int trackCount() const { return m_tracks.length(); }
    const Vinyl::TrackList &tracks() const { return m_tracks; }
    std::optional<Vinyl::Track> currentTrack() const;

public slots:
    Vinyl::PlaybackError loadAlbum(const Vinyl::TrackList &tracks);
    Vinyl::PlaybackError togglePlayback();
    void stopPlayback();
    Vinyl::PlaybackError skipToNext();
    Vinyl::PlaybackError skipToPrevious();
    Vinyl::PlaybackError selectTrack(int index);
    void shutdown();

signals:
    void stateChanged(PlaybackEngine::State state);
    void albumLoaded(const Vinyl::TrackList &tracks);
    void trackChanged(const Vinyl::Track &track, bool isPlaying);
    void progressChanged(int elapsedSeconds, int totalSeconds);
    void albumEnded();
    void error(const QString &message);

private:
    void startPlayback();
    void handleTrackEnd();
    void onProgressTick();
    void cancelTimers();
    void setPlaying(bool playing);
    void notifyCurrentTrack();
    void onServiceFailure(const QString &message);

    TaskScheduler *m_scheduler;
    QPointer<ScrobbleService> m_scrobbleService;
    QMetaObject::Connection m_failureConnection;

    Vinyl::TrackList m_tracks;
    int m_currentIndex = 0;
    bool m_playing = false;
    int m_elapsedSeconds = 0;

    TaskScheduler::TaskId m_completionTask = TaskScheduler::InvalidTask;
    TaskScheduler::TaskId m_progressTask = TaskScheduler::InvalidTask;
    quint64 m_playGeneration = 0;
};

#endif // PLAYBACKENGINE_H
