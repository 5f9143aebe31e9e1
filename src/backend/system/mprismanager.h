#ifndef MPRISMANAGER_H
#define MPRISMANAGER_H

#include <QObject>
#include <QDBusAbstractAdaptor>
#include <QDBusConnection>
#include <QDBusObjectPath>
#include <QVariantMap>
#include <QString>
#include <QStringList>

class PlaybackEngine;
class AlbumLoader;

// MPRIS MediaPlayer2 interface
class MediaPlayer2Adaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.mpris.MediaPlayer2")
    Q_PROPERTY(bool CanQuit READ canQuit)
    Q_PROPERTY(bool CanRaise READ canRaise)
    Q_PROPERTY(bool HasTrackList READ hasTrackList)
    Q_PROPERTY(QString Identity READ identity)
    Q_PROPERTY(QStringList SupportedUriSchemes READ supportedUriSchemes)
    Q_PROPERTY(QStringList SupportedMimeTypes READ supportedMimeTypes)

public:
    explicit MediaPlayer2Adaptor(QObject *parent);

    bool canQuit() const { return true; }
    bool canRaise() const { return false; }
    bool hasTrackList() const { return false; }
    QString identity() const { return "Vinyl Scrobbler"; }
    QStringList supportedUriSchemes() const { return QStringList(); }
    QStringList supportedMimeTypes() const { return QStringList(); }

public slots:
    void Quit();
    void Raise();

signals:
    void quitRequested();
};

// MPRIS MediaPlayer2.Player interface. There is no audio, so Pause and Stop
// both abandon the current track.
class MediaPlayer2PlayerAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.mpris.MediaPlayer2.Player")
    Q_PROPERTY(QString PlaybackStatus READ playbackStatus)
    Q_PROPERTY(double Rate READ rate)
    Q_PROPERTY(QVariantMap Metadata READ metadata)
    Q_PROPERTY(qint64 Position READ position)
    Q_PROPERTY(double MinimumRate READ rate)
    Q_PROPERTY(double MaximumRate READ rate)
    Q_PROPERTY(bool CanGoNext READ canGoNext)
    Q_PROPERTY(bool CanGoPrevious READ canGoPrevious)
    Q_PROPERTY(bool CanPlay READ canPlay)
    Q_PROPERTY(bool CanPause READ canPlay)
    Q_PROPERTY(bool CanSeek READ canSeek)
    Q_PROPERTY(bool CanControl READ canControl)

public:
    MediaPlayer2PlayerAdaptor(PlaybackEngine *engine, QObject *parent);

    QString playbackStatus() const;
    double rate() const { return 1.0; }
    QVariantMap metadata() const;
    qint64 position() const;
    bool canGoNext() const;
    bool canGoPrevious() const;
    bool canPlay() const;
    bool canSeek() const { return false; }
    bool canControl() const { return true; }

public slots:
    void Next();
    void Previous();
    void Pause();
    void PlayPause();
    void Stop();
    void Play();

private:
    PlaybackEngine *m_engine;
};

// Commands MPRIS has no vocabulary for
class VinylControlAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.vinylscrobbler.Control")

public:
    VinylControlAdaptor(PlaybackEngine *engine, AlbumLoader *loader, QObject *parent);

public slots:
    // Each returns an empty string on success, otherwise the reason
    QString SelectTrack(int index);
    QString LoadRelease(const QString &path);
    QStringList Tracks() const;

    // Stored in the settings and applied right away
    void SetScrobblingEnabled(bool enabled);
    void SetDurationLookupEnabled(bool enabled);

private:
    PlaybackEngine *m_engine;
    AlbumLoader *m_loader;
};

// Main MPRIS Manager class
class MprisManager : public QObject
{
    Q_OBJECT

public:
    MprisManager(PlaybackEngine *engine, AlbumLoader *loader, QObject *parent = nullptr);
    ~MprisManager();

    bool initialize();
    void cleanup();

    static QVariantMap createMetadata(const PlaybackEngine *engine);

private slots:
    void onStateChanged();
    void onTrackChanged();
    void onAlbumLoaded();

private:
    void emitPropertiesChanged(const QString &interface, const QVariantMap &changedProperties);

    PlaybackEngine *m_engine;
    AlbumLoader *m_loader;
    MediaPlayer2Adaptor *m_mprisAdaptor;
    MediaPlayer2PlayerAdaptor *m_playerAdaptor;
    VinylControlAdaptor *m_controlAdaptor;
    QDBusConnection m_dbusConnection;
    QString m_serviceName;
    bool m_initialized;
};

#endif // MPRISMANAGER_H
