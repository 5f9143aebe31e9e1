#include "mprismanager.h"
#include "../playback/playbackengine.h"
#include "../library/albumloader.h"
#include "../library/catalogrelease.h"
#include "../settings/settingsmanager.h"
#include <QDBusConnection>
#include <QDBusMessage>
#include <QCoreApplication>
#include <QDebug>

// MediaPlayer2Adaptor implementation
MediaPlayer2Adaptor::MediaPlayer2Adaptor(QObject *parent)
    : QDBusAbstractAdaptor(parent)
{
}

void MediaPlayer2Adaptor::Quit()
{
    emit quitRequested();
}

void MediaPlayer2Adaptor::Raise()
{
    // Nothing to raise
}

// MediaPlayer2PlayerAdaptor implementation
MediaPlayer2PlayerAdaptor::MediaPlayer2PlayerAdaptor(PlaybackEngine *engine, QObject *parent)
    : QDBusAbstractAdaptor(parent), m_engine(engine)
{
}

QString MediaPlayer2PlayerAdaptor::playbackStatus() const
{
    if (!m_engine) return "Stopped";

    switch (m_engine->state()) {
    case PlaybackEngine::PlayingState:
        return "Playing";
    case PlaybackEngine::StoppedState:
    case PlaybackEngine::IdleState:
    default:
        return "Stopped";
    }
}

QVariantMap MediaPlayer2PlayerAdaptor::metadata() const
{
    return MprisManager::createMetadata(m_engine);
}

qint64 MediaPlayer2PlayerAdaptor::position() const
{
    return m_engine ? static_cast<qint64>(m_engine->elapsedSeconds()) * 1000000 : 0; // Microseconds
}

bool MediaPlayer2PlayerAdaptor::canGoNext() const
{
    // Next only acts on a running track
    return m_engine && m_engine->isPlaying();
}

bool MediaPlayer2PlayerAdaptor::canGoPrevious() const
{
    return m_engine && m_engine->trackCount() > 0;
}

bool MediaPlayer2PlayerAdaptor::canPlay() const
{
    return m_engine && m_engine->trackCount() > 0;
}

void MediaPlayer2PlayerAdaptor::Next()
{
    qDebug() << "MPRIS: Next() called via D-Bus";
    if (m_engine) {
        m_engine->skipToNext();
    }
}

void MediaPlayer2PlayerAdaptor::Previous()
{
    qDebug() << "MPRIS: Previous() called via D-Bus";
    if (m_engine) {
        m_engine->skipToPrevious();
    }
}

void MediaPlayer2PlayerAdaptor::Pause()
{
    qDebug() << "MPRIS: Pause() called via D-Bus";
    if (m_engine) {
        m_engine->stopPlayback();
    }
}

void MediaPlayer2PlayerAdaptor::PlayPause()
{
    qDebug() << "MPRIS: PlayPause() called via D-Bus";
    if (m_engine) {
        const Vinyl::PlaybackError error = m_engine->togglePlayback();
        if (error != Vinyl::PlaybackError::None) {
            qWarning() << "MPRIS: PlayPause refused:" << Vinyl::errorString(error);
        }
    }
}

void MediaPlayer2PlayerAdaptor::Stop()
{
    qDebug() << "MPRIS: Stop() called via D-Bus";
    if (m_engine) {
        m_engine->stopPlayback();
    }
}

void MediaPlayer2PlayerAdaptor::Play()
{
    qDebug() << "MPRIS: Play() called via D-Bus";
    if (m_engine && !m_engine->isPlaying()) {
        const Vinyl::PlaybackError error = m_engine->togglePlayback();
        if (error != Vinyl::PlaybackError::None) {
            qWarning() << "MPRIS: Play refused:" << Vinyl::errorString(error);
        }
    }
}

// VinylControlAdaptor implementation
VinylControlAdaptor::VinylControlAdaptor(PlaybackEngine *engine, AlbumLoader *loader, QObject *parent)
    : QDBusAbstractAdaptor(parent), m_engine(engine), m_loader(loader)
{
}

QString VinylControlAdaptor::SelectTrack(int index)
{
    qDebug() << "Control: SelectTrack(" << index << ") called via D-Bus";
    return Vinyl::errorString(m_engine->selectTrack(index));
}

QString VinylControlAdaptor::LoadRelease(const QString &path)
{
    qDebug() << "Control: LoadRelease(" << path << ") called via D-Bus";

    QString errorMessage;
    const std::optional<Vinyl::CatalogRelease> release = Vinyl::CatalogRelease::fromFile(path, &errorMessage);
    if (!release) {
        qWarning() << "Control: Could not read release:" << errorMessage;
        return errorMessage;
    }
    return Vinyl::errorString(m_loader->load(*release));
}

QStringList VinylControlAdaptor::Tracks() const
{
    QStringList names;
    const QVector<Vinyl::Track> tracks = m_engine->tracks().tracks();
    for (const Vinyl::Track &track : tracks) {
        names << QString("%1 [%2]").arg(track.displayName(), track.durationDisplay());
    }
    return names;
}

void VinylControlAdaptor::SetScrobblingEnabled(bool enabled)
{
    qDebug() << "Control: SetScrobblingEnabled(" << enabled << ") called via D-Bus";
    SettingsManager::instance()->setScrobblingEnabled(enabled);
}

void VinylControlAdaptor::SetDurationLookupEnabled(bool enabled)
{
    qDebug() << "Control: SetDurationLookupEnabled(" << enabled << ") called via D-Bus";
    SettingsManager::instance()->setDurationLookupEnabled(enabled);
}

// MprisManager implementation
MprisManager::MprisManager(PlaybackEngine *engine, AlbumLoader *loader, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
    , m_loader(loader)
    , m_mprisAdaptor(nullptr)
    , m_playerAdaptor(nullptr)
    , m_controlAdaptor(nullptr)
    , m_dbusConnection(QDBusConnection::sessionBus())
    , m_serviceName("org.mpris.MediaPlayer2.vinylscrobbler")
    , m_initialized(false)
{
}

MprisManager::~MprisManager()
{
    cleanup();
}

bool MprisManager::initialize()
{
    if (m_initialized) {
        return true;
    }

    if (!m_dbusConnection.isConnected()) {
        qWarning() << "MPRIS: Could not connect to D-Bus session bus";
        return false;
    }

    // Register service name
    if (!m_dbusConnection.registerService(m_serviceName)) {
        qWarning() << "MPRIS: Could not register service name" << m_serviceName;
        return false;
    }

    // All adaptors share this object so the interfaces appear on one path
    m_mprisAdaptor = new MediaPlayer2Adaptor(this);
    m_playerAdaptor = new MediaPlayer2PlayerAdaptor(m_engine, this);
    m_controlAdaptor = new VinylControlAdaptor(m_engine, m_loader, this);

    if (!m_dbusConnection.registerObject("/org/mpris/MediaPlayer2", this)) {
        qWarning() << "MPRIS: Could not register object path";
        cleanup();
        return false;
    }

    connect(m_engine, &PlaybackEngine::stateChanged, this, &MprisManager::onStateChanged);
    connect(m_engine, &PlaybackEngine::trackChanged, this, &MprisManager::onTrackChanged);
    connect(m_engine, &PlaybackEngine::albumLoaded, this, &MprisManager::onAlbumLoaded);

    connect(m_mprisAdaptor, &MediaPlayer2Adaptor::quitRequested,
            qApp, &QCoreApplication::quit);

    m_initialized = true;
    qDebug() << "MPRIS: Successfully initialized with service name" << m_serviceName;

    return true;
}

void MprisManager::cleanup()
{
    if (m_initialized) {
        m_dbusConnection.unregisterObject("/org/mpris/MediaPlayer2");
        m_dbusConnection.unregisterService(m_serviceName);
        m_initialized = false;
    }

    if (m_engine) {
        disconnect(m_engine, nullptr, this, nullptr);
    }

    delete m_mprisAdaptor;
    m_mprisAdaptor = nullptr;
    delete m_playerAdaptor;
    m_playerAdaptor = nullptr;
    delete m_controlAdaptor;
    m_controlAdaptor = nullptr;
}

QVariantMap MprisManager::createMetadata(const PlaybackEngine *engine)
{
    QVariantMap metadata;
    if (!engine) {
        return metadata;
    }

    const std::optional<Vinyl::Track> track = engine->currentTrack();
    if (!track) {
        return metadata;
    }

    // Required MPRIS metadata fields
    metadata["mpris:trackid"] = QVariant::fromValue(QDBusObjectPath("/org/vinylscrobbler/track/" + QString::number(engine->currentIndex())));
    metadata["mpris:length"] = static_cast<qint64>(track->durationSeconds()) * 1000000; // Microseconds
    metadata["xesam:trackNumber"] = engine->currentIndex() + 1;

    if (!track->title().isEmpty()) {
        metadata["xesam:title"] = track->title();
    }

    if (!track->artist().isEmpty()) {
        metadata["xesam:artist"] = QStringList() << track->artist();
    }

    if (!track->album().isEmpty()) {
        metadata["xesam:album"] = track->album();
    }

    return metadata;
}

void MprisManager::onStateChanged()
{
    QVariantMap changedProperties;
    changedProperties["PlaybackStatus"] = m_playerAdaptor->playbackStatus();
    changedProperties["CanGoNext"] = m_playerAdaptor->canGoNext();
    changedProperties["CanGoPrevious"] = m_playerAdaptor->canGoPrevious();
    changedProperties["CanPlay"] = m_playerAdaptor->canPlay();
    emitPropertiesChanged("org.mpris.MediaPlayer2.Player", changedProperties);
}

void MprisManager::onTrackChanged()
{
    QVariantMap changedProperties;
    changedProperties["Metadata"] = m_playerAdaptor->metadata();
    emitPropertiesChanged("org.mpris.MediaPlayer2.Player", changedProperties);
}

void MprisManager::onAlbumLoaded()
{
    onStateChanged();
    onTrackChanged();
}

void MprisManager::emitPropertiesChanged(const QString &interface, const QVariantMap &changedProperties)
{
    if (!m_initialized) return;

    QDBusMessage signal = QDBusMessage::createSignal(
        "/org/mpris/MediaPlayer2",
        "org.freedesktop.DBus.Properties",
        "PropertiesChanged"
    );

    signal << interface << changedProperties << QStringList();
    m_dbusConnection.send(signal);
}
