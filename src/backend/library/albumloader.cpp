#include "albumloader.h"

#include <QPointer>
#include <QDebug>

AlbumLoader::AlbumLoader(Vinyl::DurationLookup *lookup, QObject *parent)
    : QObject(parent)
    , m_resolver(lookup)
{
}

Vinyl::PlaybackError AlbumLoader::load(const Vinyl::CatalogRelease &release)
{
    const QList<Vinyl::CatalogTrack> entries = release.playableTracks();
    if (entries.isEmpty()) {
        qWarning() << "[AlbumLoader::load] Release" << release.id << "has no playable tracks";
        return Vinyl::PlaybackError::EmptyAlbum;
    }

    const bool wasLoading = isLoading();
    const quint64 generation = ++m_generation;
    m_slots = QVector<std::optional<Vinyl::Track>>(entries.size());
    m_pending = entries.size();

    qDebug() << "[AlbumLoader::load] Loading" << release.artist << "-" << release.title
             << "with" << entries.size() << "tracks";

    if (!wasLoading) {
        emit loadingChanged(true);
    }

    QPointer<AlbumLoader> guard(this);
    for (int i = 0; i < entries.size(); ++i) {
        const Vinyl::CatalogTrack entry = entries.at(i);
        const QString artist = release.artist;
        const QString album = release.title;

        m_resolver.resolve(entry.duration, artist, entry.title,
                           [guard, generation, i, entry, artist, album](const Vinyl::ResolvedDuration &duration) {
            if (!guard) {
                return;
            }
            guard->finishTrack(generation, i,
                               Vinyl::Track(entry.position, entry.title, artist, album,
                                            duration.seconds, duration.display));
        });

        // A handler of albumLoaded may already have started another load
        if (!guard || generation != m_generation) {
            break;
        }
    }

    return Vinyl::PlaybackError::None;
}

void AlbumLoader::cancel()
{
    ++m_generation;
    m_slots.clear();

    if (isLoading()) {
        qDebug() << "[AlbumLoader::cancel] Dropping load with" << m_pending << "durations outstanding";
        m_pending = 0;
        emit loadingChanged(false);
    }
}

void AlbumLoader::finishTrack(quint64 generation, int slot, const Vinyl::Track &track)
{
    if (generation != m_generation || slot < 0 || slot >= m_slots.size() || m_slots.at(slot)) {
        return;
    }

    m_slots[slot] = track;
    if (--m_pending > 0) {
        return;
    }

    QVector<Vinyl::Track> tracks;
    tracks.reserve(m_slots.size());
    for (const std::optional<Vinyl::Track> &resolved : std::as_const(m_slots)) {
        tracks.append(*resolved);
    }
    m_slots.clear();

    qDebug() << "[AlbumLoader::finishTrack] Album ready with" << tracks.size() << "tracks";
    emit loadingChanged(false);
    emit albumLoaded(Vinyl::TrackList(tracks));
}
