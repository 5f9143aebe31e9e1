#ifndef ALBUMLOADER_H
#define ALBUMLOADER_H

#include <QObject>
#include <QVector>
#include <optional>

#include "catalogrelease.h"
#include "track.h"
#include "tracklist.h"
#include "backend/playback/playbackerror.h"
#include "backend/utility/durationresolver.h"

// Builds the TrackList of a catalog release. Headings are dropped and every
// remaining entry gets its duration resolved, which may involve a web lookup,
// so the finished list arrives through albumLoaded().
class AlbumLoader : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool loading READ isLoading NOTIFY loadingChanged)

public:
    explicit AlbumLoader(Vinyl::DurationLookup *lookup = nullptr, QObject *parent = nullptr);

    void setDurationLookup(Vinyl::DurationLookup *lookup) { m_resolver.setLookup(lookup); }

    bool isLoading() const { return m_pending > 0; }

    // EmptyAlbum is reported right away and nothing is emitted afterwards.
    // Starting a new load discards the results of one still in progress.
    Vinyl::PlaybackError load(const Vinyl::CatalogRelease &release);

    // Drops the load in progress; lookups that answer later are ignored
    void cancel();

signals:
    void albumLoaded(const Vinyl::TrackList &tracks);
    void loadingChanged(bool loading);

private:
    void finishTrack(quint64 generation, int slot, const Vinyl::Track &track);

    Vinyl::DurationResolver m_resolver;
    QVector<std::optional<Vinyl::Track>> m_slots;
    int m_pending = 0;
    quint64 m_generation = 0;
};

#endif // ALBUMLOADER_H
