#ifndef TRACKLIST_H
#define TRACKLIST_H

#include <QVector>
#include <QMetaType>
#include <optional>

#include "track.h"

namespace Vinyl {

// Ordered, immutable sequence of the tracks of one loaded album.
// An empty list means nothing is loaded.
class TrackList
{
public:
    TrackList() = default;
    explicit TrackList(const QVector<Track> &tracks);

    int length() const { return m_tracks.size(); }
    bool isEmpty() const { return m_tracks.isEmpty(); }
    bool isValidIndex(int index) const { return index >= 0 && index < m_tracks.size(); }

    // std::nullopt when index is outside [0, length())
    std::optional<Track> at(int index) const;

    QString artist() const;
    QString album() const;
    int totalDurationSeconds() const;

    QVector<Track> tracks() const { return m_tracks; }

private:
    QVector<Track> m_tracks;
};

} // namespace Vinyl

Q_DECLARE_METATYPE(Vinyl::TrackList)

#endif // TRACKLIST_H
