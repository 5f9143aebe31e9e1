#include "tracklist.h"

namespace Vinyl {

TrackList::TrackList(const QVector<Track> &tracks)
    : m_tracks(tracks)
{
}

std::optional<Track> TrackList::at(int index) const
{
    if (!isValidIndex(index)) {
        return std::nullopt;
    }
    return m_tracks.at(index);
}

QString TrackList::artist() const
{
    return m_tracks.isEmpty() ? QString() : m_tracks.first().artist();
}

QString TrackList::album() const
{
    return m_tracks.isEmpty() ? QString() : m_tracks.first().album();
}

int TrackList::totalDurationSeconds() const
{
    int total = 0;
    for (const Track &track : m_tracks) {
        total += track.durationSeconds();
    }
    return total;
}

} // namespace Vinyl
