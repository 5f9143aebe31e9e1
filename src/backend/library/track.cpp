#include "track.h"

#include <QtGlobal>

namespace Vinyl {

Track::Track(const QString &position, const QString &title,
             const QString &artist, const QString &album,
             int durationSeconds, const QString &durationDisplay)
    : m_position(position)
    , m_title(title)
    , m_artist(artist)
    , m_album(album)
    , m_durationSeconds(qMax(durationSeconds, 1))
    , m_durationDisplay(durationDisplay)
{
}

QString Track::displayName() const
{
    if (m_position.isEmpty()) {
        return m_title;
    }
    return QString("%1. %2").arg(m_position, m_title);
}

bool Track::operator==(const Track &other) const
{
    return m_position == other.m_position
        && m_title == other.m_title
        && m_artist == other.m_artist
        && m_album == other.m_album
        && m_durationSeconds == other.m_durationSeconds
        && m_durationDisplay == other.m_durationDisplay;
}

} // namespace Vinyl
