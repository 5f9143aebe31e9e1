#ifndef TRACK_H
#define TRACK_H

#include <QString>
#include <QMetaType>

namespace Vinyl {

// One playable entry of a loaded release. Values are fixed at construction.
class Track
{
public:
    Track() = default;
    Track(const QString &position, const QString &title,
          const QString &artist, const QString &album,
          int durationSeconds, const QString &durationDisplay);

    QString position() const { return m_position; }
    QString title() const { return m_title; }
    QString artist() const { return m_artist; }
    QString album() const { return m_album; }
    int durationSeconds() const { return m_durationSeconds; } // always >= 1
    QString durationDisplay() const { return m_durationDisplay; }

    QString displayName() const; // "A1. Title"

    bool operator==(const Track &other) const;
    bool operator!=(const Track &other) const { return !(*this == other); }

private:
    QString m_position;
    QString m_title;
    QString m_artist;
    QString m_album;
    int m_durationSeconds = 1;
    QString m_durationDisplay;
};

} // namespace Vinyl

Q_DECLARE_METATYPE(Vinyl::Track)

#endif // TRACK_H
