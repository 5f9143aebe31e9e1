#ifndef CATALOGRELEASE_H
#define CATALOGRELEASE_H

#include <QString>
#include <QList>
#include <QJsonObject>
#include <optional>

namespace Vinyl {

// Raw tracklist entry as the catalog delivers it
struct CatalogTrack {
    QString position;
    QString title;
    QString duration;   // may be empty
    QString type;       // "track", "heading", "index"; empty means track

    bool isPlayable() const { return type != QLatin1String("heading"); }
};

// A Discogs release document reduced to what playback needs
struct CatalogRelease {
    qint64 id = 0;
    QString title;
    QString artist;     // first credited artist, disambiguation suffix removed
    QList<CatalogTrack> tracklist;

    QList<CatalogTrack> playableTracks() const;

    static CatalogRelease fromJson(const QJsonObject &json);
    static std::optional<CatalogRelease> fromFile(const QString &path, QString *errorMessage = nullptr);

    // "Artist (2)" -> "Artist"
    static QString cleanArtistName(const QString &name);

    // Accepts "8844291" or a release URL; returns 0 when no id can be found
    static qint64 parseReleaseId(const QString &input);
};

} // namespace Vinyl

#endif // CATALOGRELEASE_H
