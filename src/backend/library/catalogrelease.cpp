#include "catalogrelease.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QUrl>
#include <QDebug>

namespace Vinyl {

QList<CatalogTrack> CatalogRelease::playableTracks() const
{
    QList<CatalogTrack> playable;
    for (const CatalogTrack &track : tracklist) {
        if (track.isPlayable()) {
            playable.append(track);
        }
    }
    return playable;
}

CatalogRelease CatalogRelease::fromJson(const QJsonObject &json)
{
    CatalogRelease release;
    release.id = json.value("id").toVariant().toLongLong();
    if (release.id <= 0) {
        // Some exports carry only the release page or API address
        release.id = parseReleaseId(json.value("uri").toString());
        if (release.id == 0) {
            release.id = parseReleaseId(json.value("resource_url").toString());
        }
    }
    release.title = json.value("title").toString();

    const QJsonArray artists = json.value("artists").toArray();
    if (!artists.isEmpty()) {
        release.artist = cleanArtistName(artists.first().toObject().value("name").toString());
    }

    const QJsonArray tracklist = json.value("tracklist").toArray();
    for (const QJsonValue &value : tracklist) {
        const QJsonObject entry = value.toObject();
        CatalogTrack track;
        track.position = entry.value("position").toString();
        track.title = entry.value("title").toString();
        track.duration = entry.value("duration").toString();
        track.type = entry.value("type_").toString();
        release.tracklist.append(track);
    }

    return release;
}

std::optional<CatalogRelease> CatalogRelease::fromFile(const QString &path, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QString("Cannot open %1: %2").arg(path, file.errorString());
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QString("Invalid release document %1: %2").arg(path, parseError.errorString());
        }
        return std::nullopt;
    }

    CatalogRelease release = fromJson(doc.object());
    qDebug() << "[CatalogRelease::fromFile] Read release" << release.id << release.title
             << "with" << release.tracklist.size() << "tracklist entries";
    return release;
}

QString CatalogRelease::cleanArtistName(const QString &name)
{
    static const QRegularExpression suffix(QStringLiteral("\\s*\\(\\d+\\)\\s*$"));
    QString cleaned = name;
    cleaned.remove(suffix);
    return cleaned.trimmed();
}

qint64 CatalogRelease::parseReleaseId(const QString &input)
{
    const QString text = input.trimmed();
    if (text.isEmpty()) {
        return 0;
    }

    bool ok = false;
    const qint64 id = text.toLongLong(&ok);
    if (ok) {
        return id > 0 ? id : 0;
    }

    const QStringList segments = QUrl(text).path().split('/', Qt::SkipEmptyParts);
    for (int i = 0; i + 1 < segments.size(); ++i) {
        if (segments[i] == QLatin1String("release") || segments[i] == QLatin1String("releases")) {
            // "8844291-Artist-Title" -> 8844291
            static const QRegularExpression leadingDigits(QStringLiteral("^(\\d+)"));
            const QRegularExpressionMatch match = leadingDigits.match(segments[i + 1]);
            if (match.hasMatch()) {
                return match.captured(1).toLongLong();
            }
        }
    }
    return 0;
}

} // namespace Vinyl
