#include "durationresolver.h"
#include "durationlookup.h"

#include <QStringList>
#include <QDebug>

namespace Vinyl {

const QString DurationResolver::DefaultDurationDisplay = QStringLiteral("3:30");

DurationResolver::DurationResolver(DurationLookup *lookup)
    : m_lookup(lookup)
{
}

void DurationResolver::resolve(const QString &catalogDuration, const QString &artist,
                               const QString &title, Callback callback) const
{
    if (!catalogDuration.trimmed().isEmpty()) {
        const std::optional<int> seconds = parseCatalogDuration(catalogDuration);
        if (seconds) {
            callback(fromCatalog(*seconds, catalogDuration));
            return;
        }
        qWarning() << "[DurationResolver::resolve] Invalid catalog duration" << catalogDuration
                   << "for" << artist << "-" << title;
    }

    if (!m_lookup) {
        qDebug() << "[DurationResolver::resolve] No lookup available, using default for" << title;
        callback(fallback());
        return;
    }

    qDebug() << "[DurationResolver::resolve] Looking up duration for" << artist << "-" << title;
    m_lookup->lookupDuration(artist, title, [artist, title, callback](const DurationLookup::Result &result) {
        if (result.status == DurationLookup::Status::Found && result.durationMs > 0) {
            ResolvedDuration resolved = fromMilliseconds(result.durationMs);
            qDebug() << "[DurationResolver::resolve] Found duration" << resolved.display
                     << "for" << artist << "-" << title;
            callback(resolved);
            return;
        }

        if (result.status == DurationLookup::Status::Error) {
            qWarning() << "[DurationResolver::resolve] Lookup failed for" << artist << "-" << title
                       << ":" << result.message;
        } else {
            qDebug() << "[DurationResolver::resolve] No usable duration for" << artist << "-" << title;
        }
        callback(fallback());
    });
}

std::optional<int> DurationResolver::parseCatalogDuration(const QString &duration)
{
    const QStringList parts = duration.trimmed().split(':');
    if (parts.size() != 2 && parts.size() != 3) {
        return std::nullopt;
    }

    qint64 total = 0;
    for (const QString &part : parts) {
        if (part.isEmpty()) {
            return std::nullopt;
        }
        for (const QChar c : part) {
            if (!c.isDigit()) {
                return std::nullopt;
            }
        }
        bool ok = false;
        const qint64 value = part.toLongLong(&ok);
        if (!ok) {
            return std::nullopt;
        }
        total = total * 60 + value;
        if (total > MaxDurationSeconds) {
            return std::nullopt;
        }
    }

    return qMax(static_cast<int>(total), 1);
}

QString DurationResolver::formatDuration(int seconds)
{
    const int clamped = qMax(seconds, 0);
    return QString("%1:%2").arg(clamped / 60).arg(clamped % 60, 2, 10, QChar('0'));
}

ResolvedDuration DurationResolver::fromCatalog(int seconds, const QString &display)
{
    ResolvedDuration resolved;
    resolved.seconds = qBound(1, seconds, MaxDurationSeconds);
    resolved.display = display;
    resolved.source = ResolvedDuration::Catalog;
    return resolved;
}

ResolvedDuration DurationResolver::fromMilliseconds(qint64 durationMs)
{
    const qint64 seconds = qBound<qint64>(1, durationMs / 1000, MaxDurationSeconds);

    ResolvedDuration resolved;
    resolved.seconds = static_cast<int>(seconds);
    resolved.display = formatDuration(resolved.seconds);
    resolved.source = ResolvedDuration::Lookup;
    return resolved;
}

ResolvedDuration DurationResolver::fallback()
{
    ResolvedDuration resolved;
    resolved.seconds = DefaultDurationSeconds;
    resolved.display = DefaultDurationDisplay;
    resolved.source = ResolvedDuration::Default;
    return resolved;
}

} // namespace Vinyl
