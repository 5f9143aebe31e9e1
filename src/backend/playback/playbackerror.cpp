#include "playbackerror.h"

namespace Vinyl {

QString errorString(PlaybackError error)
{
    switch (error) {
    case PlaybackError::None:
        return QString();
    case PlaybackError::EmptyAlbum:
        return QStringLiteral("The release has no playable tracks");
    case PlaybackError::IndexOutOfRange:
        return QStringLiteral("Track index is out of range");
    case PlaybackError::NoAlbumLoaded:
        return QStringLiteral("Load an album first");
    case PlaybackError::ExternalServiceFailure:
        return QStringLiteral("External service request failed");
    }
    return QString();
}

} // namespace Vinyl
