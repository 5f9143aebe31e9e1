#ifndef PLAYBACKERROR_H
#define PLAYBACKERROR_H

#include <QObject>
#include <QString>

namespace Vinyl {
Q_NAMESPACE

// Result of a playback command. Anything but None leaves the engine untouched.
enum class PlaybackError {
    None,
    EmptyAlbum,
    IndexOutOfRange,
    NoAlbumLoaded,
    ExternalServiceFailure
};
Q_ENUM_NS(PlaybackError)

QString errorString(PlaybackError error);

} // namespace Vinyl

#endif // PLAYBACKERROR_H
