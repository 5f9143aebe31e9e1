#ifndef SCROBBLESERVICE_H
#define SCROBBLESERVICE_H

#include <QObject>
#include <QString>
#include <QDateTime>

// Listening-history service receiving "now playing" and "scrobble" events.
// Calls return immediately; outcomes arrive through the signals.
class ScrobbleService : public QObject
{
    Q_OBJECT

public:
    explicit ScrobbleService(QObject *parent = nullptr) : QObject(parent) {}
    ~ScrobbleService() override = default;

    virtual void updateNowPlaying(const QString &artist, const QString &title,
                                  const QString &album, int durationSeconds) = 0;
    virtual void scrobble(const QString &artist, const QString &title,
                          const QString &album, int durationSeconds,
                          const QDateTime &timestamp) = 0;

signals:
    void nowPlayingUpdated(const QString &artist, const QString &title);
    void scrobbled(const QString &artist, const QString &title);
    void requestFailed(const QString &message);
};

#endif // SCROBBLESERVICE_H
