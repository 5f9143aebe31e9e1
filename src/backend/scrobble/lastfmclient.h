#ifndef LASTFMCLIENT_H
#define LASTFMCLIENT_H

#include <QMap>
#include <QSet>
#include <QJsonObject>
#include <functional>

#include "scrobbleservice.h"
#include "backend/utility/durationlookup.h"

class QNetworkAccessManager;
class QNetworkReply;
class RateLimiter;

// Last.fm web service client. Handles the mobile-session handshake, the
// now playing and scrobble submissions, and track.getInfo duration lookups.
class LastFmClient : public ScrobbleService, public Vinyl::DurationLookup
{
    Q_OBJECT

public:
    static const QString BASE_URL;
    static constexpr int REQUESTS_PER_SECOND = 5;
    static constexpr int ERROR_INVALID_PARAMETERS = 6;

    explicit LastFmClient(QObject *parent = nullptr);
    ~LastFmClient() override;

    void setCredentials(const QString &apiKey, const QString &apiSecret);
    void setSessionKey(const QString &sessionKey) { m_sessionKey = sessionKey; }
    QString sessionKey() const { return m_sessionKey; }
    bool hasSession() const { return !m_sessionKey.isEmpty(); }

    void setTransferTimeout(int msecs) { m_transferTimeoutMs = msecs; }
    int transferTimeout() const { return m_transferTimeoutMs; }

    int pendingRequests() const { return m_pendingReplies.size(); }

    void authenticate(const QString &username, const QString &passwordHash);

    void updateNowPlaying(const QString &artist, const QString &title,
                          const QString &album, int durationSeconds) override;
    void scrobble(const QString &artist, const QString &title,
                  const QString &album, int durationSeconds,
                  const QDateTime &timestamp) override;

    void lookupDuration(const QString &artist, const QString &title, Callback callback) override;

    // Waits up to msecs for in-flight requests, then aborts whatever is left
    void shutdown(int msecs);

    // md5 over the sorted key/value pairs followed by the secret.
    // "format" and "callback" are not signed.
    static QString apiSignature(const QMap<QString, QString> &params, const QString &apiSecret);
    static QString mobileAuthToken(const QString &username, const QString &passwordHash);

    static Result parseTrackDuration(const QByteArray &data);
    static QString parseSessionKey(const QByteArray &data, QString *errorMessage = nullptr);
    static bool parseScrobbleResponse(const QByteArray &data, QString *errorMessage = nullptr);

signals:
    void authenticated(const QString &sessionKey);
    void authenticationFailed(const QString &message);

private:
    using ReplyHandler = std::function<void(const QByteArray &data, const QString &networkError)>;

    void postSigned(QMap<QString, QString> params, ReplyHandler handler);
    void get(const QMap<QString, QString> &params, ReplyHandler handler);
    void track(QNetworkReply *reply, ReplyHandler handler);
    static QString apiErrorMessage(const QJsonObject &root);

    QNetworkAccessManager *m_network;
    RateLimiter *m_rateLimiter;
    QSet<QNetworkReply*> m_pendingReplies;

    QString m_apiKey;
    QString m_apiSecret;
    QString m_sessionKey;
    int m_transferTimeoutMs = 15000;
    bool m_shuttingDown = false;
};

#endif // LASTFMCLIENT_H
