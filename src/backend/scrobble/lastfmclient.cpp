#include "lastfmclient.h"
#include "ratelimiter.h"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QCoreApplication>
#include <QCryptographicHash>
#include <QElapsedTimer>
#include <QJsonDocument>
#include <QUrlQuery>
#include <QDebug>

const QString LastFmClient::BASE_URL = QStringLiteral("https://ws.audioscrobbler.com/2.0/");

namespace {

QString md5Hex(const QString &text)
{
    return QString::fromLatin1(
        QCryptographicHash::hash(text.toUtf8(), QCryptographicHash::Md5).toHex());
}

QJsonObject parseObject(const QByteArray &data, QString *errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid response: %1").arg(parseError.errorString());
        }
        return QJsonObject();
    }
    return doc.object();
}

} // namespace

LastFmClient::LastFmClient(QObject *parent)
    : ScrobbleService(parent)
    , m_network(new QNetworkAccessManager(this))
    , m_rateLimiter(new RateLimiter(REQUESTS_PER_SECOND, this))
{
}

LastFmClient::~LastFmClient()
{
    m_rateLimiter->clear();
    for (QNetworkReply *reply : std::as_const(m_pendingReplies)) {
        reply->disconnect(this);
        reply->abort();
        reply->deleteLater();
    }
    m_pendingReplies.clear();
}

void LastFmClient::setCredentials(const QString &apiKey, const QString &apiSecret)
{
    m_apiKey = apiKey;
    m_apiSecret = apiSecret;
}

QString LastFmClient::apiSignature(const QMap<QString, QString> &params, const QString &apiSecret)
{
    // QMap iterates in key order
    QString raw;
    for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
        if (it.key() == QLatin1String("format") || it.key() == QLatin1String("callback")) {
            continue;
        }
        raw += it.key() + it.value();
    }
    raw += apiSecret;
    return md5Hex(raw);
}

QString LastFmClient::mobileAuthToken(const QString &username, const QString &passwordHash)
{
    return md5Hex(username + passwordHash);
}

QString LastFmClient::apiErrorMessage(const QJsonObject &root)
{
    return QStringLiteral("Last.fm error %1: %2")
        .arg(root.value(QStringLiteral("error")).toInt())
        .arg(root.value(QStringLiteral("message")).toString());
}

Vinyl::DurationLookup::Result LastFmClient::parseTrackDuration(const QByteArray &data)
{
    Result result;

    QString parseError;
    const QJsonObject root = parseObject(data, &parseError);
    if (root.isEmpty()) {
        result.status = Status::Error;
        result.message = parseError.isEmpty() ? QStringLiteral("Empty response") : parseError;
        return result;
    }

    if (root.contains(QStringLiteral("error"))) {
        const int code = root.value(QStringLiteral("error")).toInt();
        result.status = code == ERROR_INVALID_PARAMETERS ? Status::NotFound : Status::Error;
        result.message = apiErrorMessage(root);
        return result;
    }

    // track.getInfo reports the duration as a string of milliseconds
    const QJsonValue duration = root.value(QStringLiteral("track")).toObject()
                                    .value(QStringLiteral("duration"));
    qint64 durationMs = 0;
    if (duration.isString()) {
        durationMs = duration.toString().toLongLong();
    } else if (duration.isDouble()) {
        durationMs = static_cast<qint64>(duration.toDouble());
    }

    if (durationMs <= 0) {
        result.status = Status::NotFound;
        result.message = QStringLiteral("No duration known");
        return result;
    }

    result.status = Status::Found;
    result.durationMs = durationMs;
    return result;
}

QString LastFmClient::parseSessionKey(const QByteArray &data, QString *errorMessage)
{
    const QJsonObject root = parseObject(data, errorMessage);
    if (root.contains(QStringLiteral("error"))) {
        if (errorMessage) {
            *errorMessage = apiErrorMessage(root);
        }
        return QString();
    }

    const QString key = root.value(QStringLiteral("session")).toObject()
                            .value(QStringLiteral("key")).toString();
    if (key.isEmpty() && errorMessage && errorMessage->isEmpty()) {
        *errorMessage = QStringLiteral("Response did not contain a session key");
    }
    return key;
}

bool LastFmClient::parseScrobbleResponse(const QByteArray &data, QString *errorMessage)
{
    const QJsonObject root = parseObject(data, errorMessage);
    if (root.isEmpty()) {
        return false;
    }

    if (root.contains(QStringLiteral("error"))) {
        if (errorMessage) {
            *errorMessage = apiErrorMessage(root);
        }
        return false;
    }

    const QJsonObject attr = root.value(QStringLiteral("scrobbles")).toObject()
                                 .value(QStringLiteral("@attr")).toObject();
    const QJsonValue ignored = attr.value(QStringLiteral("ignored"));
    const int ignoredCount = ignored.isString() ? ignored.toString().toInt() : ignored.toInt();
    if (ignoredCount > 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Scrobble ignored by Last.fm");
        }
        return false;
    }
    return true;
}

void LastFmClient::authenticate(const QString &username, const QString &passwordHash)
{
    if (m_apiKey.isEmpty() || m_apiSecret.isEmpty()) {
        emit authenticationFailed(QStringLiteral("API key or secret is not configured"));
        return;
    }
    if (username.isEmpty() || passwordHash.isEmpty()) {
        emit authenticationFailed(QStringLiteral("Username or password hash is not configured"));
        return;
    }

    qDebug() << "[LastFmClient::authenticate] Requesting mobile session for" << username;

    QMap<QString, QString> params;
    params.insert(QStringLiteral("method"), QStringLiteral("auth.getMobileSession"));
    params.insert(QStringLiteral("username"), username);
    params.insert(QStringLiteral("authToken"), mobileAuthToken(username, passwordHash));

    postSigned(params, [this](const QByteArray &data, const QString &networkError) {
        if (!networkError.isEmpty()) {
            emit authenticationFailed(networkError);
            return;
        }

        QString message;
        const QString key = parseSessionKey(data, &message);
        if (key.isEmpty()) {
            qWarning() << "[LastFmClient::authenticate]" << message;
            emit authenticationFailed(message);
            return;
        }

        m_sessionKey = key;
        qDebug() << "[LastFmClient::authenticate] Session established";
        emit authenticated(key);
    });
}

void LastFmClient::updateNowPlaying(const QString &artist, const QString &title,
                                    const QString &album, int durationSeconds)
{
    if (!hasSession()) {
        emit requestFailed(QStringLiteral("Not signed in to Last.fm"));
        return;
    }

    QMap<QString, QString> params;
    params.insert(QStringLiteral("method"), QStringLiteral("track.updateNowPlaying"));
    params.insert(QStringLiteral("artist"), artist);
    params.insert(QStringLiteral("track"), title);
    if (!album.isEmpty()) {
        params.insert(QStringLiteral("album"), album);
    }
    if (durationSeconds > 0) {
        params.insert(QStringLiteral("duration"), QString::number(durationSeconds));
    }

    postSigned(params, [this, artist, title](const QByteArray &data, const QString &networkError) {
        if (!networkError.isEmpty()) {
            emit requestFailed(QStringLiteral("Now playing update failed: %1").arg(networkError));
            return;
        }

        QString message;
        const QJsonObject root = parseObject(data, &message);
        if (root.isEmpty() || root.contains(QStringLiteral("error"))) {
            if (!root.isEmpty()) {
                message = apiErrorMessage(root);
            }
            emit requestFailed(QStringLiteral("Now playing update failed: %1").arg(message));
            return;
        }

        qInfo() << "[LastFmClient] Now playing:" << artist << "-" << title;
        emit nowPlayingUpdated(artist, title);
    });
}

void LastFmClient::scrobble(const QString &artist, const QString &title,
                            const QString &album, int durationSeconds,
                            const QDateTime &timestamp)
{
    if (!hasSession()) {
        emit requestFailed(QStringLiteral("Not signed in to Last.fm"));
        return;
    }

    QMap<QString, QString> params;
    params.insert(QStringLiteral("method"), QStringLiteral("track.scrobble"));
    params.insert(QStringLiteral("artist"), artist);
    params.insert(QStringLiteral("track"), title);
    params.insert(QStringLiteral("timestamp"), QString::number(timestamp.toSecsSinceEpoch()));
    if (!album.isEmpty()) {
        params.insert(QStringLiteral("album"), album);
    }
    if (durationSeconds > 0) {
        params.insert(QStringLiteral("duration"), QString::number(durationSeconds));
    }

    postSigned(params, [this, artist, title](const QByteArray &data, const QString &networkError) {
        if (!networkError.isEmpty()) {
            emit requestFailed(QStringLiteral("Scrobble failed: %1").arg(networkError));
            return;
        }

        QString message;
        if (!parseScrobbleResponse(data, &message)) {
            emit requestFailed(QStringLiteral("Scrobble failed: %1").arg(message));
            return;
        }

        qInfo() << "[LastFmClient] Scrobbled:" << artist << "-" << title;
        emit scrobbled(artist, title);
    });
}

void LastFmClient::lookupDuration(const QString &artist, const QString &title, Callback callback)
{
    if (m_apiKey.isEmpty()) {
        Result result;
        result.status = Status::Error;
        result.message = QStringLiteral("API key is not configured");
        callback(result);
        return;
    }

    QMap<QString, QString> params;
    params.insert(QStringLiteral("method"), QStringLiteral("track.getInfo"));
    params.insert(QStringLiteral("artist"), artist);
    params.insert(QStringLiteral("track"), title);
    params.insert(QStringLiteral("autocorrect"), QStringLiteral("1"));

    get(params, [callback](const QByteArray &data, const QString &networkError) {
        if (!networkError.isEmpty()) {
            Result result;
            result.status = Status::Error;
            result.message = networkError;
            callback(result);
            return;
        }
        callback(parseTrackDuration(data));
    });
}

void LastFmClient::postSigned(QMap<QString, QString> params, ReplyHandler handler)
{
    params.insert(QStringLiteral("api_key"), m_apiKey);
    if (!m_sessionKey.isEmpty() && params.value(QStringLiteral("method")) != QLatin1String("auth.getMobileSession")) {
        params.insert(QStringLiteral("sk"), m_sessionKey);
    }
    params.insert(QStringLiteral("api_sig"), apiSignature(params, m_apiSecret));
    params.insert(QStringLiteral("format"), QStringLiteral("json"));

    if (m_shuttingDown) {
        handler(QByteArray(), QStringLiteral("Client is shutting down"));
        return;
    }

    m_rateLimiter->enqueue([this, params, handler]() {
        QByteArray body;
        for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
            if (!body.isEmpty()) {
                body += '&';
            }
            body += QUrl::toPercentEncoding(it.key()) + '=' + QUrl::toPercentEncoding(it.value());
        }

        QNetworkRequest request{QUrl(BASE_URL)};
        request.setHeader(QNetworkRequest::ContentTypeHeader,
                          QStringLiteral("application/x-www-form-urlencoded"));
        request.setTransferTimeout(m_transferTimeoutMs);

        track(m_network->post(request, body), handler);
    });
}

void LastFmClient::get(const QMap<QString, QString> &params, ReplyHandler handler)
{
    if (m_shuttingDown) {
        handler(QByteArray(), QStringLiteral("Client is shutting down"));
        return;
    }

    m_rateLimiter->enqueue([this, params, handler]() {
        QUrl url(BASE_URL);
        QUrlQuery query;
        for (auto it = params.constBegin(); it != params.constEnd(); ++it) {
            query.addQueryItem(it.key(), it.value());
        }
        query.addQueryItem(QStringLiteral("api_key"), m_apiKey);
        query.addQueryItem(QStringLiteral("format"), QStringLiteral("json"));
        url.setQuery(query);

        QNetworkRequest request(url);
        request.setTransferTimeout(m_transferTimeoutMs);

        track(m_network->get(request), handler);
    });
}

void LastFmClient::track(QNetworkReply *reply, ReplyHandler handler)
{
    m_pendingReplies.insert(reply);

    connect(reply, &QNetworkReply::finished, this, [this, reply, handler]() {
        m_pendingReplies.remove(reply);
        reply->deleteLater();

        const QByteArray data = reply->readAll();
        if (reply->error() != QNetworkReply::NoError) {
            // Last.fm answers API errors with 4xx and a JSON body worth reading
            if (!data.isEmpty() && reply->error() != QNetworkReply::OperationCanceledError) {
                handler(data, QString());
                return;
            }
            qWarning() << "[LastFmClient] Network error:" << reply->errorString();
            handler(QByteArray(), reply->errorString());
            return;
        }

        handler(data, QString());
    });
}

void LastFmClient::shutdown(int msecs)
{
    m_shuttingDown = true;
    m_rateLimiter->clear();

    if (m_pendingReplies.isEmpty()) {
        return;
    }

    qDebug() << "[LastFmClient::shutdown] Waiting for" << m_pendingReplies.size() << "requests";

    QElapsedTimer timer;
    timer.start();
    while (!m_pendingReplies.isEmpty() && timer.elapsed() < msecs) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
    }

    if (!m_pendingReplies.isEmpty()) {
        qWarning() << "[LastFmClient::shutdown] Aborting" << m_pendingReplies.size()
                   << "unfinished requests";
        const QSet<QNetworkReply*> remaining = m_pendingReplies;
        for (QNetworkReply *reply : remaining) {
            reply->abort();
        }
    }
}
