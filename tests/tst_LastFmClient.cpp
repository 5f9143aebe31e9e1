#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QCryptographicHash>
#include <QElapsedTimer>
#include "backend/scrobble/lastfmclient.h"
#include "backend/scrobble/ratelimiter.h"

using Status = Vinyl::DurationLookup::Status;

static QString md5(const QByteArray &data)
{
    return QString::fromLatin1(QCryptographicHash::hash(data, QCryptographicHash::Md5).toHex());
}

class tst_LastFmClient : public QObject {
    Q_OBJECT

private slots:
    // ── Signing ──────────────────────────────────────────────────
    void apiSignature_sortsKeysAndSkipsFormat()
    {
        QMap<QString, QString> params;
        params.insert(QStringLiteral("method"), QStringLiteral("track.scrobble"));
        params.insert(QStringLiteral("artist"), QStringLiteral("Nirvana"));
        params.insert(QStringLiteral("api_key"), QStringLiteral("key"));
        params.insert(QStringLiteral("format"), QStringLiteral("json"));
        params.insert(QStringLiteral("callback"), QStringLiteral("cb"));

        QCOMPARE(LastFmClient::apiSignature(params, QStringLiteral("secret")),
                 md5("api_keykeyartistNirvanamethodtrack.scrobblesecret"));
    }

    void apiSignature_utf8Values()
    {
        QMap<QString, QString> params;
        params.insert(QStringLiteral("artist"), QStringLiteral("Björk"));
        QCOMPARE(LastFmClient::apiSignature(params, QStringLiteral("s")),
                 md5(QStringLiteral("artistBjörks").toUtf8()));
    }

    void mobileAuthToken_hashesUserAndPasswordHash()
    {
        QCOMPARE(LastFmClient::mobileAuthToken(QStringLiteral("user"), QStringLiteral("abc")),
                 md5("userabc"));
    }

    // ── track.getInfo ────────────────────────────────────────────
    void parseTrackDuration_found()
    {
        auto r = LastFmClient::parseTrackDuration(R"({"track":{"name":"Lithium","duration":"257000"}})");
        QCOMPARE(r.status, Status::Found);
        QCOMPARE(r.durationMs, qint64(257000));
    }

    void parseTrackDuration_zeroIsNotFound()
    {
        auto r = LastFmClient::parseTrackDuration(R"({"track":{"name":"Lithium","duration":"0"}})");
        QCOMPARE(r.status, Status::NotFound);
    }

    void parseTrackDuration_missingIsNotFound()
    {
        auto r = LastFmClient::parseTrackDuration(R"({"track":{"name":"Lithium"}})");
        QCOMPARE(r.status, Status::NotFound);
    }

    void parseTrackDuration_error6IsNotFound()
    {
        auto r = LastFmClient::parseTrackDuration(R"({"error":6,"message":"Track not found"})");
        QCOMPARE(r.status, Status::NotFound);
        QVERIFY(r.message.contains(QStringLiteral("Track not found")));
    }

    void parseTrackDuration_otherErrorIsError()
    {
        auto r = LastFmClient::parseTrackDuration(R"({"error":10,"message":"Invalid API key"})");
        QCOMPARE(r.status, Status::Error);
    }

    void parseTrackDuration_garbageIsError()
    {
        QCOMPARE(LastFmClient::parseTrackDuration("<html>").status, Status::Error);
    }

    // ── Sessions and scrobbles ───────────────────────────────────
    void parseSessionKey()
    {
        QString error;
        QCOMPARE(LastFmClient::parseSessionKey(R"({"session":{"name":"user","key":"d580d57f","subscriber":0}})", &error),
                 QStringLiteral("d580d57f"));
        QVERIFY(error.isEmpty());

        QCOMPARE(LastFmClient::parseSessionKey(R"({"error":4,"message":"Authentication Failed"})", &error), QString());
        QVERIFY(error.contains(QStringLiteral("Authentication Failed")));
    }

    void parseScrobbleResponse()
    {
        QString error;
        QVERIFY(LastFmClient::parseScrobbleResponse(
            R"({"scrobbles":{"@attr":{"accepted":1,"ignored":0},"scrobble":{}}})", &error));
        QVERIFY(!LastFmClient::parseScrobbleResponse(
            R"({"scrobbles":{"@attr":{"accepted":0,"ignored":1},"scrobble":{}}})", &error));
        QVERIFY(!LastFmClient::parseScrobbleResponse(R"({"error":9,"message":"Invalid session key"})", &error));
        QVERIFY(error.contains(QStringLiteral("Invalid session key")));
    }

    // ── Without credentials ──────────────────────────────────────
    void withoutSession_requestsFailImmediately()
    {
        LastFmClient client;
        QSignalSpy failed(&client, &ScrobbleService::requestFailed);
        client.updateNowPlaying(QStringLiteral("A"), QStringLiteral("T"), QString(), 100);
        client.scrobble(QStringLiteral("A"), QStringLiteral("T"), QString(), 100, QDateTime::currentDateTimeUtc());
        QCOMPARE(failed.count(), 2);
        QCOMPARE(client.pendingRequests(), 0);
    }

    void authenticate_withoutCredentials_fails()
    {
        LastFmClient client;
        QSignalSpy failed(&client, &LastFmClient::authenticationFailed);
        client.authenticate(QStringLiteral("user"), QStringLiteral("hash"));
        QCOMPARE(failed.count(), 1);
    }

    void lookupDuration_withoutApiKey_reportsError()
    {
        LastFmClient client;
        Vinyl::DurationLookup::Result result;
        bool called = false;
        client.lookupDuration(QStringLiteral("A"), QStringLiteral("T"),
                              [&](const Vinyl::DurationLookup::Result &r) { result = r; called = true; });
        QVERIFY(called);
        QCOMPARE(result.status, Status::Error);
    }

    void shutdown_withNothingPending_returnsAtOnce()
    {
        LastFmClient client;
        QElapsedTimer timer;
        timer.start();
        client.shutdown(2000);
        QVERIFY(timer.elapsed() < 1000);
    }

    // ── RateLimiter ──────────────────────────────────────────────
    void rateLimiter_firstRequestRunsImmediately()
    {
        RateLimiter limiter(5);
        QCOMPARE(limiter.intervalMs(), 200);
        int runs = 0;
        limiter.enqueue([&runs]() { ++runs; });
        limiter.enqueue([&runs]() { ++runs; });
        limiter.enqueue([&runs]() { ++runs; });
        QCOMPARE(runs, 1);
        QCOMPARE(limiter.pendingCount(), 2);
        QTRY_COMPARE(runs, 3);
    }

    void rateLimiter_clearDropsQueued()
    {
        RateLimiter limiter(5);
        int runs = 0;
        limiter.enqueue([&runs]() { ++runs; });
        limiter.enqueue([&runs]() { ++runs; });
        limiter.clear();
        QTest::qWait(500);
        QCOMPARE(runs, 1);
    }
};

QTEST_MAIN(tst_LastFmClient)
#include "tst_LastFmClient.moc"
