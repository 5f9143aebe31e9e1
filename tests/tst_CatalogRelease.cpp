#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QJsonDocument>
#include "backend/library/catalogrelease.h"

using Vinyl::CatalogRelease;

static QByteArray sampleRelease()
{
    return QByteArrayLiteral(R"({
        "id": 8844291,
        "title": "Blue Train",
        "artists": [{"name": "John Coltrane (2)"}, {"name": "Lee Morgan"}],
        "tracklist": [
            {"position": "", "title": "Side A", "duration": "", "type_": "heading"},
            {"position": "A1", "title": "Blue Train", "duration": "10:43", "type_": "track"},
            {"position": "A2", "title": "Moment's Notice", "duration": "", "type_": "track"},
            {"position": "", "title": "Side B", "type_": "heading"},
            {"position": "B1", "title": "Locomotion", "duration": "7:14"}
        ]
    })");
}

class tst_CatalogRelease : public QObject {
    Q_OBJECT

private slots:
    void fromJson_readsRelease()
    {
        CatalogRelease r = CatalogRelease::fromJson(QJsonDocument::fromJson(sampleRelease()).object());
        QCOMPARE(r.id, qint64(8844291));
        QCOMPARE(r.title, QStringLiteral("Blue Train"));
        QCOMPARE(r.artist, QStringLiteral("John Coltrane"));
        QCOMPARE(r.tracklist.size(), 5);
    }

    void fromJson_withoutId_usesReleaseAddress_data()
    {
        QTest::addColumn<QByteArray>("document");
        QTest::addColumn<qlonglong>("expected");
        QTest::newRow("page uri")
            << QByteArrayLiteral(R"({"title": "T", "uri": "https://www.discogs.com/release/8844291-Blue-Train"})")
            << qlonglong(8844291);
        QTest::newRow("api resource_url")
            << QByteArrayLiteral(R"({"title": "T", "resource_url": "https://api.discogs.com/releases/249504"})")
            << qlonglong(249504);
        QTest::newRow("numeric id wins")
            << QByteArrayLiteral(R"({"id": 7, "uri": "https://www.discogs.com/release/8844291"})")
            << qlonglong(7);
        QTest::newRow("nothing usable")
            << QByteArrayLiteral(R"({"title": "T", "uri": "https://www.discogs.com/master/1"})")
            << qlonglong(0);
    }

    void fromJson_withoutId_usesReleaseAddress()
    {
        QFETCH(QByteArray, document);
        QFETCH(qlonglong, expected);
        CatalogRelease r = CatalogRelease::fromJson(QJsonDocument::fromJson(document).object());
        QCOMPARE(qlonglong(r.id), expected);
    }

    void playableTracks_skipsHeadings()
    {
        CatalogRelease r = CatalogRelease::fromJson(QJsonDocument::fromJson(sampleRelease()).object());
        const QList<Vinyl::CatalogTrack> playable = r.playableTracks();
        QCOMPARE(playable.size(), 3);
        QCOMPARE(playable.at(0).position, QStringLiteral("A1"));
        QCOMPARE(playable.at(1).duration, QString());
        // Missing type_ counts as a track
        QCOMPARE(playable.at(2).title, QStringLiteral("Locomotion"));
    }

    void fromFile_roundTrip()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("release.json"));
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(sampleRelease());
        file.close();

        QString error;
        std::optional<CatalogRelease> r = CatalogRelease::fromFile(path, &error);
        QVERIFY2(r.has_value(), qPrintable(error));
        QCOMPARE(r->playableTracks().size(), 3);
    }

    void fromFile_missing()
    {
        QString error;
        QVERIFY(!CatalogRelease::fromFile(QStringLiteral("/nonexistent/release.json"), &error));
        QVERIFY(!error.isEmpty());
    }

    void fromFile_notJson()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("broken.json"));
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ not json");
        file.close();

        QString error;
        QVERIFY(!CatalogRelease::fromFile(path, &error));
        QVERIFY(error.contains(QStringLiteral("Invalid release document")));
    }

    void cleanArtistName_data()
    {
        QTest::addColumn<QString>("input");
        QTest::addColumn<QString>("expected");
        QTest::newRow("suffix") << "Nirvana (2)" << "Nirvana";
        QTest::newRow("plain") << "Miles Davis" << "Miles Davis";
        QTest::newRow("inner parens") << "The (International) Noise Conspiracy" << "The (International) Noise Conspiracy";
        QTest::newRow("word suffix") << "Prince (Live)" << "Prince (Live)";
    }

    void cleanArtistName()
    {
        QFETCH(QString, input);
        QFETCH(QString, expected);
        QCOMPARE(CatalogRelease::cleanArtistName(input), expected);
    }

    void parseReleaseId_data()
    {
        QTest::addColumn<QString>("input");
        QTest::addColumn<qint64>("expected");
        QTest::newRow("bare") << "8844291" << qint64(8844291);
        QTest::newRow("url") << "https://www.discogs.com/release/8844291-John-Coltrane-Blue-Train" << qint64(8844291);
        QTest::newRow("api url") << "https://api.discogs.com/releases/249504" << qint64(249504);
        QTest::newRow("master") << "https://www.discogs.com/master/12345" << qint64(0);
        QTest::newRow("zero") << "0" << qint64(0);
        QTest::newRow("empty") << "" << qint64(0);
        QTest::newRow("text") << "blue train" << qint64(0);
    }

    void parseReleaseId()
    {
        QFETCH(QString, input);
        QFETCH(qint64, expected);
        QCOMPARE(CatalogRelease::parseReleaseId(input), expected);
    }
};

QTEST_MAIN(tst_CatalogRelease)
#include "tst_CatalogRelease.moc"
