#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QSettings>
#include <QStandardPaths>
#include "backend/settings/settingsmanager.h"

// Replaces the singleton so the next instance() reads the file again
static SettingsManager *reload()
{
    delete SettingsManager::instance();
    return SettingsManager::instance();
}

static void writeLastFm(const QString &key, const QVariant &value)
{
    QSettings settings("vinylscrobbler", "vinylscrobbler");
    settings.beginGroup("LastFm");
    settings.setValue(key, value);
    settings.endGroup();
    settings.sync();
}

class tst_SettingsManager : public QObject {
    Q_OBJECT

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        QFile::remove(QSettings("vinylscrobbler", "vinylscrobbler").fileName());
    }

    void cleanupTestCase()
    {
        delete SettingsManager::instance();
        QFile::remove(QSettings("vinylscrobbler", "vinylscrobbler").fileName());
    }

    void defaults()
    {
        SettingsManager *settings = SettingsManager::instance();
        QVERIFY(settings->scrobblingEnabled());
        QVERIFY(settings->durationLookupEnabled());
        QCOMPARE(settings->networkTimeoutMs(), 15000);
        QCOMPARE(settings->shutdownTimeoutMs(), 2000);
        QCOMPARE(settings->missingLastFmFields(),
                 QStringList() << "apiKey" << "apiSecret" << "username" << "passwordHash");
    }

    void setScrobblingEnabled_notifiesOnceAndPersists()
    {
        SettingsManager *settings = SettingsManager::instance();
        QSignalSpy spy(settings, &SettingsManager::scrobblingEnabledChanged);

        settings->setScrobblingEnabled(false);
        settings->setScrobblingEnabled(false);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.first().first().toBool(), false);

        QSettings stored("vinylscrobbler", "vinylscrobbler");
        QCOMPARE(stored.value("Scrobbling/enabled").toBool(), false);

        QVERIFY(!reload()->scrobblingEnabled());
        SettingsManager::instance()->setScrobblingEnabled(true);
    }

    void setDurationLookupEnabled_notifies()
    {
        SettingsManager *settings = SettingsManager::instance();
        QSignalSpy spy(settings, &SettingsManager::durationLookupEnabledChanged);
        settings->setDurationLookupEnabled(false);
        settings->setDurationLookupEnabled(true);
        QCOMPARE(spy.count(), 2);
        QVERIFY(settings->durationLookupEnabled());
    }

    void sessionKey_standsInForAccount()
    {
        SettingsManager *settings = SettingsManager::instance();
        settings->setLastFmSessionKey("cached-session");
        QCOMPARE(settings->missingLastFmFields(), QStringList() << "apiKey" << "apiSecret");
        settings->setLastFmSessionKey(QString());
    }

    void sessionKey_keptForSameUsername()
    {
        delete SettingsManager::instance();
        writeLastFm("username", "alice");
        writeLastFm("sessionKey", "alice-session");
        writeLastFm("sessionUsername", "alice");

        QCOMPARE(SettingsManager::instance()->lastFmSessionKey(), QStringLiteral("alice-session"));
    }

    void sessionKey_droppedWhenUsernameChanges()
    {
        delete SettingsManager::instance();
        writeLastFm("username", "bob");
        writeLastFm("sessionKey", "alice-session");
        writeLastFm("sessionUsername", "alice");

        SettingsManager *settings = SettingsManager::instance();
        QVERIFY(settings->lastFmSessionKey().isEmpty());
        QVERIFY(settings->missingLastFmFields().contains("passwordHash"));
    }

    void sessionKey_recordsUsernameItWasOpenedFor()
    {
        delete SettingsManager::instance();
        writeLastFm("username", "carol");
        writeLastFm("sessionKey", QString());
        writeLastFm("sessionUsername", QString());

        SettingsManager::instance()->setLastFmSessionKey("carol-session");
        QSettings stored("vinylscrobbler", "vinylscrobbler");
        QCOMPARE(stored.value("LastFm/sessionUsername").toString(), QStringLiteral("carol"));
    }
};

QTEST_MAIN(tst_SettingsManager)
#include "tst_SettingsManager.moc"
