#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QStringList>

class SettingsManager : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString lastFmApiKey READ lastFmApiKey CONSTANT)
    Q_PROPERTY(QString lastFmApiSecret READ lastFmApiSecret CONSTANT)
    Q_PROPERTY(QString lastFmUsername READ lastFmUsername CONSTANT)
    Q_PROPERTY(QString lastFmPasswordHash READ lastFmPasswordHash CONSTANT)
    Q_PROPERTY(QString lastFmSessionKey READ lastFmSessionKey WRITE setLastFmSessionKey NOTIFY lastFmSessionKeyChanged)
    Q_PROPERTY(bool scrobblingEnabled READ scrobblingEnabled WRITE setScrobblingEnabled NOTIFY scrobblingEnabledChanged)
    Q_PROPERTY(bool durationLookupEnabled READ durationLookupEnabled WRITE setDurationLookupEnabled NOTIFY durationLookupEnabledChanged)
    Q_PROPERTY(int networkTimeoutMs READ networkTimeoutMs CONSTANT)
    Q_PROPERTY(int shutdownTimeoutMs READ shutdownTimeoutMs CONSTANT)

public:
    static SettingsManager* instance();
    ~SettingsManager();

    // Getters
    QString lastFmApiKey() const { return m_lastFmApiKey; }
    QString lastFmApiSecret() const { return m_lastFmApiSecret; }
    QString lastFmUsername() const { return m_lastFmUsername; }
    QString lastFmPasswordHash() const { return m_lastFmPasswordHash; }
    QString lastFmSessionKey() const { return m_lastFmSessionKey; }
    bool scrobblingEnabled() const { return m_scrobblingEnabled; }
    bool durationLookupEnabled() const { return m_durationLookupEnabled; }
    int networkTimeoutMs() const { return m_networkTimeoutMs; }
    int shutdownTimeoutMs() const { return m_shutdownTimeoutMs; }

    // Names of the Last.fm settings that still need a value. A cached
    // session key stands in for the username and password hash.
    QStringList missingLastFmFields() const;
    QString fileName() const { return m_settings.fileName(); }

    // Credentials and timeouts are edited in the settings file; only the
    // session key and the toggles change while running
    void setLastFmSessionKey(const QString& sessionKey);
    void setScrobblingEnabled(bool enabled);
    void setDurationLookupEnabled(bool enabled);

signals:
    void lastFmSessionKeyChanged(const QString& sessionKey);
    void scrobblingEnabledChanged(bool enabled);
    void durationLookupEnabledChanged(bool enabled);

private:
    explicit SettingsManager(QObject *parent = nullptr);

    void loadSettings();
    void saveSettings();

    static SettingsManager* s_instance;
    QSettings m_settings;

    // Settings values
    QString m_lastFmApiKey;
    QString m_lastFmApiSecret;
    QString m_lastFmUsername;
    QString m_lastFmPasswordHash;
    QString m_lastFmSessionKey;
    QString m_lastFmSessionUsername;
    bool m_scrobblingEnabled;
    bool m_durationLookupEnabled;
    int m_networkTimeoutMs;
    int m_shutdownTimeoutMs;
};

#endif // SETTINGSMANAGER_H
