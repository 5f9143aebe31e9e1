#include "settingsmanager.h"
#include <QDebug>

SettingsManager* SettingsManager::s_instance = nullptr;

SettingsManager::SettingsManager(QObject *parent)
    : QObject(parent)
    , m_settings("vinylscrobbler", "vinylscrobbler")
    , m_scrobblingEnabled(true)
    , m_durationLookupEnabled(true)
    , m_networkTimeoutMs(15000)
    , m_shutdownTimeoutMs(2000)
{
    loadSettings();
}

SettingsManager::~SettingsManager()
{
    qDebug() << "[SettingsManager::~SettingsManager] Destructor called, saving settings...";
    saveSettings();
    s_instance = nullptr;
}

SettingsManager* SettingsManager::instance()
{
    if (!s_instance) {
        s_instance = new SettingsManager();
    }
    return s_instance;
}

QStringList SettingsManager::missingLastFmFields() const
{
    QStringList missing;
    if (m_lastFmApiKey.isEmpty()) {
        missing << "apiKey";
    }
    if (m_lastFmApiSecret.isEmpty()) {
        missing << "apiSecret";
    }
    if (m_lastFmSessionKey.isEmpty()) {
        if (m_lastFmUsername.isEmpty()) {
            missing << "username";
        }
        if (m_lastFmPasswordHash.isEmpty()) {
            missing << "passwordHash";
        }
    }
    return missing;
}

void SettingsManager::setLastFmSessionKey(const QString& sessionKey)
{
    if (m_lastFmSessionKey != sessionKey) {
        m_lastFmSessionKey = sessionKey;
        m_lastFmSessionUsername = sessionKey.isEmpty() ? QString() : m_lastFmUsername;
        emit lastFmSessionKeyChanged(sessionKey);
        saveSettings();
    }
}

void SettingsManager::setScrobblingEnabled(bool enabled)
{
    if (m_scrobblingEnabled != enabled) {
        m_scrobblingEnabled = enabled;
        emit scrobblingEnabledChanged(enabled);
        saveSettings();
    }
}

void SettingsManager::setDurationLookupEnabled(bool enabled)
{
    if (m_durationLookupEnabled != enabled) {
        m_durationLookupEnabled = enabled;
        emit durationLookupEnabledChanged(enabled);
        saveSettings();
    }
}

void SettingsManager::loadSettings()
{
    m_settings.beginGroup("LastFm");
    m_lastFmApiKey = m_settings.value("apiKey", "").toString().trimmed();
    m_lastFmApiSecret = m_settings.value("apiSecret", "").toString().trimmed();
    m_lastFmUsername = m_settings.value("username", "").toString().trimmed();
    m_lastFmPasswordHash = m_settings.value("passwordHash", "").toString().trimmed();
    m_lastFmSessionKey = m_settings.value("sessionKey", "").toString().trimmed();
    m_lastFmSessionUsername = m_settings.value("sessionUsername", "").toString().trimmed();
    m_settings.endGroup();

    // A session belongs to the account it was opened for
    if (!m_lastFmSessionKey.isEmpty() && !m_lastFmSessionUsername.isEmpty()
            && m_lastFmSessionUsername != m_lastFmUsername) {
        qDebug() << "[SettingsManager::loadSettings] Username changed, dropping cached session";
        m_lastFmSessionKey.clear();
        m_lastFmSessionUsername.clear();
    }

    m_settings.beginGroup("Scrobbling");
    m_scrobblingEnabled = m_settings.value("enabled", true).toBool();
    m_durationLookupEnabled = m_settings.value("durationLookupEnabled", true).toBool();
    m_settings.endGroup();

    m_settings.beginGroup("Network");
    m_networkTimeoutMs = m_settings.value("timeoutMs", 15000).toInt();
    // Ensure the timeout leaves room for a slow round trip
    if (m_networkTimeoutMs < 1000) {
        m_networkTimeoutMs = 15000;
    }
    m_shutdownTimeoutMs = qMax(m_settings.value("shutdownTimeoutMs", 2000).toInt(), 0);
    m_settings.endGroup();

    qDebug() << "[SettingsManager::loadSettings] Loaded from" << m_settings.fileName();
}

void SettingsManager::saveSettings()
{
    m_settings.beginGroup("LastFm");
    m_settings.setValue("apiKey", m_lastFmApiKey);
    m_settings.setValue("apiSecret", m_lastFmApiSecret);
    m_settings.setValue("username", m_lastFmUsername);
    m_settings.setValue("passwordHash", m_lastFmPasswordHash);
    m_settings.setValue("sessionKey", m_lastFmSessionKey);
    m_settings.setValue("sessionUsername", m_lastFmSessionUsername);
    m_settings.endGroup();

    m_settings.beginGroup("Scrobbling");
    m_settings.setValue("enabled", m_scrobblingEnabled);
    m_settings.setValue("durationLookupEnabled", m_durationLookupEnabled);
    m_settings.endGroup();

    m_settings.beginGroup("Network");
    m_settings.setValue("timeoutMs", m_networkTimeoutMs);
    m_settings.setValue("shutdownTimeoutMs", m_shutdownTimeoutMs);
    m_settings.endGroup();

    m_settings.sync();
}
