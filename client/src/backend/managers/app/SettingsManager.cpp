#include "backend/managers/app/SettingsManager.h"
#include <QSettings>
#include <QUrl>
#include <QDebug>

namespace {
    const QString DEFAULT_SERVER_URL = "ws://localhost:5000";
    constexpr int DEFAULT_CHUNK_SIZE = 32 * 1024;
    constexpr int DEFAULT_UPLOAD_RESULT_TIMEOUT_MS = 120000;
    constexpr int DEFAULT_COMMAND_RESULT_TIMEOUT_MS = 30000;
    constexpr int DEFAULT_TIMEOUT_SCAN_INTERVAL_MS = 250;
    constexpr int DEFAULT_DEVICE_CACHE_TTL_MS = 60000;
}

FleetSettings FleetSettings::defaults() {
    FleetSettings s;
    s.serverUrl = DEFAULT_SERVER_URL;
    s.chunkSizeBytes = DEFAULT_CHUNK_SIZE;
    s.uploadResultTimeoutMs = DEFAULT_UPLOAD_RESULT_TIMEOUT_MS;
    s.commandResultTimeoutMs = DEFAULT_COMMAND_RESULT_TIMEOUT_MS;
    s.timeoutScanIntervalMs = DEFAULT_TIMEOUT_SCAN_INTERVAL_MS;
    s.deviceCacheTtlMs = DEFAULT_DEVICE_CACHE_TTL_MS;
    return s;
}

SettingsManager::SettingsManager(QObject* parent)
    : QObject(parent)
    , m_settings(FleetSettings::defaults())
{
}

SettingsManager::SettingsManager(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_iniPath(iniPath)
    , m_settings(FleetSettings::defaults())
{
}

std::unique_ptr<QSettings> SettingsManager::openStore() const {
    if (!m_iniPath.isEmpty()) {
        return std::make_unique<QSettings>(m_iniPath, QSettings::IniFormat);
    }
    return std::make_unique<QSettings>("FleetLink", "Client");
}

int SettingsManager::readPositiveInt(QSettings& store, const QString& key, int fallback) {
    if (!store.contains(key)) return fallback;
    bool ok = false;
    const int value = store.value(key).toInt(&ok);
    if (!ok || value <= 0) {
        qWarning() << "SettingsManager: Invalid value for" << key << ":" << store.value(key).toString()
                   << "- using default" << fallback;
        return fallback;
    }
    return value;
}

void SettingsManager::loadSettings() {
    auto store = openStore();
    const FleetSettings defaults = FleetSettings::defaults();

    const QString url = store->value("serverUrl", defaults.serverUrl).toString().trimmed();
    if (isValidServerUrl(url)) {
        m_settings.serverUrl = url;
    } else {
        qWarning() << "SettingsManager: Invalid serverUrl" << url << "- using default" << defaults.serverUrl;
        m_settings.serverUrl = defaults.serverUrl;
    }

    m_settings.authToken = store->value("authToken").toString();
    m_settings.userId = store->value("userId").toString();
    m_settings.chunkSizeBytes = readPositiveInt(*store, "chunkSizeBytes", defaults.chunkSizeBytes);
    m_settings.uploadResultTimeoutMs = readPositiveInt(*store, "uploadResultTimeoutMs", defaults.uploadResultTimeoutMs);
    m_settings.commandResultTimeoutMs = readPositiveInt(*store, "commandResultTimeoutMs", defaults.commandResultTimeoutMs);
    m_settings.timeoutScanIntervalMs = readPositiveInt(*store, "timeoutScanIntervalMs", defaults.timeoutScanIntervalMs);
    m_settings.deviceCacheTtlMs = readPositiveInt(*store, "deviceCacheTtlMs", defaults.deviceCacheTtlMs);

    // INI lists arrive as "a, b, c"; entries may carry stray whitespace
    QStringList devices;
    const QStringList rawDevices = store->value("devices").toStringList();
    for (const QString& device : rawDevices) {
        const QString trimmed = device.trimmed();
        if (!trimmed.isEmpty() && !devices.contains(trimmed)) devices.append(trimmed);
    }
    m_settings.devices = devices;

    qDebug() << "SettingsManager: Settings loaded - URL:" << m_settings.serverUrl
             << "chunk:" << m_settings.chunkSizeBytes
             << "devices:" << m_settings.devices.size();
}

void SettingsManager::saveSettings() {
    auto store = openStore();
    store->setValue("serverUrl", m_settings.serverUrl.isEmpty() ? DEFAULT_SERVER_URL : m_settings.serverUrl);
    store->setValue("authToken", m_settings.authToken);
    store->setValue("userId", m_settings.userId);
    store->setValue("chunkSizeBytes", m_settings.chunkSizeBytes);
    store->setValue("uploadResultTimeoutMs", m_settings.uploadResultTimeoutMs);
    store->setValue("commandResultTimeoutMs", m_settings.commandResultTimeoutMs);
    store->setValue("timeoutScanIntervalMs", m_settings.timeoutScanIntervalMs);
    store->setValue("deviceCacheTtlMs", m_settings.deviceCacheTtlMs);
    store->setValue("devices", m_settings.devices);
    store->sync();

    if (store->status() != QSettings::NoError) {
        qWarning() << "SettingsManager: Failed to write settings, status" << store->status();
        return;
    }
    qDebug() << "SettingsManager: Settings saved";
    emit settingsChanged();
}

bool SettingsManager::isValidServerUrl(const QString& url) {
    const QUrl parsed(url);
    if (!parsed.isValid() || parsed.host().isEmpty()) return false;
    const QString scheme = parsed.scheme().toLower();
    return scheme == "ws" || scheme == "wss";
}

bool SettingsManager::setServerUrl(const QString& url) {
    const QString trimmed = url.trimmed();
    if (!isValidServerUrl(trimmed)) {
        qWarning() << "SettingsManager: Rejecting server URL" << url;
        return false;
    }
    if (m_settings.serverUrl != trimmed) {
        m_settings.serverUrl = trimmed;
        emit serverUrlChanged(trimmed);
    }
    return true;
}

void SettingsManager::setAuthToken(const QString& token) {
    m_settings.authToken = token;
}

void SettingsManager::setUserId(const QString& userId) {
    m_settings.userId = userId;
}

bool SettingsManager::setChunkSize(int bytes) {
    if (bytes <= 0) {
        qWarning() << "SettingsManager: Rejecting chunk size" << bytes;
        return false;
    }
    m_settings.chunkSizeBytes = bytes;
    return true;
}

bool SettingsManager::setUploadResultTimeout(int timeoutMs) {
    if (timeoutMs <= 0) {
        qWarning() << "SettingsManager: Rejecting upload result timeout" << timeoutMs;
        return false;
    }
    m_settings.uploadResultTimeoutMs = timeoutMs;
    return true;
}

bool SettingsManager::setCommandResultTimeout(int timeoutMs) {
    if (timeoutMs <= 0) {
        qWarning() << "SettingsManager: Rejecting command result timeout" << timeoutMs;
        return false;
    }
    m_settings.commandResultTimeoutMs = timeoutMs;
    return true;
}

void SettingsManager::setDevices(const QStringList& devices) {
    m_settings.devices = devices;
}
