#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <memory>

class QSettings;

struct FleetSettings {
    QString serverUrl;
    QString authToken;
    QString userId;
    int chunkSizeBytes = 0;
    int uploadResultTimeoutMs = 0;
    int commandResultTimeoutMs = 0;
    int timeoutScanIntervalMs = 0;
    int deviceCacheTtlMs = 0;
    QStringList devices;

    static FleetSettings defaults();
};

/**
 * SettingsManager
 * Loads and persists client configuration through QSettings.
 * Handles:
 * - Broker proxy URL and auth token
 * - Upload chunk size and result/command deadlines
 * - Static device list for the device directory
 *
 * Values that fail validation fall back to their defaults with a warning.
 */
class SettingsManager : public QObject {
    Q_OBJECT

public:
    // Native settings store (organisation FleetLink, application Client)
    explicit SettingsManager(QObject* parent = nullptr);
    // Explicit INI file, used by --config
    explicit SettingsManager(const QString& iniPath, QObject* parent = nullptr);
    ~SettingsManager() override = default;

    // Settings persistence
    void loadSettings();
    void saveSettings();

    const FleetSettings& settings() const { return m_settings; }
    QString iniPath() const { return m_iniPath; }

    // Getters
    QString getServerUrl() const { return m_settings.serverUrl; }
    QString getAuthToken() const { return m_settings.authToken; }
    QString getUserId() const { return m_settings.userId; }
    int getChunkSize() const { return m_settings.chunkSizeBytes; }
    int getUploadResultTimeout() const { return m_settings.uploadResultTimeoutMs; }
    int getCommandResultTimeout() const { return m_settings.commandResultTimeoutMs; }
    QStringList getDevices() const { return m_settings.devices; }

    // Setters (in memory; call saveSettings() to persist)
    bool setServerUrl(const QString& url);
    void setAuthToken(const QString& token);
    void setUserId(const QString& userId);
    bool setChunkSize(int bytes);
    bool setUploadResultTimeout(int timeoutMs);
    bool setCommandResultTimeout(int timeoutMs);
    void setDevices(const QStringList& devices);

    static bool isValidServerUrl(const QString& url);

signals:
    void settingsChanged();
    void serverUrlChanged(const QString& newUrl);

private:
    std::unique_ptr<QSettings> openStore() const;
    static int readPositiveInt(QSettings& store, const QString& key, int fallback);

    QString m_iniPath;
    FleetSettings m_settings;
};

#endif // SETTINGSMANAGER_H
