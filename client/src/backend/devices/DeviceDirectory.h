#ifndef DEVICEDIRECTORY_H
#define DEVICEDIRECTORY_H

#include <QString>
#include <QStringList>
#include <QHash>
#include <QElapsedTimer>
#include <functional>

/**
 * Answers "which devices belong to this user". The real answer lives in the
 * backend database; the client only consumes it through this interface.
 */
class DeviceDirectory {
public:
    virtual ~DeviceDirectory() = default;

    virtual bool deviceIdsForUser(const QString& userId, QStringList* deviceIds, QString* errorMessage = nullptr) = 0;

    // Drop any cached answer for the user (no-op for uncached directories)
    virtual void invalidate(const QString& userId) { Q_UNUSED(userId); }
};

// Fixed device list, typically the "devices" key from the settings file
class StaticDeviceDirectory : public DeviceDirectory {
public:
    StaticDeviceDirectory() = default;
    explicit StaticDeviceDirectory(const QStringList& devices) : m_defaultDevices(devices) {}

    void setDefaultDevices(const QStringList& devices) { m_defaultDevices = devices; }
    void setDevicesForUser(const QString& userId, const QStringList& devices) { m_userDevices.insert(userId, devices); }

    bool deviceIdsForUser(const QString& userId, QStringList* deviceIds, QString* errorMessage = nullptr) override;

    int lookupCount() const { return m_lookupCount; }

private:
    QStringList m_defaultDevices;
    QHash<QString, QStringList> m_userDevices;
    int m_lookupCount = 0;
};

/**
 * TTL cache in front of another directory. Failed lookups are not cached.
 */
class CachedDeviceDirectory : public DeviceDirectory {
public:
    using Clock = std::function<qint64()>;

    static constexpr int DEFAULT_TTL_MS = 60000;

    explicit CachedDeviceDirectory(DeviceDirectory* source, int ttlMs = DEFAULT_TTL_MS);

    bool deviceIdsForUser(const QString& userId, QStringList* deviceIds, QString* errorMessage = nullptr) override;
    void invalidate(const QString& userId) override { m_entries.remove(userId); }

    bool lookup(const QString& userId, bool forceRefresh, QStringList* deviceIds, QString* errorMessage = nullptr);
    void clear() { m_entries.clear(); }

    void setClock(Clock clock);
    int ttlMs() const { return m_ttlMs; }

private:
    struct Entry {
        QStringList deviceIds;
        qint64 fetchedAt = 0;
    };

    DeviceDirectory* m_source;
    int m_ttlMs;
    QHash<QString, Entry> m_entries;
    QElapsedTimer m_monotonic;
    Clock m_clock;
};

#endif // DEVICEDIRECTORY_H
