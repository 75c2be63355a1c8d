#include "backend/devices/DeviceDirectory.h"
#include <QDebug>

bool StaticDeviceDirectory::deviceIdsForUser(const QString& userId, QStringList* deviceIds, QString* errorMessage) {
    Q_UNUSED(errorMessage);
    m_lookupCount++;
    if (deviceIds) {
        *deviceIds = m_userDevices.contains(userId) ? m_userDevices.value(userId) : m_defaultDevices;
    }
    return true;
}

CachedDeviceDirectory::CachedDeviceDirectory(DeviceDirectory* source, int ttlMs)
    : m_source(source)
    , m_ttlMs(ttlMs > 0 ? ttlMs : DEFAULT_TTL_MS)
{
    m_monotonic.start();
    m_clock = [this]() { return m_monotonic.elapsed(); };
}

bool CachedDeviceDirectory::deviceIdsForUser(const QString& userId, QStringList* deviceIds, QString* errorMessage) {
    return lookup(userId, false, deviceIds, errorMessage);
}

bool CachedDeviceDirectory::lookup(const QString& userId, bool forceRefresh, QStringList* deviceIds, QString* errorMessage) {
    if (!m_source) {
        if (errorMessage) *errorMessage = "No device directory configured";
        return false;
    }

    const qint64 now = m_clock();
    auto it = m_entries.constFind(userId);
    if (!forceRefresh && it != m_entries.constEnd() && now - it->fetchedAt < m_ttlMs) {
        if (deviceIds) *deviceIds = it->deviceIds;
        return true;
    }

    QStringList fresh;
    QString error;
    if (!m_source->deviceIdsForUser(userId, &fresh, &error)) {
        qWarning() << "CachedDeviceDirectory: Lookup failed for user" << userId << ":" << error;
        if (errorMessage) *errorMessage = error;
        return false;
    }

    Entry entry;
    entry.deviceIds = fresh;
    entry.fetchedAt = now;
    m_entries.insert(userId, entry);

    if (deviceIds) *deviceIds = fresh;
    return true;
}

void CachedDeviceDirectory::setClock(Clock clock) {
    if (clock) {
        m_clock = std::move(clock);
    } else {
        m_clock = [this]() { return m_monotonic.elapsed(); };
    }
}
